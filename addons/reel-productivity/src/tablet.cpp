#include <reel/productivity/tablet.h>
#include <reel/productivity/data.h>
#include <reel/interpolate.h>
#include <stdexcept>

namespace reel::productivity {

Tablet::Tablet(OpposingTransformConfig zoom)
    : m_zoomConfig(zoom) {
    registerParam(fullscreenAmount);
    registerParam(enterDelay);
    registerParam(enterDuration);
    registerParam(sceneLength);
    registerParam(hideDuration);
    registerParam(slideDistance);
    registerParam(canvasHeight);
}

void Tablet::validate() {
    if (sceneLength < enterDelay + enterDuration) {
        throw ConfigurationError("Tablet sceneLength must not end before the entry animation");
    }

    // The device pivots around its bottom-left corner
    OpposingTransformConfig config = m_zoomConfig;
    config.frameOrigin = glm::vec3(0.0f, canvasHeight.get(), 0.0f);
    m_zoom.emplace(config);

    m_productivity.validate();
}

const OpposingTransform& Tablet::zoom() const {
    if (!m_zoom) {
        throw std::runtime_error("Tablet used before validate()");
    }
    return *m_zoom;
}

float Tablet::entryProgress(Frame frame) const {
    return tween(frame, enterDelay, enterDuration, Ease::Power2Out);
}

float Tablet::exitProgress(Frame frame) const {
    return tween(frame, sceneLength, hideDuration, Ease::Power2Out);
}

float Tablet::toFullscreen(Frame frame) const {
    return fullscreenAmount * (entryProgress(frame) - exitProgress(frame));
}

ElementState Tablet::evaluate(const Context& ctx) const {
    const OpposingTransform& z = zoom();
    Frame f = ctx.frame();
    float p = toFullscreen(f);

    ElementState state;
    state.id = "tablet";
    state.value = p;
    state.transform.translateY(slideDistance - entryProgress(f) * slideDistance);

    ElementState device;
    device.id = "device";
    device.assetId = "tablet.svg";
    device.transform.translateY(100.0f);

    ElementState frame;
    frame.id = "frame";
    frame.transform = z.frame(p);
    frame.children.push_back(std::move(device));

    ElementState screen;
    screen.id = "screen";
    screen.transform = z.content(p);
    screen.children.push_back(m_productivity.evaluate(ctx));

    state.children.push_back(std::move(frame));
    state.children.push_back(std::move(screen));
    return state;
}

CueSheet Tablet::cues() const {
    CueSheet entry(std::vector<Cue>{
        Cue{0, "tablet.enter", AUDIO_TABLET_ENTRY, VOLUME_TABLET_ENTRY}
    });
    return entry.merged(m_productivity.cues());
}

} // namespace reel::productivity
