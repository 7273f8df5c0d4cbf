#include <reel/productivity/stars_given.h>
#include <reel/productivity/data.h>
#include <reel/interpolate.h>
#include <reel/scene.h>
#include <stdexcept>

namespace reel::productivity {

StarsGiven::StarsGiven(int fps)
    : m_fps(fps),
      m_zoom(SpringConfig::smooth(150, 45.0f), SpringConfig::smooth(300, 45.0f), fps) {
    registerParam(starsGiven);
    registerParam(textDelay);
    registerParam(textDuration);
    registerParam(fadeOutStart);
    registerParam(fadeOutEnd);
    registerParam(whooshFrame);
}

StarsGiven& StarsGiven::zoom(SpringConfig entry, SpringConfig exit) {
    m_zoom = Transition(std::move(entry), std::move(exit), m_fps);
    return *this;
}

StarsGiven& StarsGiven::followTransition(std::string sceneId) {
    m_followedScene = std::move(sceneId);
    return *this;
}

float StarsGiven::zoomProgress(const Context& ctx) const {
    if (m_followedScene.empty()) {
        return m_zoom.value(ctx);
    }
    if (!ctx.scenes()) {
        throw std::runtime_error("StarsGiven follows scene '" + m_followedScene +
                                 "' but was evaluated outside a composition");
    }
    return ctx.scenes()->transitionValue(m_followedScene, ctx.globalFrame());
}

StarsGiven& StarsGiven::hits(std::vector<Frame> frames) {
    m_hits = EventTrack(std::move(frames));
    return *this;
}

void StarsGiven::validate() {
    if (fadeOutEnd <= fadeOutStart) {
        throw ConfigurationError("StarsGiven fadeOutEnd (" + std::to_string(fadeOutEnd.get()) +
                                 ") must be after fadeOutStart (" + std::to_string(fadeOutStart.get()) + ")");
    }
}

ElementState StarsGiven::evaluate(const Context& ctx) const {
    const Frame f = ctx.frame();
    const float frame = static_cast<float>(f);
    const float z = zoomProgress(ctx);

    float fadeOut = interpolate(frame, {float(fadeOutStart), float(fadeOutEnd)}, {1.0f, 0.0f},
                                Extrapolation::clamped());
    float background = interpolate(frame, {0.0f, 10.0f}, {0.0f, 1.0f}, Extrapolation::clamped());
    float text = tween(f, textDelay, textDuration, Ease::Power2Out);

    ElementState state;
    state.id = "stars";
    state.value = z;
    state.opacity = 1.0f - 0.7f * z;
    state.transform.translate(270.0f * z, -270.0f * z).scale(1.0f + 0.5f * z);

    ElementState bg;
    bg.id = "background";
    bg.assetId = "stars-background";
    bg.opacity = background * fadeOut;
    state.children.push_back(std::move(bg));

    ElementState title;
    title.id = "title";
    title.label = "Stars Given";

    ElementState count;
    count.id = "count";
    count.label = std::to_string(starsGiven.get());

    ElementState icon;
    icon.id = "icon";
    icon.label = "⭐";

    ElementState label;
    label.id = "text";
    label.opacity = text * fadeOut;
    label.transform.scale(0.5f + 0.5f * text);

    if (!m_hits.empty()) {
        // Count up one star per hit and flash on each impact
        count.value = static_cast<float>(m_hits.countBefore(f + 1));
        float distance = static_cast<float>(*m_hits.distanceToNearest(f));

        ElementState flash;
        flash.id = "flash";
        flash.opacity = 1.0f - interpolate(distance, {0.0f, 2.0f}, {0.0f, 1.0f}, Extrapolation::clamped());
        label.children.push_back(std::move(flash));
    } else {
        count.value = static_cast<float>(starsGiven.get());
    }

    label.children.push_back(std::move(title));
    label.children.push_back(std::move(count));
    label.children.push_back(std::move(icon));
    state.children.push_back(std::move(label));
    return state;
}

CueSheet StarsGiven::cues() const {
    return CueSheet(std::vector<Cue>{
        Cue{whooshFrame, "stars.whoosh", AUDIO_STARS_WHOOSH, VOLUME_STARS_WHOOSH}
    });
}

} // namespace reel::productivity
