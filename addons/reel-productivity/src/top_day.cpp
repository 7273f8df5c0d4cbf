#include <reel/productivity/top_day.h>
#include <reel/productivity/data.h>
#include <stdexcept>

namespace reel::productivity {

TopDay::TopDay(std::string key, std::string heading, WheelConfig config)
    : m_key(std::move(key)), m_heading(std::move(heading)), m_config(std::move(config)) {
    value = m_config.selectedValue;
    registerParam(value);
    registerParam(soundFrame);
}

void TopDay::validate() {
    WheelConfig config = m_config;
    config.selectedValue = value;
    m_wheel.emplace(std::move(config));
}

const Wheel& TopDay::wheel() const {
    if (!m_wheel) {
        throw std::runtime_error("TopDay '" + m_key + "' used before validate()");
    }
    return *m_wheel;
}

ElementState TopDay::evaluate(const Context& ctx) const {
    const Wheel& w = wheel();

    ElementState state;
    state.id = m_key;

    ElementState heading;
    heading.id = "heading";
    heading.label = m_heading;
    state.children.push_back(std::move(heading));

    ElementState spinner;
    spinner.id = "wheel";
    spinner.transform.perspective(w.config().perspective);
    spinner.value = w.rotationProgress(ctx.frame());

    for (const WheelItem& item : w.items(ctx)) {
        ElementState text;
        text.id = "label";
        text.label = w.label(item.value);
        text.transform = wheelLabelTransform(item);

        ElementState slot;
        slot.id = "item." + std::to_string(item.index);
        slot.transform = wheelItemTransform(item);
        slot.opacity = item.opacity;
        slot.visible = item.facingViewer;
        slot.value = static_cast<float>(item.value);
        slot.children.push_back(std::move(text));
        spinner.children.push_back(std::move(slot));
    }
    state.children.push_back(std::move(spinner));
    return state;
}

CueSheet TopDay::cues() const {
    return CueSheet(std::vector<Cue>{
        Cue{soundFrame, "wheel." + m_key + ".spin", AUDIO_WHEEL_SPIN, VOLUME_WHEEL_SPIN},
        Cue{wheel().settleFrame(), "wheel." + m_key + ".settle", "", 1.0f},
    });
}

} // namespace reel::productivity
