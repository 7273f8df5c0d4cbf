#include <reel/productivity/productivity.h>
#include <reel/productivity/data.h>

namespace reel::productivity {

namespace {

WheelConfig weekdayWheelConfig() {
    WheelConfig config;
    config.values = weekdayNames();
    config.radius = 130.0f;
    config.delay = 60;
    return config;
}

WheelConfig hourWheelConfig() {
    WheelConfig config;
    config.values = hourValues();
    config.radius = 300.0f;
    config.delay = 70;
    config.labelFormatter = hourLabelFormatter();
    return config;
}

} // namespace

Productivity::Productivity()
    : m_weekday("weekday", "Most productive day", weekdayWheelConfig()),
      m_hour("hour", "Most productive time", hourWheelConfig()) {
    registerParam(weekday);
    registerParam(hour);
    registerParam(barsSoundFrame);

    m_weekday.soundFrame = 45;
    m_hour.soundFrame = 70;
    m_graph.data(mockProductivityData());
}

Productivity& Productivity::graphData(std::vector<float> perHour) {
    m_graph.data(std::move(perHour));
    return *this;
}

void Productivity::validate() {
    m_weekday.value = weekday.get();
    m_hour.value = hour.get();
    m_weekday.validate();
    m_hour.validate();
    m_graph.validate();
}

ElementState Productivity::evaluate(const Context& ctx) const {
    ElementState state;
    state.id = "productivity";
    state.children.push_back(m_weekday.evaluate(ctx));
    state.children.push_back(m_hour.evaluate(ctx));
    state.children.push_back(m_graph.evaluate(ctx));
    return state;
}

CueSheet Productivity::cues() const {
    CueSheet bars(std::vector<Cue>{
        Cue{barsSoundFrame, "bars.animate", AUDIO_BARS_ANIMATE, VOLUME_BARS_ANIMATE}
    });
    return bars.merged(m_weekday.cues()).merged(m_hour.cues());
}

} // namespace reel::productivity
