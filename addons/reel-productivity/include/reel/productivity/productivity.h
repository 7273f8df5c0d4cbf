#pragma once

/**
 * @file productivity.h
 * @brief Weekday wheel, hour wheel and hourly bar graph
 */

#include <reel/productivity/bar_graph.h>
#include <reel/productivity/top_day.h>

namespace reel::productivity {

/**
 * @brief Productivity panel shown on the tablet screen
 *
 * Children, top to bottom:
 * - "weekday": wheel of weekday names, radius 130, spins from frame 60
 * - "hour": wheel of hours with "2 pm" style labels, radius 300, spins from frame 70
 * - "graph": one bar per hour, growing from frame 30
 */
class Productivity : public Element {
public:
    // -------------------------------------------------------------------------
    /// @name Parameters (public for direct access)
    /// @{

    Param<int> weekday{"weekday", 3, 0, 6};
    Param<int> hour{"hour", 14, 0, 23};
    Param<int> barsSoundFrame{"barsSoundFrame", 30, 0, 100000};

    /// @}
    // -------------------------------------------------------------------------

    Productivity();

    /// @brief Activity per hour for the bar graph
    Productivity& graphData(std::vector<float> perHour);

    std::string name() const override { return "Productivity"; }

    void validate() override;
    ElementState evaluate(const Context& ctx) const override;
    CueSheet cues() const override;

    /// @name Children
    /// @{
    TopDay& weekdayWheel() { return m_weekday; }
    const TopDay& weekdayWheel() const { return m_weekday; }
    TopDay& hourWheel() { return m_hour; }
    const TopDay& hourWheel() const { return m_hour; }
    BarGraph& graph() { return m_graph; }
    const BarGraph& graph() const { return m_graph; }
    /// @}

private:
    TopDay m_weekday;
    TopDay m_hour;
    BarGraph m_graph;
};

} // namespace reel::productivity
