#pragma once

/**
 * @file bar_graph.h
 * @brief Staggered bar chart of activity per hour
 */

#include <reel/element.h>
#include <vector>

namespace reel::productivity {

/// @brief Resolved layout of one bar
struct Bar {
    int index = 0;
    float height = 0.0f;          ///< Eased growth in [0, 1]
    float fill = 0.0f;            ///< value / max, 0 when max is 0
    bool mostProductive = false;  ///< value == max and max > 0
};

/**
 * @brief Bar chart whose bars grow one after another
 *
 * Bar i grows with power2.out from frame barDelay + i * barStagger over
 * barDuration frames.
 *
 * @par Example
 * @code
 * BarGraph graph;
 * graph.data(mockProductivityData());
 * graph.validate();
 * Bar peak = graph.bar(10, 120);
 * @endcode
 */
class BarGraph : public Element {
public:
    // -------------------------------------------------------------------------
    /// @name Parameters (public for direct access)
    /// @{

    Param<int> barDelay{"barDelay", 30, 0, 10000};
    Param<int> barStagger{"barStagger", 2, 0, 100};
    Param<int> barDuration{"barDuration", 60, 1, 10000};

    /// @}
    // -------------------------------------------------------------------------

    BarGraph();

    /// @brief Set the value of each bar
    BarGraph& data(std::vector<float> values);
    const std::vector<float>& data() const { return m_values; }

    std::string name() const override { return "BarGraph"; }

    /// @throw ConfigurationError for empty, negative or non-finite data
    void validate() override;

    ElementState evaluate(const Context& ctx) const override;

    /// @brief Layout of bar i at a frame
    Bar bar(int index, Frame frame) const;

    int barCount() const { return static_cast<int>(m_values.size()); }

    float maxValue() const { return m_max; }

private:
    std::vector<float> m_values;
    float m_max = 0.0f;
};

} // namespace reel::productivity
