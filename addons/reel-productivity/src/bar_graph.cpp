#include <reel/productivity/bar_graph.h>
#include <reel/interpolate.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace reel::productivity {

BarGraph::BarGraph() {
    registerParam(barDelay);
    registerParam(barStagger);
    registerParam(barDuration);
}

BarGraph& BarGraph::data(std::vector<float> values) {
    m_values = std::move(values);
    m_max = 0.0f;
    for (float v : m_values) {
        m_max = std::max(m_max, v);
    }
    return *this;
}

void BarGraph::validate() {
    if (m_values.empty()) {
        throw ConfigurationError("BarGraph needs at least one value");
    }
    for (size_t i = 0; i < m_values.size(); ++i) {
        if (!std::isfinite(m_values[i]) || m_values[i] < 0.0f) {
            throw ConfigurationError("BarGraph value " + std::to_string(i) +
                                     " must be finite and non-negative");
        }
    }
}

Bar BarGraph::bar(int index, Frame frame) const {
    if (index < 0 || index >= barCount()) {
        throw std::out_of_range("BarGraph index " + std::to_string(index) + " out of range");
    }

    Bar b;
    b.index = index;
    Frame start = barDelay + index * barStagger;
    b.height = tween(frame, start, barDuration, Ease::Power2Out);

    // All-zero data draws empty bars with nothing highlighted
    if (m_max > 0.0f) {
        b.fill = m_values[index] / m_max;
        b.mostProductive = m_values[index] == m_max;
    }
    return b;
}

ElementState BarGraph::evaluate(const Context& ctx) const {
    ElementState state;
    state.id = "graph";
    state.children.reserve(m_values.size());

    for (int i = 0; i < barCount(); ++i) {
        Bar b = bar(i, ctx.frame());

        ElementState fill;
        fill.id = "fill";
        fill.value = b.fill;
        fill.assetId = b.mostProductive ? "bar-peak" : "bar";

        ElementState hour;
        hour.id = "hour";
        hour.label = std::to_string(i);

        ElementState column;
        column.id = "bar." + std::to_string(i);
        column.value = b.height;
        column.children.push_back(std::move(fill));
        column.children.push_back(std::move(hour));
        state.children.push_back(std::move(column));
    }
    return state;
}

} // namespace reel::productivity
