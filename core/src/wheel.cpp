#include <reel/wheel.h>
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace reel {

namespace {

void requireItemCount(int totalItems) {
    if (totalItems <= 0) {
        throw ConfigurationError("wheel totalItems must be positive, got " + std::to_string(totalItems));
    }
}

void requireSelected(int selectedValue, int totalItems) {
    if (selectedValue < 0 || selectedValue >= totalItems) {
        throw ConfigurationError("wheel selectedValue " + std::to_string(selectedValue) +
                                 " is outside [0, " + std::to_string(totalItems) + ")");
    }
}

WheelItem layoutItem(int index, int totalItems, float rotationOffset, float radius, int selectedValue,
                     bool settled, float selectedOpacity, float idleOpacity) {
    if (index < 0 || index >= totalItems) {
        throw ConfigurationError("wheel index " + std::to_string(index) +
                                 " is outside [0, " + std::to_string(totalItems) + ")");
    }

    WheelItem item;
    item.index = index;
    item.angularOffset = static_cast<float>(index) / static_cast<float>(totalItems) + rotationOffset;
    item.angle = item.angularOffset * -glm::two_pi<float>();
    item.depthZ = std::cos(item.angle) * radius;
    item.verticalY = std::sin(item.angle) * radius;
    item.value = (index + selectedValue) % totalItems;
    item.isSelected = settled && item.value == selectedValue;
    item.facingViewer = std::cos(item.angle) >= 0.0f;
    item.opacity = item.isSelected ? selectedOpacity : idleOpacity;
    return item;
}

} // namespace

float wheelRotationOffset(float rotationProgress, Ease curve) {
    return 1.0f - ease(curve, std::clamp(rotationProgress, 0.0f, 1.0f));
}

WheelItem wheelItem(int index, int totalItems, float rotationProgress, float radius, int selectedValue) {
    return wheelItem(index, totalItems, rotationProgress, radius, selectedValue, rotationProgress >= 1.0f);
}

WheelItem wheelItem(int index, int totalItems, float rotationProgress, float radius, int selectedValue,
                    bool settled) {
    requireItemCount(totalItems);
    requireSelected(selectedValue, totalItems);
    requireFinite(radius, "wheel radius");
    return layoutItem(index, totalItems, wheelRotationOffset(rotationProgress), radius, selectedValue,
                      settled, WHEEL_SELECTED_OPACITY, WHEEL_IDLE_OPACITY);
}

TransformState wheelItemTransform(const WheelItem& item) {
    TransformState t;
    t.translateZ(item.depthZ).translateY(item.verticalY).rotateX(glm::degrees(item.angle));
    return t;
}

TransformState wheelLabelTransform(const WheelItem& item) {
    return counterRotation(wheelItemTransform(item));
}

std::string formatHour(int hour) {
    if (hour == 0) return "12 am";
    if (hour == 12) return "12 pm";
    if (hour > 12) return std::to_string(hour - 12) + " pm";
    return std::to_string(hour) + " am";
}

LabelFormatter hourLabelFormatter() {
    return [](const std::string& value) {
        size_t used = 0;
        int hour = 0;
        try {
            hour = std::stoi(value, &used);
        } catch (const std::logic_error&) {
            throw ConfigurationError("hour label expects a number, got '" + value + "'");
        }
        if (used != value.size()) {
            throw ConfigurationError("hour label expects a number, got '" + value + "'");
        }
        if (hour < 0 || hour > 23) {
            throw ConfigurationError("hour label expects 0 to 23, got " + value);
        }
        return formatHour(hour);
    };
}

// =============================================================================
// WheelConfig / Wheel
// =============================================================================

void WheelConfig::validate() const {
    requireItemCount(static_cast<int>(values.size()));
    requireSelected(selectedValue, static_cast<int>(values.size()));
    requireFinite(radius, "wheel radius");
    requireFinite(selectedOpacity, "wheel selectedOpacity");
    requireFinite(idleOpacity, "wheel idleOpacity");
    requireFinite(perspective, "wheel perspective");
    if (radius <= 0.0f) {
        throw ConfigurationError("wheel radius must be positive, got " + std::to_string(radius));
    }
    if (spinFrames <= 0) {
        throw ConfigurationError("wheel spinFrames must be positive, got " + std::to_string(spinFrames));
    }
    if (settleFrames < 0) {
        throw ConfigurationError("wheel settleFrames must not be negative");
    }
    if (selectedOpacity < 0.0f || selectedOpacity > 1.0f || idleOpacity < 0.0f || idleOpacity > 1.0f) {
        throw ConfigurationError("wheel opacities must be within [0, 1]");
    }
    if (perspective <= 0.0f) {
        throw ConfigurationError("wheel perspective must be positive");
    }
}

Wheel::Wheel(WheelConfig config)
    : m_config(std::move(config)) {
    m_config.validate();
    if (m_config.labelFormatter) {
        // Format every value up front so a bad value fails here, not mid-render
        for (const auto& value : m_config.values) {
            m_config.labelFormatter(value);
        }
    }
}

float Wheel::rotationProgress(Frame frame) const {
    float elapsed = static_cast<float>(std::max(0, frame - m_config.delay));
    return std::min(1.0f, elapsed / static_cast<float>(m_config.spinFrames));
}

bool Wheel::settled(Frame frame) const {
    return frame - m_config.settleFrames > m_config.delay;
}

WheelItem Wheel::item(int index, Frame frame) const {
    float offset = wheelRotationOffset(rotationProgress(frame), m_config.spinCurve);
    return layoutItem(index, totalItems(), offset, m_config.radius, m_config.selectedValue,
                      settled(frame), m_config.selectedOpacity, m_config.idleOpacity);
}

std::vector<WheelItem> Wheel::items(const Context& ctx) const {
    std::vector<WheelItem> result;
    result.reserve(m_config.values.size());
    for (int i = 0; i < totalItems(); ++i) {
        result.push_back(item(i, ctx.frame()));
    }
    return result;
}

std::string Wheel::label(int value) const {
    const std::string& raw = m_config.values.at(static_cast<size_t>(value));
    return m_config.labelFormatter ? m_config.labelFormatter(raw) : raw;
}

} // namespace reel
