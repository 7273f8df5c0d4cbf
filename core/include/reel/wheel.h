#pragma once

/**
 * @file wheel.h
 * @brief Rotating wheel selector (circular 3D layout)
 *
 * Places N items on a circle around the X axis and spins it one revolution,
 * decelerating onto the selected value. Each item faces outwards
 * (rotateX(angle)) and carries a counter-rotated label that stays upright.
 */

#include <reel/context.h>
#include <reel/easing.h>
#include <reel/transform.h>
#include <functional>
#include <string>
#include <vector>

namespace reel {

/**
 * @brief Layout and selection state of one slot
 */
struct WheelItem {
    int index = 0;               ///< Slot index in [0, totalItems)
    float angularOffset = 0.0f;  ///< index / totalItems + rotation offset, in revolutions
    float angle = 0.0f;          ///< angularOffset * -2pi, radians
    float depthZ = 0.0f;         ///< cos(angle) * radius
    float verticalY = 0.0f;      ///< sin(angle) * radius
    int value = 0;               ///< (index + selectedValue) mod totalItems
    bool isSelected = false;
    bool facingViewer = true;    ///< cos(angle) >= 0; back-facing items are hidden
    float opacity = 0.0f;
};

/// @brief Opacities used by the free wheelItem() function
constexpr float WHEEL_SELECTED_OPACITY = 1.0f;
constexpr float WHEEL_IDLE_OPACITY = 0.3f;

/**
 * @brief Rotation offset in revolutions for a linear spin progress
 *
 * 1 - curve(clamp(progress, 0, 1)): one full revolution at progress 0,
 * decelerating to 0 at progress 1.
 */
float wheelRotationOffset(float rotationProgress, Ease curve = Ease::Power2Out);

/**
 * @brief Layout of one slot, settled once rotationProgress reaches 1
 * @throw ConfigurationError if totalItems <= 0, index is outside
 *        [0, totalItems), or selectedValue is outside [0, totalItems)
 */
WheelItem wheelItem(int index, int totalItems, float rotationProgress, float radius, int selectedValue);

/// @brief Layout of one slot with an explicit settled flag
WheelItem wheelItem(int index, int totalItems, float rotationProgress, float radius, int selectedValue,
                    bool settled);

/// @brief Slot transform: translateZ(z) translateY(y) rotateX(angle)
TransformState wheelItemTransform(const WheelItem& item);

/// @brief Upright label transform inside the slot: rotateX(-angle)
TransformState wheelLabelTransform(const WheelItem& item);

/// @brief Display text for a wheel value
using LabelFormatter = std::function<std::string(const std::string& value)>;

/// @brief 0 -> "12 am", 12 -> "12 pm", 13 -> "1 pm", 5 -> "5 am"
std::string formatHour(int hour);

/// @brief LabelFormatter applying formatHour to numeric values
LabelFormatter hourLabelFormatter();

/**
 * @brief Static wheel configuration
 */
struct WheelConfig {
    std::vector<std::string> values;     ///< Slot values; size is the item count
    int selectedValue = 0;               ///< Index into values the wheel stops on
    float radius = 130.0f;
    Frame delay = 0;                     ///< First frame of the spin
    FrameCount spinFrames = 100;
    Ease spinCurve = Ease::Power2Out;
    FrameCount settleFrames = 5;         ///< Highlight once frame - settleFrames > delay
    float selectedOpacity = WHEEL_SELECTED_OPACITY;
    float idleOpacity = WHEEL_IDLE_OPACITY;
    float perspective = 10000.0f;
    LabelFormatter labelFormatter;       ///< Optional; identity when empty

    /// @throw ConfigurationError describing the first invalid field
    void validate() const;
};

/**
 * @brief Evaluates a wheel at local frames
 *
 * @par Example
 * @code
 * WheelConfig cfg;
 * cfg.values = {"Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday"};
 * cfg.selectedValue = 3;
 * cfg.delay = 60;
 * Wheel wheel(cfg);
 * for (const auto& item : wheel.items(ctx)) { ... }
 * @endcode
 */
class Wheel {
public:
    /// @throw ConfigurationError if config is invalid
    explicit Wheel(WheelConfig config);

    int totalItems() const { return static_cast<int>(m_config.values.size()); }

    /// @brief Linear spin progress in [0, 1]
    float rotationProgress(Frame frame) const;

    /// @brief True once the selected item may be highlighted
    bool settled(Frame frame) const;

    WheelItem item(int index, Frame frame) const;
    std::vector<WheelItem> items(const Context& ctx) const;

    /// @brief Formatted label of a value index
    std::string label(int value) const;

    /// @brief Frame at which the spin stops
    Frame settleFrame() const { return m_config.delay + m_config.spinFrames; }

    const WheelConfig& config() const { return m_config; }

private:
    WheelConfig m_config;
};

} // namespace reel
