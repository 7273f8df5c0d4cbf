#pragma once

/**
 * @file top_day.h
 * @brief Heading plus a wheel that spins to the selected value
 */

#include <reel/element.h>
#include <reel/wheel.h>
#include <optional>
#include <string>

namespace reel::productivity {

/**
 * @brief Labelled wheel panel ("Most productive day: Thursday")
 *
 * The wheel spins from the configured delay and stops on the value selected
 * by the `value` parameter. Cues: a spin sound at `soundFrame` and a settle
 * cue when the spin ends.
 *
 * @par Example
 * @code
 * WheelConfig wc;
 * wc.values = weekdayNames();
 * wc.delay = 60;
 * TopDay day("weekday", "Most productive day", wc);
 * day.value = 3;
 * day.validate();
 * @endcode
 */
class TopDay : public Element {
public:
    // -------------------------------------------------------------------------
    /// @name Parameters (public for direct access)
    /// @{

    Param<int> value{"value", 0, 0, 1000};          ///< Index of the selected value
    Param<int> soundFrame{"soundFrame", 0, 0, 100000};

    /// @}
    // -------------------------------------------------------------------------

    /**
     * @param key Short name used in cue ids ("weekday")
     * @param heading Text shown above the wheel
     * @param config Wheel layout; selectedValue is replaced by the value parameter
     */
    TopDay(std::string key, std::string heading, WheelConfig config);

    std::string name() const override { return "TopDay"; }

    /// @throw ConfigurationError if the wheel configuration is invalid
    void validate() override;

    /// @throw std::runtime_error if validate() has not succeeded
    ElementState evaluate(const Context& ctx) const override;

    CueSheet cues() const override;

    /// @throw std::runtime_error if validate() has not succeeded
    const Wheel& wheel() const;

    const std::string& heading() const { return m_heading; }

private:
    std::string m_key;
    std::string m_heading;
    WheelConfig m_config;
    std::optional<Wheel> m_wheel;
};

} // namespace reel::productivity
