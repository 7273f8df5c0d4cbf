#pragma once

/**
 * @file interpolate.h
 * @brief Range mapping with per-side extrapolation
 *
 * Maps a value from an input range to an output range. Ranges may have more
 * than two breakpoints; the segment containing the input is mapped linearly,
 * optionally through an easing strategy.
 */

#include <reel/easing.h>
#include <reel/types.h>
#include <vector>

namespace reel {

/**
 * @brief Behaviour outside the input range
 */
enum class Extrapolate {
    Extend,     ///< Keep mapping linearly past the end
    Clamp,      ///< Hold the boundary output
    Identity    ///< Return the input unchanged
};

/**
 * @brief Left and right extrapolation policies
 */
struct Extrapolation {
    Extrapolate left = Extrapolate::Extend;
    Extrapolate right = Extrapolate::Extend;

    static Extrapolation clamped() { return {Extrapolate::Clamp, Extrapolate::Clamp}; }
    static Extrapolation extended() { return {Extrapolate::Extend, Extrapolate::Extend}; }
};

/**
 * @brief Validated range mapping
 *
 * @par Example
 * @code
 * Interpolator fadeOut({120, 150}, {1, 0}, Extrapolation::clamped());
 * float opacity = fadeOut(135.0f);   // 0.5
 * @endcode
 */
class Interpolator {
public:
    /**
     * @brief Construct a mapping
     * @param inputRange At least two strictly increasing finite breakpoints
     * @param outputRange Same number of finite outputs
     * @param extrapolation Per-side policy
     * @param easing Optional easing applied to each segment's progress
     * @throw ConfigurationError on size mismatch, fewer than two breakpoints,
     *        non-increasing (including zero-width) input ranges or non-finite values
     */
    Interpolator(std::vector<float> inputRange, std::vector<float> outputRange,
                 Extrapolation extrapolation = {}, EasingPtr easing = nullptr);

    /// @brief Map a value
    float operator()(float x) const;

    const std::vector<float>& inputRange() const { return m_input; }
    const std::vector<float>& outputRange() const { return m_output; }
    Extrapolation extrapolation() const { return m_extrapolation; }

private:
    float mapSegment(float x, size_t segment) const;

    std::vector<float> m_input;
    std::vector<float> m_output;
    Extrapolation m_extrapolation;
    EasingPtr m_easing;
};

/**
 * @brief One-shot interpolation
 *
 * Validates the ranges on every call; build an Interpolator when the same
 * mapping is evaluated for many frames.
 *
 * @throw ConfigurationError for invalid ranges
 */
float interpolate(float x, const std::vector<float>& inputRange,
                  const std::vector<float>& outputRange,
                  Extrapolation extrapolation = {}, EasingPtr easing = nullptr);

/**
 * @brief Eased progress over a frame span
 *
 * ease(clamp((frame - start) / duration, 0, 1)). Used for the GSAP-style
 * tweens that run for a fixed number of frames after a delay.
 *
 * @throw ConfigurationError if duration is not positive
 */
float tween(Frame frame, Frame start, FrameCount duration, Ease curve);

} // namespace reel
