#pragma once

/**
 * @file easing.h
 * @brief Easing curves and the EasingStrategy interface
 *
 * Easing curves reshape linear progress into non-linear motion. All curves
 * are total functions over the reals: callers clamp before calling when a
 * clamped result is wanted, and some curves (Back) overshoot on purpose.
 *
 * Curve names follow the GSAP convention used by the motion designs this
 * engine reproduces ("power2.out", "sine.inOut", ...). powerN is a
 * polynomial of degree N + 1, so power2.out(t) = 1 - (1 - t)^3.
 */

#include <memory>
#include <string>
#include <vector>

namespace reel {

/**
 * @brief Built-in easing curves
 */
enum class Ease {
    Linear,
    Power1In, Power1Out, Power1InOut,   ///< Quadratic
    Power2In, Power2Out, Power2InOut,   ///< Cubic
    Power3In, Power3Out, Power3InOut,   ///< Quartic
    Power4In, Power4Out, Power4InOut,   ///< Quintic
    SineIn, SineOut, SineInOut,
    ExpoIn, ExpoOut, ExpoInOut,
    CircIn, CircOut, CircInOut,
    BackIn, BackOut, BackInOut          ///< Overshoots outside [0, 1]
};

/**
 * @brief Evaluate a built-in curve
 * @param curve Curve to evaluate
 * @param t Input progress (not clamped)
 * @return Eased progress
 */
float ease(Ease curve, float t);

/**
 * @brief GSAP-style name of a curve ("power2.out")
 */
const char* easeName(Ease curve);

/**
 * @brief Resolve a GSAP-style name to a curve
 * @param name Curve name such as "linear", "power2.out", "back.inOut".
 *             "none" is accepted as an alias of "linear" and a bare family
 *             name ("power2") means its ".out" variant.
 * @throw ConfigurationError for unknown names
 */
Ease easeFromName(const std::string& name);

/// @brief Every built-in curve, in declaration order
const std::vector<Ease>& allEases();

/**
 * @brief Injectable easing strategy
 *
 * Call sites hold a shared_ptr<const EasingStrategy> so alternate curves can
 * be substituted without touching them.
 */
class EasingStrategy {
public:
    virtual ~EasingStrategy() = default;

    /// @brief Map input progress to eased progress
    virtual float operator()(float t) const = 0;

    /// @brief Descriptive name for logs and serialization
    virtual std::string name() const = 0;
};

using EasingPtr = std::shared_ptr<const EasingStrategy>;

/**
 * @brief Strategy wrapping one of the built-in curves
 */
class CurveEasing : public EasingStrategy {
public:
    explicit CurveEasing(Ease curve) : m_curve(curve) {}

    float operator()(float t) const override { return ease(m_curve, t); }
    std::string name() const override { return easeName(m_curve); }

    Ease curve() const { return m_curve; }

private:
    Ease m_curve;
};

/**
 * @brief CSS cubic-bezier(x1, y1, x2, y2) easing
 *
 * x control points must lie in [0, 1] so the curve is a function of t.
 * Inputs outside [0, 1] are extended linearly from the end tangents.
 */
class CubicBezierEasing : public EasingStrategy {
public:
    /// @throw ConfigurationError if x1/x2 are outside [0, 1] or any value is non-finite
    CubicBezierEasing(float x1, float y1, float x2, float y2);

    float operator()(float t) const override;
    std::string name() const override;

private:
    float sampleX(float u) const;
    float sampleY(float u) const;
    float sampleDerivX(float u) const;
    float solveU(float x) const;

    float m_x1, m_y1, m_x2, m_y2;
};

/// @brief Shared strategy for a built-in curve
EasingPtr makeEasing(Ease curve);

/// @brief Shared strategy resolved from a GSAP-style name
EasingPtr makeEasing(const std::string& name);

} // namespace reel
