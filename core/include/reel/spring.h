#pragma once

/**
 * @file spring.h
 * @brief Damped-oscillator progress over frames
 *
 * A spring progress starts at 0 on its delay frame and settles at 1. The
 * position is advanced one frame at a time with the closed-form solution of
 * a damped harmonic oscillator, so the value at frame N depends only on
 * (N, fps, config) and is bit-for-bit reproducible.
 */

#include <reel/context.h>
#include <memory>
#include <optional>
#include <string>

namespace reel {

/**
 * @brief Spring parameters
 *
 * Defaults are the classic (mass 1, damping 10, stiffness 100) bouncy spring.
 * Damping 200 gives the smooth, non-overshooting approach used for most UI
 * motion; see smooth().
 */
struct SpringConfig {
    float mass = 1.0f;
    float damping = 10.0f;
    float stiffness = 100.0f;
    Frame delay = 0;                          ///< First frame of motion
    std::optional<float> durationInFrames;    ///< Stretch to reach rest at exactly this many frames
    bool overshootClamping = false;           ///< Never report values above 1
    float restThreshold = 0.005f;             ///< Distance from 1 considered "at rest", in (0, 1)

    /**
     * @brief Check the configuration
     * @throw ConfigurationError for non-positive mass/stiffness/damping,
     *        non-positive duration or threshold, non-finite values
     */
    void validate() const;

    /// @brief Damping 200 preset with the given delay and optional duration
    static SpringConfig smooth(Frame delay = 0, std::optional<float> durationInFrames = std::nullopt);
};

/**
 * @brief Position and velocity of a spring after some number of steps
 */
struct SpringState {
    double current = 0.0;
    double velocity = 0.0;
};

/**
 * @brief Injectable spring implementation
 *
 * evaluate() receives a frame already relative to the spring start (no
 * delay, no duration stretching) and returns the raw position.
 */
class SpringStrategy {
public:
    virtual ~SpringStrategy() = default;

    /// @brief Raw position at a (possibly fractional) frame since the start
    virtual double evaluate(double frame, int fps, const SpringConfig& config) const = 0;

    /// @brief Name for logs and serialization
    virtual std::string name() const = 0;
};

using SpringStrategyPtr = std::shared_ptr<const SpringStrategy>;

/**
 * @brief Built-in damped harmonic oscillator
 *
 * Underdamped configurations (zeta < 1) oscillate around 1; all others use
 * the critically damped solution per step.
 */
class DampedSpring : public SpringStrategy {
public:
    double evaluate(double frame, int fps, const SpringConfig& config) const override;
    std::string name() const override { return "damped"; }

    /**
     * @brief Advance a state by dt seconds towards 1
     */
    static SpringState step(const SpringState& state, double dt, const SpringConfig& config);
};

/// @brief Shared default strategy instance
SpringStrategyPtr defaultSpringStrategy();

/**
 * @brief Number of frames the spring needs to come to rest
 *
 * The spring is considered at rest once it has stayed within restThreshold
 * of 1 for 20 consecutive frames; the returned frame is the first of that run.
 * Delay and durationInFrames are ignored.
 *
 * @throw ConfigurationError if config or fps is invalid
 */
FrameCount measureSpring(int fps, const SpringConfig& config);

/**
 * @brief Spring progress at a frame
 *
 * Returns exactly 0 for frames before config.delay. With durationInFrames the
 * natural motion is time-scaled so the spring reaches 1 exactly
 * durationInFrames frames after the delay, and reports 1 afterwards.
 *
 * @throw ConfigurationError if config or fps is invalid
 */
float springProgress(Frame frame, int fps, const SpringConfig& config);

/**
 * @brief Progress gained over the first sampleFrames frames after the delay
 *
 * Used to pre-bias interpolations that lead into a spring so the motion does
 * not jump at the start frame. sampleFrames defaults to one second.
 */
float initialVelocity(int fps, const SpringConfig& config, std::optional<FrameCount> sampleFrames = std::nullopt);

/**
 * @brief Validated spring bound to a strategy
 *
 * Measures the natural duration once at construction; progress() is then a
 * cheap const call per frame.
 *
 * @par Example
 * @code
 * Spring zoomIn(SpringConfig::smooth(150, 45.0f), 30);
 * float z = zoomIn.progress(Context(170, 30));
 * @endcode
 */
class Spring {
public:
    /**
     * @throw ConfigurationError if config or fps is invalid
     */
    Spring(SpringConfig config, int fps, SpringStrategyPtr strategy = defaultSpringStrategy());

    /// @brief Progress at the context frame
    float progress(const Context& ctx) const;

    /// @brief Progress at a frame (same fps as construction)
    float progress(Frame frame) const;

    const SpringConfig& config() const { return m_config; }
    int fps() const { return m_fps; }

    /// @brief Natural rest duration in frames (ignores durationInFrames)
    FrameCount naturalDuration() const { return m_naturalDuration; }

    /// @brief Frames from delay until rest: durationInFrames if set, else natural
    FrameCount settleDuration() const;

    /// @brief Absolute frame at which the spring is at rest
    Frame settleFrame() const { return m_config.delay + settleDuration(); }

private:
    SpringConfig m_config;
    int m_fps;
    SpringStrategyPtr m_strategy;
    FrameCount m_naturalDuration = 0;
};

/**
 * @brief Spring preceded by a linear drift
 *
 * value = weight * spring + interpolate(frame, [0, delay + duration],
 * [-bias, +bias]) with the left side extended and the right side clamped.
 * The drift starts before the spring so the spring picks up an element that
 * is already moving.
 */
class WindUp {
public:
    /**
     * @throw ConfigurationError if the spring is invalid, weight/bias are not
     *        finite, or delay + duration is not positive
     */
    WindUp(SpringConfig config, int fps, float weight = 0.9f, float bias = 0.1f);

    float value(const Context& ctx) const;

    const Spring& spring() const { return m_spring; }
    float weight() const { return m_weight; }
    float bias() const { return m_bias; }

private:
    Spring m_spring;
    float m_weight;
    float m_bias;
    float m_driftEnd;
};

} // namespace reel
