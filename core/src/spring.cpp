#include <reel/spring.h>
#include <reel/interpolate.h>
#include <algorithm>
#include <cmath>

namespace reel {

namespace {

constexpr int REST_WINDOW_FRAMES = 20;

void requireFps(int fps) {
    if (fps <= 0) {
        throw ConfigurationError("fps must be positive, got " + std::to_string(fps));
    }
}

} // namespace

// =============================================================================
// SpringConfig
// =============================================================================

void SpringConfig::validate() const {
    requireFinite(mass, "spring mass");
    requireFinite(damping, "spring damping");
    requireFinite(stiffness, "spring stiffness");
    requireFinite(restThreshold, "spring restThreshold");

    if (mass <= 0.0f) {
        throw ConfigurationError("spring mass must be positive, got " + std::to_string(mass));
    }
    if (stiffness <= 0.0f) {
        throw ConfigurationError("spring stiffness must be positive, got " + std::to_string(stiffness));
    }
    if (damping <= 0.0f) {
        // an undamped spring never comes to rest
        throw ConfigurationError("spring damping must be positive, got " + std::to_string(damping));
    }
    if (restThreshold <= 0.0f || restThreshold >= 1.0f) {
        // at 1 or above the spring counts as settled before it has moved
        throw ConfigurationError("spring restThreshold must be within (0, 1), got " +
                                 std::to_string(restThreshold));
    }
    if (durationInFrames) {
        requireFinite(*durationInFrames, "spring durationInFrames");
        if (*durationInFrames <= 0.0f) {
            throw ConfigurationError("spring durationInFrames must be positive, got " +
                                     std::to_string(*durationInFrames));
        }
    }
}

SpringConfig SpringConfig::smooth(Frame delay, std::optional<float> durationInFrames) {
    SpringConfig config;
    config.damping = 200.0f;
    config.delay = delay;
    config.durationInFrames = durationInFrames;
    return config;
}

// =============================================================================
// DampedSpring
// =============================================================================

SpringState DampedSpring::step(const SpringState& state, double dt, const SpringConfig& config) {
    const double c = config.damping;
    const double m = config.mass;
    const double k = config.stiffness;

    const double v0 = -state.velocity;
    const double x0 = 1.0 - state.current;

    const double zeta = c / (2.0 * std::sqrt(k * m));
    const double omega0 = std::sqrt(k / m);

    SpringState next;
    if (zeta < 1.0) {
        const double omega1 = omega0 * std::sqrt(1.0 - zeta * zeta);
        const double sin1 = std::sin(omega1 * dt);
        const double cos1 = std::cos(omega1 * dt);
        const double envelope = std::exp(-zeta * omega0 * dt);
        const double frag = envelope * (sin1 * ((v0 + zeta * omega0 * x0) / omega1) + x0 * cos1);

        next.current = 1.0 - frag;
        next.velocity = zeta * omega0 * frag -
                        envelope * (cos1 * (v0 + zeta * omega0 * x0) - omega1 * x0 * sin1);
    } else {
        const double envelope = std::exp(-omega0 * dt);
        next.current = 1.0 - envelope * (x0 + (v0 + omega0 * x0) * dt);
        next.velocity = envelope * (v0 * (dt * omega0 - 1.0) + dt * x0 * omega0 * omega0);
    }
    return next;
}

double DampedSpring::evaluate(double frame, int fps, const SpringConfig& config) const {
    const double clamped = std::max(0.0, frame);
    const double whole = std::floor(clamped);
    const double rest = clamped - whole;

    // One step per whole frame, then a fractional step for the remainder
    SpringState state;
    const double dt = 1.0 / fps;
    const long steps = static_cast<long>(whole);
    for (long i = 0; i < steps; ++i) {
        state = step(state, dt, config);
    }
    if (rest > 0.0) {
        state = step(state, rest / fps, config);
    }
    return state.current;
}

SpringStrategyPtr defaultSpringStrategy() {
    static const SpringStrategyPtr instance = std::make_shared<DampedSpring>();
    return instance;
}

// =============================================================================
// Free functions
// =============================================================================

FrameCount measureSpring(int fps, const SpringConfig& config) {
    requireFps(fps);
    config.validate();

    const double dt = 1.0 / fps;
    const double threshold = config.restThreshold;

    SpringState state;
    Frame frame = 0;
    while (std::abs(1.0 - state.current) >= threshold) {
        state = DampedSpring::step(state, dt, config);
        ++frame;
    }

    // Must stay at rest for a full window; restart the window on any excursion
    Frame finished = frame;
    for (int i = 0; i < REST_WINDOW_FRAMES; ++i) {
        state = DampedSpring::step(state, dt, config);
        ++frame;
        if (std::abs(1.0 - state.current) >= threshold) {
            i = 0;
            finished = frame + 1;
        }
    }
    return finished;
}

namespace {

float progressWith(const SpringStrategy& strategy, Frame frame, int fps,
                   const SpringConfig& config, FrameCount naturalDuration) {
    if (frame < config.delay) {
        return 0.0f;
    }

    double local = static_cast<double>(frame - config.delay);
    if (config.durationInFrames) {
        const double duration = *config.durationInFrames;
        if (local > duration) {
            return 1.0f;
        }
        if (naturalDuration <= 0) {
            throw NumericError("spring settles in " + std::to_string(naturalDuration) +
                               " frames, cannot stretch it to " + std::to_string(duration));
        }
        local = local / (duration / naturalDuration);
    }

    double value = strategy.evaluate(local, fps, config);
    if (config.overshootClamping) {
        value = std::min(value, 1.0);
    }
    return checkedResult(static_cast<float>(value), "springProgress");
}

} // namespace

float springProgress(Frame frame, int fps, const SpringConfig& config) {
    requireFps(fps);
    config.validate();
    const FrameCount natural = config.durationInFrames ? measureSpring(fps, config) : 0;
    return progressWith(*defaultSpringStrategy(), frame, fps, config, natural);
}

float initialVelocity(int fps, const SpringConfig& config, std::optional<FrameCount> sampleFrames) {
    const FrameCount offset = sampleFrames.value_or(fps);
    if (offset <= 0) {
        throw ConfigurationError("initialVelocity sample offset must be positive");
    }
    return springProgress(config.delay + offset, fps, config) -
           springProgress(config.delay, fps, config);
}

// =============================================================================
// Spring
// =============================================================================

Spring::Spring(SpringConfig config, int fps, SpringStrategyPtr strategy)
    : m_config(std::move(config)), m_fps(fps), m_strategy(std::move(strategy)) {
    requireFps(fps);
    m_config.validate();
    if (!m_strategy) {
        throw ConfigurationError("Spring requires a strategy");
    }
    m_naturalDuration = measureSpring(m_fps, m_config);
}

float Spring::progress(const Context& ctx) const {
    if (ctx.fps() != m_fps) {
        // Resampling between frame rates is not supported
        throw ConfigurationError("Spring built for " + std::to_string(m_fps) +
                                 " fps evaluated at " + std::to_string(ctx.fps()) + " fps");
    }
    return progress(ctx.frame());
}

float Spring::progress(Frame frame) const {
    return progressWith(*m_strategy, frame, m_fps, m_config, m_naturalDuration);
}

FrameCount Spring::settleDuration() const {
    if (m_config.durationInFrames) {
        return static_cast<FrameCount>(std::ceil(*m_config.durationInFrames));
    }
    return m_naturalDuration;
}

// =============================================================================
// WindUp
// =============================================================================

WindUp::WindUp(SpringConfig config, int fps, float weight, float bias)
    : m_spring(std::move(config), fps), m_weight(weight), m_bias(bias) {
    requireFinite(weight, "windUp weight");
    requireFinite(bias, "windUp bias");
    m_driftEnd = static_cast<float>(m_spring.settleFrame());
    if (m_driftEnd <= 0.0f) {
        throw ConfigurationError("windUp drift must end after frame 0");
    }
}

float WindUp::value(const Context& ctx) const {
    const float drift = interpolate(static_cast<float>(ctx.frame()),
                                    {0.0f, m_driftEnd}, {-m_bias, m_bias},
                                    {Extrapolate::Extend, Extrapolate::Clamp});
    return m_weight * m_spring.progress(ctx) + drift;
}

} // namespace reel
