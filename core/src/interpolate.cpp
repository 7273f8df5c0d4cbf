#include <reel/interpolate.h>
#include <reel/types.h>
#include <algorithm>

namespace reel {

Interpolator::Interpolator(std::vector<float> inputRange, std::vector<float> outputRange,
                           Extrapolation extrapolation, EasingPtr easing)
    : m_input(std::move(inputRange))
    , m_output(std::move(outputRange))
    , m_extrapolation(extrapolation)
    , m_easing(std::move(easing)) {
    if (m_input.size() < 2) {
        throw ConfigurationError("interpolate: inputRange needs at least two values");
    }
    if (m_input.size() != m_output.size()) {
        throw ConfigurationError("interpolate: inputRange has " + std::to_string(m_input.size()) +
                                 " values but outputRange has " + std::to_string(m_output.size()));
    }
    for (size_t i = 0; i < m_input.size(); ++i) {
        requireFinite(m_input[i], "interpolate inputRange[" + std::to_string(i) + "]");
        requireFinite(m_output[i], "interpolate outputRange[" + std::to_string(i) + "]");
        if (i > 0 && !(m_input[i] > m_input[i - 1])) {
            throw ConfigurationError("interpolate: inputRange must be strictly increasing, got " +
                                     std::to_string(m_input[i - 1]) + " then " +
                                     std::to_string(m_input[i]));
        }
    }
}

float Interpolator::operator()(float x) const {
    // Last segment whose start is below x; inputs left of the range use the first
    size_t segment = 0;
    if (m_input.size() > 2) {
        auto it = std::upper_bound(m_input.begin() + 1, m_input.end() - 1, x,
                                   [](float value, float bound) { return value <= bound; });
        segment = static_cast<size_t>(it - m_input.begin()) - 1;
    }
    return mapSegment(x, segment);
}

float Interpolator::mapSegment(float x, size_t segment) const {
    const float inMin = m_input[segment];
    const float inMax = m_input[segment + 1];
    const float outMin = m_output[segment];
    const float outMax = m_output[segment + 1];

    float input = x;
    if (input < inMin) {
        switch (m_extrapolation.left) {
            case Extrapolate::Identity: return x;
            case Extrapolate::Clamp:    input = inMin; break;
            case Extrapolate::Extend:   break;
        }
    }
    if (input > inMax) {
        switch (m_extrapolation.right) {
            case Extrapolate::Identity: return x;
            case Extrapolate::Clamp:    input = inMax; break;
            case Extrapolate::Extend:   break;
        }
    }

    if (outMin == outMax) {
        return outMin;
    }

    float t = (input - inMin) / (inMax - inMin);
    if (m_easing) {
        t = (*m_easing)(t);
    }
    return checkedResult(outMin + t * (outMax - outMin), "interpolate");
}

float interpolate(float x, const std::vector<float>& inputRange,
                  const std::vector<float>& outputRange,
                  Extrapolation extrapolation, EasingPtr easing) {
    return Interpolator(inputRange, outputRange, extrapolation, std::move(easing))(x);
}

float tween(Frame frame, Frame start, FrameCount duration, Ease curve) {
    if (duration <= 0) {
        throw ConfigurationError("tween duration must be positive, got " + std::to_string(duration));
    }
    float t = static_cast<float>(frame - start) / static_cast<float>(duration);
    return ease(curve, std::clamp(t, 0.0f, 1.0f));
}

} // namespace reel
