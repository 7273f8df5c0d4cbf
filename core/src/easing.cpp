#include <reel/easing.h>
#include <reel/types.h>
#include <algorithm>
#include <cmath>
#include <sstream>
#include <unordered_map>

namespace reel {

namespace {

constexpr float PI = 3.14159265358979f;
constexpr float BACK_C1 = 1.70158f;
constexpr float BACK_C2 = BACK_C1 * 1.525f;
constexpr float BACK_C3 = BACK_C1 + 1.0f;

float ipow(float base, int exponent) {
    float result = 1.0f;
    for (int i = 0; i < exponent; ++i) result *= base;
    return result;
}

float powerIn(float t, int p) { return ipow(t, p); }
float powerOut(float t, int p) { return 1.0f - ipow(1.0f - t, p); }
float powerInOut(float t, int p) {
    if (t < 0.5f) return ipow(2.0f * t, p) * 0.5f;
    return 1.0f - ipow(2.0f * (1.0f - t), p) * 0.5f;
}

struct NamedEase {
    Ease curve;
    const char* name;
};

const NamedEase kNames[] = {
    {Ease::Linear, "linear"},
    {Ease::Power1In, "power1.in"}, {Ease::Power1Out, "power1.out"}, {Ease::Power1InOut, "power1.inOut"},
    {Ease::Power2In, "power2.in"}, {Ease::Power2Out, "power2.out"}, {Ease::Power2InOut, "power2.inOut"},
    {Ease::Power3In, "power3.in"}, {Ease::Power3Out, "power3.out"}, {Ease::Power3InOut, "power3.inOut"},
    {Ease::Power4In, "power4.in"}, {Ease::Power4Out, "power4.out"}, {Ease::Power4InOut, "power4.inOut"},
    {Ease::SineIn, "sine.in"}, {Ease::SineOut, "sine.out"}, {Ease::SineInOut, "sine.inOut"},
    {Ease::ExpoIn, "expo.in"}, {Ease::ExpoOut, "expo.out"}, {Ease::ExpoInOut, "expo.inOut"},
    {Ease::CircIn, "circ.in"}, {Ease::CircOut, "circ.out"}, {Ease::CircInOut, "circ.inOut"},
    {Ease::BackIn, "back.in"}, {Ease::BackOut, "back.out"}, {Ease::BackInOut, "back.inOut"},
};

} // namespace

float ease(Ease curve, float t) {
    switch (curve) {
        case Ease::Linear:      return t;

        case Ease::Power1In:    return powerIn(t, 2);
        case Ease::Power1Out:   return powerOut(t, 2);
        case Ease::Power1InOut: return powerInOut(t, 2);
        case Ease::Power2In:    return powerIn(t, 3);
        case Ease::Power2Out:   return powerOut(t, 3);
        case Ease::Power2InOut: return powerInOut(t, 3);
        case Ease::Power3In:    return powerIn(t, 4);
        case Ease::Power3Out:   return powerOut(t, 4);
        case Ease::Power3InOut: return powerInOut(t, 4);
        case Ease::Power4In:    return powerIn(t, 5);
        case Ease::Power4Out:   return powerOut(t, 5);
        case Ease::Power4InOut: return powerInOut(t, 5);

        case Ease::SineIn:      return 1.0f - std::cos(t * PI * 0.5f);
        case Ease::SineOut:     return std::sin(t * PI * 0.5f);
        case Ease::SineInOut:   return -(std::cos(PI * t) - 1.0f) * 0.5f;

        case Ease::ExpoIn:
            return t == 0.0f ? 0.0f : std::pow(2.0f, 10.0f * (t - 1.0f));
        case Ease::ExpoOut:
            return t == 1.0f ? 1.0f : 1.0f - std::pow(2.0f, -10.0f * t);
        case Ease::ExpoInOut:
            if (t == 0.0f) return 0.0f;
            if (t == 1.0f) return 1.0f;
            if (t < 0.5f) return std::pow(2.0f, 20.0f * t - 10.0f) * 0.5f;
            return (2.0f - std::pow(2.0f, -20.0f * t + 10.0f)) * 0.5f;

        // sqrt argument is floored at 0 so the curves stay total outside [0, 1]
        case Ease::CircIn:
            return 1.0f - std::sqrt(std::max(0.0f, 1.0f - t * t));
        case Ease::CircOut:
            return std::sqrt(std::max(0.0f, 1.0f - (t - 1.0f) * (t - 1.0f)));
        case Ease::CircInOut:
            if (t < 0.5f) {
                return (1.0f - std::sqrt(std::max(0.0f, 1.0f - 4.0f * t * t))) * 0.5f;
            }
            return (std::sqrt(std::max(0.0f, 1.0f - ipow(-2.0f * t + 2.0f, 2))) + 1.0f) * 0.5f;

        case Ease::BackIn:
            return BACK_C3 * t * t * t - BACK_C1 * t * t;
        case Ease::BackOut: {
            float u = t - 1.0f;
            return 1.0f + BACK_C3 * u * u * u + BACK_C1 * u * u;
        }
        case Ease::BackInOut:
            if (t < 0.5f) {
                float u = 2.0f * t;
                return (u * u * ((BACK_C2 + 1.0f) * u - BACK_C2)) * 0.5f;
            } else {
                float u = 2.0f * t - 2.0f;
                return (u * u * ((BACK_C2 + 1.0f) * u + BACK_C2) + 2.0f) * 0.5f;
            }
    }
    return t;
}

const char* easeName(Ease curve) {
    for (const auto& entry : kNames) {
        if (entry.curve == curve) return entry.name;
    }
    return "linear";
}

Ease easeFromName(const std::string& name) {
    static const std::unordered_map<std::string, Ease> lookup = [] {
        std::unordered_map<std::string, Ease> map;
        for (const auto& entry : kNames) map[entry.name] = entry.curve;
        map["none"] = Ease::Linear;
        map["power0"] = Ease::Linear;
        map["power1"] = Ease::Power1Out;
        map["power2"] = Ease::Power2Out;
        map["power3"] = Ease::Power3Out;
        map["power4"] = Ease::Power4Out;
        map["sine"] = Ease::SineOut;
        map["expo"] = Ease::ExpoOut;
        map["circ"] = Ease::CircOut;
        map["back"] = Ease::BackOut;
        return map;
    }();

    auto it = lookup.find(name);
    if (it == lookup.end()) {
        throw ConfigurationError("Unknown easing curve: '" + name + "'");
    }
    return it->second;
}

const std::vector<Ease>& allEases() {
    static const std::vector<Ease> eases = [] {
        std::vector<Ease> list;
        for (const auto& entry : kNames) list.push_back(entry.curve);
        return list;
    }();
    return eases;
}

// =============================================================================
// CubicBezierEasing
// =============================================================================

CubicBezierEasing::CubicBezierEasing(float x1, float y1, float x2, float y2)
    : m_x1(x1), m_y1(y1), m_x2(x2), m_y2(y2) {
    requireFinite(x1, "cubic-bezier x1");
    requireFinite(y1, "cubic-bezier y1");
    requireFinite(x2, "cubic-bezier x2");
    requireFinite(y2, "cubic-bezier y2");
    if (x1 < 0.0f || x1 > 1.0f || x2 < 0.0f || x2 > 1.0f) {
        throw ConfigurationError("cubic-bezier x control points must be within [0, 1]");
    }
}

float CubicBezierEasing::sampleX(float u) const {
    float inv = 1.0f - u;
    return 3.0f * inv * inv * u * m_x1 + 3.0f * inv * u * u * m_x2 + u * u * u;
}

float CubicBezierEasing::sampleY(float u) const {
    float inv = 1.0f - u;
    return 3.0f * inv * inv * u * m_y1 + 3.0f * inv * u * u * m_y2 + u * u * u;
}

float CubicBezierEasing::sampleDerivX(float u) const {
    float inv = 1.0f - u;
    return 3.0f * inv * inv * m_x1 + 6.0f * inv * u * (m_x2 - m_x1) + 3.0f * u * u * (1.0f - m_x2);
}

float CubicBezierEasing::solveU(float x) const {
    // Newton first, bisection when the slope is too flat
    float u = x;
    for (int i = 0; i < 8; ++i) {
        float error = sampleX(u) - x;
        if (std::abs(error) < 1e-6f) return u;
        float d = sampleDerivX(u);
        if (std::abs(d) < 1e-6f) break;
        u -= error / d;
    }

    float lo = 0.0f;
    float hi = 1.0f;
    u = x;
    for (int i = 0; i < 32; ++i) {
        float value = sampleX(u);
        if (std::abs(value - x) < 1e-6f) break;
        if (value < x) lo = u; else hi = u;
        u = (lo + hi) * 0.5f;
    }
    return u;
}

float CubicBezierEasing::operator()(float t) const {
    if (t < 0.0f) {
        float slope = m_x1 > 0.0f ? m_y1 / m_x1 : (m_x2 > 0.0f ? m_y2 / m_x2 : 0.0f);
        return slope * t;
    }
    if (t > 1.0f) {
        float slope = m_x2 < 1.0f ? (m_y2 - 1.0f) / (m_x2 - 1.0f)
                                  : (m_x1 < 1.0f ? (m_y1 - 1.0f) / (m_x1 - 1.0f) : 0.0f);
        return 1.0f + slope * (t - 1.0f);
    }
    return sampleY(solveU(t));
}

std::string CubicBezierEasing::name() const {
    std::ostringstream ss;
    ss << "cubic-bezier(" << m_x1 << ", " << m_y1 << ", " << m_x2 << ", " << m_y2 << ")";
    return ss.str();
}

EasingPtr makeEasing(Ease curve) {
    return std::make_shared<CurveEasing>(curve);
}

EasingPtr makeEasing(const std::string& name) {
    return std::make_shared<CurveEasing>(easeFromName(name));
}

} // namespace reel
