#include <reel/transform.h>
#include <glm/gtc/matrix_transform.hpp>
#include <cmath>
#include <sstream>

namespace reel {

namespace {

glm::vec3 axisVector(Axis axis) {
    switch (axis) {
        case Axis::X: return {1.0f, 0.0f, 0.0f};
        case Axis::Y: return {0.0f, 1.0f, 0.0f};
        case Axis::Z: return {0.0f, 0.0f, 1.0f};
    }
    return {0.0f, 0.0f, 1.0f};
}

const char* axisName(Axis axis) {
    switch (axis) {
        case Axis::X: return "X";
        case Axis::Y: return "Y";
        case Axis::Z: return "Z";
    }
    return "Z";
}

// Matches std::variant overload sets to lambdas
template<class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

glm::mat4 toMatrix(const TransformOp& op) {
    return std::visit(Overloaded{
        [](const Translate& t) {
            return glm::translate(glm::mat4(1.0f), glm::vec3(t.x, t.y, t.z));
        },
        [](const Rotate& r) {
            return glm::rotate(glm::mat4(1.0f), glm::radians(r.degrees), axisVector(r.axis));
        },
        [](const Scale& s) {
            return glm::scale(glm::mat4(1.0f), glm::vec3(s.x, s.y, s.z));
        },
        [](const Skew& s) {
            glm::mat4 m(1.0f);
            m[1][0] = std::tan(glm::radians(s.xDegrees));   // x += tan(ax) * y
            m[0][1] = std::tan(glm::radians(s.yDegrees));   // y += tan(ay) * x
            return m;
        },
        [](const Perspective& p) {
            glm::mat4 m(1.0f);
            m[2][3] = -1.0f / p.distance;
            return m;
        },
    }, op);
}

std::string toCss(const TransformOp& op) {
    std::ostringstream ss;
    std::visit(Overloaded{
        [&](const Translate& t) {
            if (t.z == 0.0f) {
                ss << "translate(" << t.x << "px, " << t.y << "px)";
            } else if (t.x == 0.0f && t.y == 0.0f) {
                ss << "translateZ(" << t.z << "px)";
            } else {
                ss << "translate3d(" << t.x << "px, " << t.y << "px, " << t.z << "px)";
            }
        },
        [&](const Rotate& r) {
            ss << "rotate" << axisName(r.axis) << "(" << r.degrees << "deg)";
        },
        [&](const Scale& s) {
            if (s.z == 1.0f && s.x == s.y) {
                ss << "scale(" << s.x << ")";
            } else if (s.z == 1.0f) {
                ss << "scale(" << s.x << ", " << s.y << ")";
            } else {
                ss << "scale3d(" << s.x << ", " << s.y << ", " << s.z << ")";
            }
        },
        [&](const Skew& s) {
            if (s.yDegrees == 0.0f) {
                ss << "skewX(" << s.xDegrees << "deg)";
            } else if (s.xDegrees == 0.0f) {
                ss << "skewY(" << s.yDegrees << "deg)";
            } else {
                ss << "skew(" << s.xDegrees << "deg, " << s.yDegrees << "deg)";
            }
        },
        [&](const Perspective& p) {
            ss << "perspective(" << p.distance << "px)";
        },
    }, op);
    return ss.str();
}

// =============================================================================
// TransformState
// =============================================================================

TransformState& TransformState::translate(float x, float y, float z) {
    m_ops.emplace_back(Translate{x, y, z});
    return *this;
}

TransformState& TransformState::rotate(Axis axis, float degrees) {
    m_ops.emplace_back(Rotate{axis, degrees});
    return *this;
}

TransformState& TransformState::scale(float x, float y, float z) {
    m_ops.emplace_back(Scale{x, y, z});
    return *this;
}

TransformState& TransformState::skewX(float degrees) {
    m_ops.emplace_back(Skew{degrees, 0.0f});
    return *this;
}

TransformState& TransformState::skewY(float degrees) {
    m_ops.emplace_back(Skew{0.0f, degrees});
    return *this;
}

TransformState& TransformState::perspective(float distance) {
    requireFinite(distance, "perspective distance");
    if (distance <= 0.0f) {
        throw ConfigurationError("perspective distance must be positive, got " + std::to_string(distance));
    }
    m_ops.emplace_back(Perspective{distance});
    return *this;
}

TransformState& TransformState::then(const TransformState& other) {
    m_ops.insert(m_ops.end(), other.m_ops.begin(), other.m_ops.end());
    return *this;
}

TransformState& TransformState::origin(float x, float y, float z) {
    m_origin = glm::vec3(x, y, z);
    return *this;
}

glm::mat4 TransformState::matrix() const {
    glm::mat4 m = glm::translate(glm::mat4(1.0f), m_origin);
    for (const auto& op : m_ops) {
        m = m * toMatrix(op);
    }
    m = glm::translate(m, -m_origin);

    for (int c = 0; c < 4; ++c) {
        for (int r = 0; r < 4; ++r) {
            checkedResult(m[c][r], "TransformState::matrix");
        }
    }
    return m;
}

std::string TransformState::css() const {
    if (m_ops.empty()) return "none";
    std::string out;
    for (const auto& op : m_ops) {
        if (!out.empty()) out += ' ';
        out += toCss(op);
    }
    return out;
}

// =============================================================================
// Counter-rotation
// =============================================================================

TransformState counterRotation(const TransformState& parent) {
    TransformState result;
    const auto& ops = parent.ops();
    for (auto it = ops.rbegin(); it != ops.rend(); ++it) {
        if (const auto* rotate = std::get_if<Rotate>(&*it)) {
            result.rotate(rotate->axis, -rotate->degrees);
        }
    }
    return result;
}

glm::mat3 rotationPart(const glm::mat4& matrix) {
    glm::mat3 r(matrix);
    for (int c = 0; c < 3; ++c) {
        float len = glm::length(r[c]);
        if (len > 0.0f) r[c] /= len;
    }
    return r;
}

glm::mat3 netRotation(const TransformState& parent, const TransformState& child) {
    return rotationPart(parent.matrix() * child.matrix());
}

bool isIdentity(const glm::mat3& m, float epsilon) {
    for (int c = 0; c < 3; ++c) {
        for (int r = 0; r < 3; ++r) {
            float expected = (c == r) ? 1.0f : 0.0f;
            if (std::abs(m[c][r] - expected) > epsilon) return false;
        }
    }
    return true;
}

// =============================================================================
// OpposingTransform
// =============================================================================

void OpposingTransformConfig::validate() const {
    requireFinite(rotateYDeg, "rotateY");
    requireFinite(rotateXDeg, "rotateX");
    requireFinite(skewXDeg, "skewX");
    requireFinite(skewYDeg, "skewY");
    requireFinite(contentRestScale, "contentRestScale");
    requireFinite(framePadding, "framePadding");
    requireFinite(masterRestScale, "masterRestScale");
    requireFinite(frameTravel.x, "frameTravel.x");
    requireFinite(frameTravel.y, "frameTravel.y");
    requireFinite(contentOffset.x, "contentOffset.x");
    requireFinite(contentOffset.y, "contentOffset.y");
    requireFinite(contentPerspective, "contentPerspective");

    if (contentRestScale <= 0.0f || contentRestScale >= 1.0f) {
        throw ConfigurationError("contentRestScale must be within (0, 1), got " +
                                 std::to_string(contentRestScale));
    }
    if (framePadding <= 0.0f) {
        throw ConfigurationError("framePadding must be positive");
    }
    if (masterRestScale <= 0.0f) {
        throw ConfigurationError("masterRestScale must be positive");
    }
    if (contentPerspective <= 0.0f) {
        throw ConfigurationError("contentPerspective must be positive");
    }
}

OpposingTransform::OpposingTransform(OpposingTransformConfig config)
    : m_config(config) {
    m_config.validate();
}

float OpposingTransform::contentScale(float progress) const {
    return (1.0f - progress) * m_config.contentRestScale + progress;
}

float OpposingTransform::frameCompensation(float progress) const {
    return (1.0f - progress) + progress * m_config.framePadding / (1.0f - m_config.contentRestScale);
}

float OpposingTransform::masterScale(float progress) const {
    return (1.0f - progress) * m_config.masterRestScale + progress;
}

TransformState OpposingTransform::content(float progress) const {
    const float rest = 1.0f - progress;
    TransformState t;
    t.translate(m_config.contentOffset.x * rest, m_config.contentOffset.y * rest)
     .perspective(m_config.contentPerspective)
     .rotateY(rest * m_config.rotateYDeg)
     .rotateX(rest * m_config.rotateXDeg)
     .skewX(rest * m_config.skewXDeg)
     .skewY(rest * m_config.skewYDeg)
     .scale(contentScale(progress));
    return t;
}

TransformState OpposingTransform::frame(float progress) const {
    TransformState t;
    t.scale(masterScale(progress))
     .rotateY(-progress * m_config.rotateYDeg)
     .rotateX(-progress * m_config.rotateXDeg)
     .skewX(-progress * m_config.skewXDeg)
     .skewY(-progress * m_config.skewYDeg)
     .scale(frameCompensation(progress))
     .translate(m_config.frameTravel.x * progress, m_config.frameTravel.y * progress)
     .origin(m_config.frameOrigin.x, m_config.frameOrigin.y, m_config.frameOrigin.z);
    return t;
}

} // namespace reel
