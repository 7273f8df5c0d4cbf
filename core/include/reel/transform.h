#pragma once

/**
 * @file transform.h
 * @brief Typed transform stacks and the counter-rotation / opposing patterns
 *
 * A TransformState is an ordered list of operations read left to right like
 * a CSS transform list: the rightmost operation is applied to the element's
 * local coordinates first. Angles are in degrees, distances in pixels.
 * Coordinates follow the screen convention (x right, y down, z towards the
 * viewer).
 */

#include <reel/types.h>
#include <glm/glm.hpp>
#include <string>
#include <variant>
#include <vector>

namespace reel {

enum class Axis { X, Y, Z };

/// @name Transform operations
/// @{

struct Translate {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

struct Rotate {
    Axis axis = Axis::Z;
    float degrees = 0.0f;
};

struct Scale {
    float x = 1.0f;
    float y = 1.0f;
    float z = 1.0f;
};

struct Skew {
    float xDegrees = 0.0f;
    float yDegrees = 0.0f;
};

/// @brief CSS perspective(): distance from the viewer to the z = 0 plane
struct Perspective {
    float distance = 0.0f;
};

/// @}

using TransformOp = std::variant<Translate, Rotate, Scale, Skew, Perspective>;

/// @brief 4x4 matrix of a single operation
glm::mat4 toMatrix(const TransformOp& op);

/// @brief CSS function text of a single operation ("rotateX(15deg)")
std::string toCss(const TransformOp& op);

/**
 * @brief Ordered transform list with an optional origin
 *
 * @par Example
 * @code
 * TransformState item;
 * item.translateZ(z).translateY(y).rotateX(angleDeg);
 * TransformState label = counterRotation(item);   // rotateX(-angleDeg)
 * @endcode
 */
class TransformState {
public:
    TransformState() = default;
    explicit TransformState(std::vector<TransformOp> ops) : m_ops(std::move(ops)) {}

    /// @name Fluent builders
    /// @{

    TransformState& translate(float x, float y, float z = 0.0f);
    TransformState& translateX(float x) { return translate(x, 0.0f, 0.0f); }
    TransformState& translateY(float y) { return translate(0.0f, y, 0.0f); }
    TransformState& translateZ(float z) { return translate(0.0f, 0.0f, z); }

    TransformState& rotate(Axis axis, float degrees);
    TransformState& rotateX(float degrees) { return rotate(Axis::X, degrees); }
    TransformState& rotateY(float degrees) { return rotate(Axis::Y, degrees); }
    TransformState& rotateZ(float degrees) { return rotate(Axis::Z, degrees); }

    TransformState& scale(float s) { return scale(s, s, 1.0f); }
    TransformState& scale(float x, float y, float z = 1.0f);

    TransformState& skewX(float degrees);
    TransformState& skewY(float degrees);

    /// @throw ConfigurationError if distance is not positive
    TransformState& perspective(float distance);

    /// @brief Append every operation of another stack
    TransformState& then(const TransformState& other);

    /// @brief Pivot point in the element's local pixels (CSS transform-origin)
    TransformState& origin(float x, float y, float z = 0.0f);

    /// @}

    const std::vector<TransformOp>& ops() const { return m_ops; }
    bool empty() const { return m_ops.empty(); }
    size_t size() const { return m_ops.size(); }
    const glm::vec3& originPoint() const { return m_origin; }

    /**
     * @brief Composite matrix including the origin shift
     * @throw NumericError if any entry is not finite
     */
    glm::mat4 matrix() const;

    /// @brief CSS transform text ("none" for an empty stack)
    std::string css() const;

private:
    std::vector<TransformOp> m_ops;
    glm::vec3 m_origin{0.0f};
};

/**
 * @brief Rotation that cancels the parent's rotations
 *
 * Negates the parent's rotate operations in reverse order. When the parent's
 * rotations are its innermost operations (as in translate ... rotate), the
 * child's content has zero net rotation and keeps the parent's translation.
 */
TransformState counterRotation(const TransformState& parent);

/**
 * @brief Orthonormal rotation part of a matrix (scale removed)
 */
glm::mat3 rotationPart(const glm::mat4& matrix);

/**
 * @brief Net rotation of a child's content inside a parent
 */
glm::mat3 netRotation(const TransformState& parent, const TransformState& child);

/// @brief True when every entry is within epsilon of the identity
bool isIdentity(const glm::mat3& m, float epsilon = 1e-4f);

/**
 * @brief Static magnitudes of an opposing frame/content pair
 *
 * The content starts rotated, skewed and shrunk inside its frame; as the
 * progress goes 0 -> 1 the content straightens out while the frame rotates
 * the opposite way and grows to match.
 */
struct OpposingTransformConfig {
    float rotateYDeg = 15.0f;
    float rotateXDeg = -10.0f;
    float skewXDeg = 7.0f;
    float skewYDeg = -4.0f;
    float contentRestScale = 0.4f;        ///< Content scale at progress 0
    float framePadding = 1.3f;            ///< Extra growth of the frame at progress 1
    float masterRestScale = 0.8f;         ///< Overall frame scale at progress 0
    glm::vec2 frameTravel{-500.0f, 250.0f};   ///< Frame translation at progress 1
    glm::vec2 contentOffset{350.0f, 480.0f};  ///< Content offset at progress 0
    float contentPerspective = 1200.0f;
    glm::vec3 frameOrigin{0.0f};          ///< Pivot of the frame stack

    /**
     * @throw ConfigurationError for non-finite magnitudes, contentRestScale
     *        outside (0, 1), or non-positive padding, master scale or perspective
     */
    void validate() const;
};

/**
 * @brief Frame and content stacks driven by one progress value
 *
 * At progress p:
 * - content: translate(offset * (1 - p)) perspective(d) rotateY((1 - p) * ry)
 *   rotateX((1 - p) * rx) skewX((1 - p) * sx) skewY((1 - p) * sy)
 *   scale((1 - p) * rest + p)
 * - frame: scale((1 - p) * master + p) rotateY(-p * ry) rotateX(-p * rx)
 *   skewX(-p * sx) skewY(-p * sy) scale(compensation(p)) translate(travel * p)
 *
 * compensation(p) = (1 - p) + p * padding / (1 - rest), so both layers are at
 * rest size for p = 0 and the frame has grown around the full-size content
 * for p = 1.
 */
class OpposingTransform {
public:
    /// @throw ConfigurationError if config is invalid
    explicit OpposingTransform(OpposingTransformConfig config = {});

    TransformState frame(float progress) const;
    TransformState content(float progress) const;

    float contentScale(float progress) const;
    float frameCompensation(float progress) const;
    float masterScale(float progress) const;

    const OpposingTransformConfig& config() const { return m_config; }

private:
    OpposingTransformConfig m_config;
};

} // namespace reel
