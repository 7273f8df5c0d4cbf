#pragma once

/**
 * @file element_state.h
 * @brief Per-frame output tree handed to the rendering surface
 */

#include <reel/cue.h>
#include <reel/transform.h>
#include <reel/transition.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace reel {

/**
 * @brief Resolved visual state of one element at one frame
 */
struct ElementState {
    std::string id;
    TransformState transform;
    float opacity = 1.0f;
    bool visible = true;
    std::string assetId;               ///< Opaque asset reference, may be empty
    std::optional<std::string> label;  ///< Text content, if any
    std::optional<float> value;        ///< Scalar payload (bar height, counter)
    std::vector<ElementState> children;

    /// @name Scene transition
    /// Set by Composition::render() on top-level elements whose scene has
    /// entry and exit springs.
    /// @{
    std::optional<float> transition;
    std::optional<TransitionPhase> phase;
    /// @}

    /// @brief Child by id, nullptr if absent
    const ElementState* child(const std::string& childId) const;

    nlohmann::json toJson() const;
};

/**
 * @brief Everything the renderer needs for one frame
 */
struct FrameState {
    Frame frame = 0;
    int fps = 30;
    std::optional<std::string> activeScene;
    std::vector<ElementState> elements;
    std::vector<Cue> cues;             ///< Cues triggering on this frame

    /// @brief Top-level element by id, nullptr if not rendered this frame
    const ElementState* element(const std::string& id) const;

    nlohmann::json toJson() const;
};

/// @brief JSON form of a transform: {"css", "ops", "origin"}
nlohmann::json transformToJson(const TransformState& transform);

/// @brief JSON form of a cue
nlohmann::json cueToJson(const Cue& cue);

} // namespace reel
