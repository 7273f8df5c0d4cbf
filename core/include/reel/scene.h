#pragma once

/**
 * @file scene.h
 * @brief Sub-scene scheduling: mount windows, visibility and the active scene
 */

#include <reel/sequence.h>
#include <reel/transition.h>
#include <optional>
#include <string>
#include <vector>

namespace reel {

/**
 * @brief Static description of one sub-scene
 */
struct SceneDefinition {
    std::string id;
    TimelineWindow window{0, 1};
    std::optional<SpringConfig> entry;       ///< Entry spring (global frames)
    std::optional<SpringConfig> exit;        ///< Exit spring (global frames)
    std::vector<TimelineWindow> hiddenDuring; ///< Ranges where the mounted scene is not shown
};

/**
 * @brief Schedules sub-scenes on a global timeline
 *
 * A scene is visible when its window contains the frame and no hiddenDuring
 * range does. Scenes are declared back to front; the active scene is the
 * last declared visible one.
 *
 * @par Example
 * @code
 * SceneOrchestrator scenes(30, 345);
 * scenes.addScene({"stars", TimelineWindow(0, 345), {}, {}, {TimelineWindow(196, 105)}});
 * scenes.addScene({"tablet", TimelineWindow(150, 195),
 *                  SpringConfig::smooth(150, 45.0f), SpringConfig::smooth(300, 45.0f), {}});
 * scenes.validate();
 * auto id = scenes.activeSceneId(200);   // "tablet"
 * @endcode
 */
class SceneOrchestrator {
public:
    /// @throw ConfigurationError if fps or totalDuration is not positive
    SceneOrchestrator(int fps, FrameCount totalDuration);

    /**
     * @brief Register a scene
     * @throw ConfigurationError for an empty or duplicate id, or an invalid transition
     */
    SceneOrchestrator& addScene(SceneDefinition scene);

    /**
     * @brief Check that every frame in [0, totalDuration) has a visible scene
     * @throw ConfigurationError naming the first unassigned frame range
     */
    void validate() const;

    int fps() const { return m_fps; }
    FrameCount totalDuration() const { return m_totalDuration; }
    size_t sceneCount() const { return m_scenes.size(); }
    const SceneDefinition& scene(size_t index) const { return m_scenes.at(index).definition; }

    /// @brief Index of a scene by id, nullopt if unknown
    std::optional<size_t> indexOf(const std::string& id) const;

    /// @brief Mount state of a scene
    /// @throw std::runtime_error for an unknown id
    SceneVisibility visibility(const std::string& id, Frame frame) const;

    /// @brief Mounted and not inside a hiddenDuring range
    bool isVisible(const std::string& id, Frame frame) const;

    /// @brief Ids of visible scenes, back to front
    std::vector<std::string> visibleScenes(Frame frame) const;

    /// @brief Last declared visible scene, nullopt if none
    std::optional<std::string> activeSceneId(Frame frame) const;

    /**
     * @brief entry - exit for a scene, 1 for scenes without springs
     * @throw std::runtime_error for an unknown id
     */
    float transitionValue(const std::string& id, Frame frame) const;

    /// @brief Transition of a scene, nullptr when it has none
    const Transition* transition(const std::string& id) const;

private:
    struct Entry {
        SceneDefinition definition;
        std::optional<Transition> transition;
    };

    const Entry& find(const std::string& id) const;
    bool visibleAt(const Entry& entry, Frame frame) const;

    int m_fps;
    FrameCount m_totalDuration;
    std::vector<Entry> m_scenes;
};

} // namespace reel
