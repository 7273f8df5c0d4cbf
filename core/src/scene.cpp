#include <reel/scene.h>
#include <iostream>
#include <stdexcept>

namespace reel {

SceneOrchestrator::SceneOrchestrator(int fps, FrameCount totalDuration)
    : m_fps(fps), m_totalDuration(totalDuration) {
    if (fps <= 0) {
        throw ConfigurationError("fps must be positive, got " + std::to_string(fps));
    }
    if (totalDuration <= 0) {
        throw ConfigurationError("total duration must be positive, got " + std::to_string(totalDuration));
    }
}

SceneOrchestrator& SceneOrchestrator::addScene(SceneDefinition scene) {
    if (scene.id.empty()) {
        throw ConfigurationError("scene id must not be empty");
    }
    if (indexOf(scene.id)) {
        throw ConfigurationError("duplicate scene id '" + scene.id + "'");
    }
    if (scene.entry.has_value() != scene.exit.has_value()) {
        throw ConfigurationError("scene '" + scene.id + "' needs both an entry and an exit spring");
    }

    Entry entry{std::move(scene), std::nullopt};
    if (entry.definition.entry) {
        entry.transition.emplace(*entry.definition.entry, *entry.definition.exit, m_fps);
    }
    m_scenes.push_back(std::move(entry));
    return *this;
}

void SceneOrchestrator::validate() const {
    // Sweep the timeline and report the first gap as a range
    std::optional<Frame> gapStart;
    for (Frame f = 0; f <= m_totalDuration; ++f) {
        bool covered = f < m_totalDuration && activeSceneId(f).has_value();
        if (!covered && f < m_totalDuration && !gapStart) {
            gapStart = f;
        }
        if ((covered || f == m_totalDuration) && gapStart) {
            std::cerr << "[SceneOrchestrator] No scene visible in frames ["
                      << *gapStart << ", " << f << ")\n";
            throw ConfigurationError("no scene is visible in frames [" + std::to_string(*gapStart) +
                                     ", " + std::to_string(f) + ")");
        }
    }
}

std::optional<size_t> SceneOrchestrator::indexOf(const std::string& id) const {
    for (size_t i = 0; i < m_scenes.size(); ++i) {
        if (m_scenes[i].definition.id == id) return i;
    }
    return std::nullopt;
}

const SceneOrchestrator::Entry& SceneOrchestrator::find(const std::string& id) const {
    auto index = indexOf(id);
    if (!index) {
        throw std::runtime_error("Scene '" + id + "' not found");
    }
    return m_scenes[*index];
}

bool SceneOrchestrator::visibleAt(const Entry& entry, Frame frame) const {
    if (!entry.definition.window.contains(frame)) return false;
    for (const auto& hidden : entry.definition.hiddenDuring) {
        if (hidden.contains(frame)) return false;
    }
    return true;
}

SceneVisibility SceneOrchestrator::visibility(const std::string& id, Frame frame) const {
    return reel::visibility(frame, find(id).definition.window);
}

bool SceneOrchestrator::isVisible(const std::string& id, Frame frame) const {
    return visibleAt(find(id), frame);
}

std::vector<std::string> SceneOrchestrator::visibleScenes(Frame frame) const {
    std::vector<std::string> ids;
    for (const auto& entry : m_scenes) {
        if (visibleAt(entry, frame)) ids.push_back(entry.definition.id);
    }
    return ids;
}

std::optional<std::string> SceneOrchestrator::activeSceneId(Frame frame) const {
    for (auto it = m_scenes.rbegin(); it != m_scenes.rend(); ++it) {
        if (visibleAt(*it, frame)) return it->definition.id;
    }
    return std::nullopt;
}

float SceneOrchestrator::transitionValue(const std::string& id, Frame frame) const {
    const Entry& entry = find(id);
    return entry.transition ? entry.transition->value(frame) : 1.0f;
}

const Transition* SceneOrchestrator::transition(const std::string& id) const {
    const Entry& entry = find(id);
    return entry.transition ? &*entry.transition : nullptr;
}

} // namespace reel
