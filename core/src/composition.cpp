#include <reel/composition.h>
#include <iostream>

namespace reel {

Composition::Composition(int fps, FrameCount duration)
    : m_fps(fps), m_duration(duration) {
    if (fps <= 0) {
        throw ConfigurationError("fps must be positive, got " + std::to_string(fps));
    }
    if (duration <= 0) {
        throw ConfigurationError("composition duration must be positive, got " + std::to_string(duration));
    }
}

void Composition::addElement(const std::string& name, std::unique_ptr<Element> element) {
    if (name.empty()) {
        throw ConfigurationError("element name must not be empty");
    }
    if (m_elements.count(name)) {
        throw ConfigurationError("duplicate element name '" + name + "'");
    }
    m_elements[name] = std::move(element);
    m_schedules[name] = Schedule{TimelineWindow(0, m_duration), {}, std::nullopt, std::nullopt, false};
    m_order.push_back(name);
    m_scenes.reset();
}

Element* Composition::getByName(const std::string& name) {
    auto it = m_elements.find(name);
    if (it == m_elements.end()) {
        return nullptr;
    }
    return it->second.get();
}

const Element* Composition::getByName(const std::string& name) const {
    auto it = m_elements.find(name);
    if (it == m_elements.end()) {
        return nullptr;
    }
    return it->second.get();
}

Composition::Schedule& Composition::scheduleFor(const std::string& name) {
    auto it = m_schedules.find(name);
    if (it == m_schedules.end()) {
        throw std::runtime_error("Element not found: " + name);
    }
    return it->second;
}

Composition& Composition::schedule(const std::string& name, const TimelineWindow& window,
                                   std::vector<TimelineWindow> hiddenDuring) {
    Schedule& s = scheduleFor(name);
    s.window = window;
    s.hiddenDuring = std::move(hiddenDuring);
    s.explicitWindow = true;
    m_scenes.reset();
    return *this;
}

Composition& Composition::transition(const std::string& name, SpringConfig entry, SpringConfig exit) {
    Schedule& s = scheduleFor(name);
    s.entry = std::move(entry);
    s.exit = std::move(exit);
    m_scenes.reset();
    return *this;
}

Composition& Composition::cue(Cue cue) {
    m_globalCues.push_back(std::move(cue));
    m_scenes.reset();
    return *this;
}

void Composition::init() {
    m_rejected.clear();
    m_scenes.reset();

    auto scenes = std::make_unique<SceneOrchestrator>(m_fps, m_duration);
    CueSheet cues(m_globalCues);

    for (const auto& name : m_order) {
        Element& element = *m_elements.at(name);
        const Schedule& s = m_schedules.at(name);
        try {
            element.validate();
            scenes->addScene({name, s.window, s.entry, s.exit, s.hiddenDuring});
        } catch (const ConfigurationError& e) {
            std::cerr << "[Composition] Element '" << name << "' (" << element.name()
                      << ") not scheduled: " << e.what() << "\n";
            m_rejected.push_back(name);
            continue;
        }

        // Lift the element's local cues onto the global timeline, dropping
        // any that fall outside its window
        CueSheet local = element.cues().offsetBy(s.window.start());
        Frame end = s.window.end().value_or(m_duration);
        cues = cues.merged(CueSheet(local.cuesInRange(s.window.start(), end)));
    }

    scenes->validate();

    m_cueSheet = std::move(cues);
    m_scenes = std::move(scenes);
    std::clog << "[Composition] " << (m_order.size() - m_rejected.size()) << " of " << m_order.size()
              << " elements scheduled, " << m_cueSheet.size() << " cues, "
              << m_duration << " frames at " << m_fps << " fps\n";
}

const SceneOrchestrator& Composition::scenes() const {
    if (!m_scenes) {
        throw std::runtime_error("Composition not initialized");
    }
    return *m_scenes;
}

FrameState Composition::render(Frame frame) const {
    const SceneOrchestrator& orchestrator = scenes();

    FrameState state;
    state.frame = frame;
    state.fps = m_fps;
    state.activeScene = orchestrator.activeSceneId(frame);

    for (size_t i = 0; i < orchestrator.sceneCount(); ++i) {
        const SceneDefinition& scene = orchestrator.scene(i);
        if (!orchestrator.isVisible(scene.id, frame)) continue;

        Frame local = *scene.window.localFrame(frame);
        Context ctx = Context(local, m_fps).withScenes(orchestrator, frame);
        ElementState element = m_elements.at(scene.id)->evaluate(ctx);
        element.id = scene.id;
        if (const Transition* transition = orchestrator.transition(scene.id)) {
            element.transition = transition->value(frame);
            element.phase = transition->phase(frame);
        }
        state.elements.push_back(std::move(element));
    }

    state.cues = m_cueSheet.cuesAt(frame);
    return state;
}

} // namespace reel
