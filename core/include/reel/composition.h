#pragma once

/**
 * @file composition.h
 * @brief Named element registry with scene scheduling
 *
 * A Composition owns the top-level elements of a video, assigns each a
 * window on the global timeline and renders FrameStates. Each element sees
 * frames relative to its own window.
 */

#include <reel/element.h>
#include <reel/scene.h>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace reel {

/**
 * @brief Top-level element graph of one video
 *
 * @par Example
 * @code
 * Composition comp(30, 345);
 * comp.add<StarsGiven>("stars");
 * comp.add<Tablet>("tablet");
 * comp.schedule("tablet", TimelineWindow(150, 195));
 * comp.init();
 * FrameState state = comp.render(200);
 * @endcode
 */
class Composition {
public:
    /// @throw ConfigurationError if fps or duration is not positive
    Composition(int fps, FrameCount duration);
    ~Composition() = default;

    Composition(const Composition&) = delete;
    Composition& operator=(const Composition&) = delete;

    /**
     * @brief Add an element, drawn above those added before it
     * @return Reference to the new element
     * @throw ConfigurationError if the name is empty or already used
     */
    template<typename T, typename... Args>
    T& add(const std::string& name, Args&&... args) {
        auto element = std::make_unique<T>(std::forward<Args>(args)...);
        T& ref = *element;
        addElement(name, std::move(element));
        return ref;
    }

    /**
     * @brief Get an element by name with type checking
     * @throw std::runtime_error if not found or type mismatch
     */
    template<typename T>
    T& get(const std::string& name) {
        Element* element = getByName(name);
        if (!element) {
            throw std::runtime_error("Element not found: " + name);
        }
        T* typed = dynamic_cast<T*>(element);
        if (!typed) {
            throw std::runtime_error("Element type mismatch: " + name);
        }
        return *typed;
    }

    /// @brief Element by name, nullptr if absent
    Element* getByName(const std::string& name);
    const Element* getByName(const std::string& name) const;

    /// @brief Element names in drawing order
    const std::vector<std::string>& names() const { return m_order; }

    // -------------------------------------------------------------------------
    /// @name Scheduling
    /// @{

    /**
     * @brief Mount an element only inside a window of the global timeline
     *
     * Elements that are never scheduled are mounted for the whole duration.
     *
     * @throw std::runtime_error if the element does not exist
     */
    Composition& schedule(const std::string& name, const TimelineWindow& window,
                          std::vector<TimelineWindow> hiddenDuring = {});

    /// @brief Attach entry and exit springs (global frames) to an element's scene
    Composition& transition(const std::string& name, SpringConfig entry, SpringConfig exit);

    /// @brief Add a cue on the global timeline
    Composition& cue(Cue cue);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Lifecycle
    /// @{

    /**
     * @brief Validate elements and build the scene schedule
     *
     * Elements whose validate() throws are logged, left out of the schedule
     * and listed by rejected(). Throws if the remaining scenes leave part of
     * the timeline without a visible scene.
     *
     * @throw ConfigurationError for schedule errors
     */
    void init();

    bool isInitialized() const { return m_scenes != nullptr; }

    /// @brief Names of elements rejected by init()
    const std::vector<std::string>& rejected() const { return m_rejected; }

    /**
     * @brief Visual state of every visible element at a global frame
     * @throw std::runtime_error if init() has not succeeded
     */
    FrameState render(Frame frame) const;

    /// @}

    int fps() const { return m_fps; }
    FrameCount duration() const { return m_duration; }

    /// @throw std::runtime_error if init() has not succeeded
    const SceneOrchestrator& scenes() const;

    /// @brief All cues on the global timeline (valid after init())
    const CueSheet& cueSheet() const { return m_cueSheet; }

private:
    struct Schedule {
        TimelineWindow window{0, 1};
        std::vector<TimelineWindow> hiddenDuring;
        std::optional<SpringConfig> entry;
        std::optional<SpringConfig> exit;
        bool explicitWindow = false;
    };

    void addElement(const std::string& name, std::unique_ptr<Element> element);
    Schedule& scheduleFor(const std::string& name);

    int m_fps;
    FrameCount m_duration;
    std::map<std::string, std::unique_ptr<Element>> m_elements;
    std::map<std::string, Schedule> m_schedules;
    std::vector<std::string> m_order;
    std::vector<Cue> m_globalCues;

    std::vector<std::string> m_rejected;
    std::unique_ptr<SceneOrchestrator> m_scenes;
    CueSheet m_cueSheet;
};

} // namespace reel
