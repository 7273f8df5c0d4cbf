#include <reel/transition.h>

namespace reel {

const char* transitionPhaseName(TransitionPhase phase) {
    switch (phase) {
        case TransitionPhase::Hidden:   return "hidden";
        case TransitionPhase::Entering: return "entering";
        case TransitionPhase::Visible:  return "visible";
        case TransitionPhase::Exiting:  return "exiting";
    }
    return "hidden";
}

Transition::Transition(SpringConfig entry, SpringConfig exit, int fps, float epsilon)
    : m_entry(std::move(entry), fps)
    , m_exit(std::move(exit), fps)
    , m_epsilon(epsilon) {
    if (m_exit.config().delay < m_entry.config().delay) {
        throw ConfigurationError("transition exit (delay " + std::to_string(m_exit.config().delay) +
                                 ") starts before its entry (delay " +
                                 std::to_string(m_entry.config().delay) + ")");
    }
    requireFinite(epsilon, "transition epsilon");
    if (epsilon <= 0.0f || epsilon >= 0.5f) {
        throw ConfigurationError("transition epsilon must be within (0, 0.5)");
    }
}

float Transition::value(const Context& ctx) const {
    return m_entry.progress(ctx) - m_exit.progress(ctx);
}

float Transition::value(Frame frame) const {
    return m_entry.progress(frame) - m_exit.progress(frame);
}

TransitionPhase Transition::phase(Frame frame) const {
    const float v = value(frame);
    if (v <= m_epsilon) {
        return TransitionPhase::Hidden;
    }
    if (v >= 1.0f - m_epsilon) {
        return TransitionPhase::Visible;
    }
    return frame < m_exit.config().delay ? TransitionPhase::Entering : TransitionPhase::Exiting;
}

} // namespace reel
