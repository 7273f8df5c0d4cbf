#pragma once

/**
 * @file transition.h
 * @brief Rise-hold-fall value built from an entry and an exit spring
 */

#include <reel/spring.h>

namespace reel {

/**
 * @brief Phase of a transitioning element at one frame
 */
enum class TransitionPhase {
    Hidden,     ///< Value at or near 0
    Entering,   ///< Rising towards 1
    Visible,    ///< At or near 1
    Exiting     ///< Falling towards 0
};

const char* transitionPhaseName(TransitionPhase phase);

/**
 * @brief entry(frame) - exit(frame)
 *
 * The phase is derived from the value at the requested frame alone: no
 * history is kept, so frames can be evaluated in any order.
 *
 * @par Example
 * @code
 * Transition zoom(SpringConfig::smooth(150, 45.0f), SpringConfig::smooth(300, 45.0f), 30);
 * float z = zoom.value(Context(195, 30));   // ~1
 * @endcode
 */
class Transition {
public:
    /**
     * @param epsilon Distance from 0 or 1 treated as Hidden or Visible
     * @throw ConfigurationError if either spring is invalid, the exit starts
     *        before the entry, or epsilon is outside (0, 0.5)
     */
    Transition(SpringConfig entry, SpringConfig exit, int fps, float epsilon = 0.01f);

    float value(const Context& ctx) const;
    float value(Frame frame) const;

    TransitionPhase phase(Frame frame) const;
    TransitionPhase phase(const Context& ctx) const { return phase(ctx.frame()); }

    const Spring& entry() const { return m_entry; }
    const Spring& exit() const { return m_exit; }
    float epsilon() const { return m_epsilon; }

    /// @brief Frame at which the exit spring has come to rest
    Frame endFrame() const { return m_exit.settleFrame(); }

private:
    Spring m_entry;
    Spring m_exit;
    float m_epsilon;
};

} // namespace reel
