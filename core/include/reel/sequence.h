#pragma once

/**
 * @file sequence.h
 * @brief Timeline windows and parent-to-local frame remapping
 *
 * A sub-scene lives inside a TimelineWindow of its parent. While the parent
 * frame is inside the window the sub-scene is mounted and sees its own local
 * frame starting at 0; outside it the sub-scene is unmounted and must not be
 * evaluated at all.
 */

#include <reel/types.h>
#include <optional>
#include <string>
#include <vector>

namespace reel {

/**
 * @brief Half-open span [start, start + duration) of a parent timeline
 *
 * The start may be negative, which trims the first frames of the child.
 * Windows created with from() have no end.
 */
class TimelineWindow {
public:
    /**
     * @brief Bounded window
     * @throw ConfigurationError if duration is not positive
     */
    TimelineWindow(Frame start, FrameCount duration);

    /// @brief Window open from start until the end of the parent
    static TimelineWindow from(Frame start);

    Frame start() const { return m_start; }

    /// @brief Duration, or nullopt for an open-ended window
    std::optional<FrameCount> duration() const { return m_duration; }

    /// @brief Exclusive end frame, or nullopt for an open-ended window
    std::optional<Frame> end() const;

    bool isOpenEnded() const { return !m_duration.has_value(); }

    /// @brief start <= parentFrame < end
    bool contains(Frame parentFrame) const;

    /**
     * @brief Local frame for a parent frame
     * @return parentFrame - start while mounted, nullopt otherwise
     */
    std::optional<Frame> localFrame(Frame parentFrame) const;

    /// @brief Parent frame for a local frame
    Frame toParent(Frame localFrame) const { return m_start + localFrame; }

    /**
     * @brief Window of a child timeline expressed in this window's parent frames
     *
     * The child is clipped to this window's end. Returns nullopt when the
     * child can never be mounted.
     *
     * @throw ConfigurationError if the child starts before this window
     *        (negative child start), which has no single-window equivalent
     */
    std::optional<TimelineWindow> nest(const TimelineWindow& child) const;

    std::string toString() const;

    bool operator==(const TimelineWindow& other) const = default;

private:
    TimelineWindow(Frame start, std::optional<FrameCount> duration, bool);

    Frame m_start;
    std::optional<FrameCount> m_duration;
};

/**
 * @brief Local frame of a window for a parent frame
 * @return nullopt while the window is not mounted
 */
std::optional<Frame> localFrame(Frame parentFrame, const TimelineWindow& window);

/**
 * @brief Mount state of a sub-scene at one parent frame
 */
struct SceneVisibility {
    TimelineWindow activeRange;
    bool isMounted = false;
    std::optional<Frame> localFrame;   ///< Set only while mounted
};

/// @brief Visibility of window at parentFrame
SceneVisibility visibility(Frame parentFrame, const TimelineWindow& window);

/**
 * @brief Chain of nested windows, outermost first
 *
 * localFrame() remaps through every level in turn, which is equivalent to
 * remapping once through flatten().
 */
class SequencePath {
public:
    SequencePath() = default;
    explicit SequencePath(std::vector<TimelineWindow> windows) : m_windows(std::move(windows)) {}

    /// @brief Append a window nested inside the current innermost one
    SequencePath& push(const TimelineWindow& window);

    const std::vector<TimelineWindow>& windows() const { return m_windows; }
    size_t depth() const { return m_windows.size(); }

    /// @brief Frame seen by the innermost timeline, nullopt if any level is unmounted
    std::optional<Frame> localFrame(Frame rootFrame) const;

    /**
     * @brief Single window with the cumulative offset
     * @return nullopt if the path is never mounted
     * @throw ConfigurationError if the path is empty or an inner window starts
     *        before its parent
     */
    std::optional<TimelineWindow> flatten() const;

private:
    std::vector<TimelineWindow> m_windows;
};

} // namespace reel
