#include <reel/sequence.h>
#include <algorithm>

namespace reel {

// =============================================================================
// TimelineWindow
// =============================================================================

TimelineWindow::TimelineWindow(Frame start, FrameCount duration)
    : m_start(start), m_duration(duration) {
    if (duration <= 0) {
        throw ConfigurationError("TimelineWindow duration must be positive, got " +
                                 std::to_string(duration));
    }
}

TimelineWindow::TimelineWindow(Frame start, std::optional<FrameCount> duration, bool)
    : m_start(start), m_duration(duration) {}

TimelineWindow TimelineWindow::from(Frame start) {
    return TimelineWindow(start, std::nullopt, true);
}

std::optional<Frame> TimelineWindow::end() const {
    if (!m_duration) return std::nullopt;
    return m_start + *m_duration;
}

bool TimelineWindow::contains(Frame parentFrame) const {
    if (parentFrame < m_start) return false;
    return !m_duration || parentFrame < m_start + *m_duration;
}

std::optional<Frame> TimelineWindow::localFrame(Frame parentFrame) const {
    if (!contains(parentFrame)) return std::nullopt;
    return parentFrame - m_start;
}

std::optional<TimelineWindow> TimelineWindow::nest(const TimelineWindow& child) const {
    if (child.m_start < 0) {
        throw ConfigurationError("Cannot flatten nested window " + child.toString() +
                                 ": it starts before its parent");
    }

    const Frame start = m_start + child.m_start;
    std::optional<Frame> outerEnd = end();
    std::optional<Frame> childEnd = child.m_duration
        ? std::optional<Frame>(start + *child.m_duration)
        : std::nullopt;

    std::optional<Frame> combinedEnd;
    if (outerEnd && childEnd) {
        combinedEnd = std::min(*outerEnd, *childEnd);
    } else if (outerEnd) {
        combinedEnd = outerEnd;
    } else {
        combinedEnd = childEnd;
    }

    if (!combinedEnd) {
        return TimelineWindow::from(start);
    }
    if (*combinedEnd <= start) {
        return std::nullopt;
    }
    return TimelineWindow(start, *combinedEnd - start);
}

std::string TimelineWindow::toString() const {
    if (!m_duration) {
        return "[" + std::to_string(m_start) + ", open)";
    }
    return "[" + std::to_string(m_start) + ", " + std::to_string(m_start + *m_duration) + ")";
}

// =============================================================================
// Free functions
// =============================================================================

std::optional<Frame> localFrame(Frame parentFrame, const TimelineWindow& window) {
    return window.localFrame(parentFrame);
}

SceneVisibility visibility(Frame parentFrame, const TimelineWindow& window) {
    std::optional<Frame> local = window.localFrame(parentFrame);
    return SceneVisibility{window, local.has_value(), local};
}

// =============================================================================
// SequencePath
// =============================================================================

SequencePath& SequencePath::push(const TimelineWindow& window) {
    m_windows.push_back(window);
    return *this;
}

std::optional<Frame> SequencePath::localFrame(Frame rootFrame) const {
    Frame frame = rootFrame;
    for (const auto& window : m_windows) {
        std::optional<Frame> local = window.localFrame(frame);
        if (!local) return std::nullopt;
        frame = *local;
    }
    return frame;
}

std::optional<TimelineWindow> SequencePath::flatten() const {
    if (m_windows.empty()) {
        throw ConfigurationError("Cannot flatten an empty sequence path");
    }
    std::optional<TimelineWindow> combined = m_windows.front();
    for (size_t i = 1; i < m_windows.size() && combined; ++i) {
        combined = combined->nest(m_windows[i]);
    }
    return combined;
}

} // namespace reel
