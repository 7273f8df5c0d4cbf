#include <reel/cue.h>
#include <algorithm>
#include <iterator>

namespace reel {

namespace {

bool triggersBefore(const Cue& a, const Cue& b) {
    return a.triggerFrame < b.triggerFrame;
}

} // namespace

// =============================================================================
// CueSheet
// =============================================================================

CueSheet::CueSheet(std::vector<Cue> cues)
    : m_cues(std::move(cues)) {
    for (const auto& cue : m_cues) {
        if (cue.id.empty()) {
            throw ConfigurationError("cue at frame " + std::to_string(cue.triggerFrame) + " has no id");
        }
        requireFinite(cue.volume, "cue '" + cue.id + "' volume");
        if (cue.volume < 0.0f || cue.volume > 1.0f) {
            throw ConfigurationError("cue '" + cue.id + "' volume must be within [0, 1]");
        }
    }
    std::stable_sort(m_cues.begin(), m_cues.end(), triggersBefore);
}

std::vector<Cue> CueSheet::cuesAt(Frame frame) const {
    return cuesInRange(frame, frame + 1);
}

std::optional<Cue> CueSheet::lastCueAtOrBefore(Frame frame) const {
    auto it = std::upper_bound(m_cues.begin(), m_cues.end(), frame,
                               [](Frame f, const Cue& cue) { return f < cue.triggerFrame; });
    if (it == m_cues.begin()) return std::nullopt;
    return *std::prev(it);
}

std::vector<Cue> CueSheet::cuesInRange(Frame from, Frame to) const {
    if (to <= from) return {};
    auto first = std::lower_bound(m_cues.begin(), m_cues.end(), from,
                                  [](const Cue& cue, Frame f) { return cue.triggerFrame < f; });
    auto last = std::lower_bound(first, m_cues.end(), to,
                                 [](const Cue& cue, Frame f) { return cue.triggerFrame < f; });
    return std::vector<Cue>(first, last);
}

CueSheet CueSheet::offsetBy(Frame start) const {
    std::vector<Cue> shifted = m_cues;
    for (auto& cue : shifted) {
        cue.triggerFrame += start;
    }
    return CueSheet(std::move(shifted));
}

CueSheet CueSheet::merged(const CueSheet& other) const {
    std::vector<Cue> all = m_cues;
    all.insert(all.end(), other.m_cues.begin(), other.m_cues.end());
    return CueSheet(std::move(all));
}

// =============================================================================
// EventTrack
// =============================================================================

EventTrack::EventTrack(std::vector<Frame> frames)
    : m_frames(std::move(frames)) {
    std::sort(m_frames.begin(), m_frames.end());
}

std::optional<size_t> EventTrack::lastIndexBefore(Frame frame) const {
    size_t count = countBefore(frame);
    if (count == 0) return std::nullopt;
    return count - 1;
}

size_t EventTrack::countBefore(Frame frame) const {
    auto it = std::lower_bound(m_frames.begin(), m_frames.end(), frame);
    return static_cast<size_t>(it - m_frames.begin());
}

std::optional<FrameCount> EventTrack::distanceToNearest(Frame frame) const {
    if (m_frames.empty()) return std::nullopt;
    auto it = std::lower_bound(m_frames.begin(), m_frames.end(), frame);
    FrameCount best = -1;
    if (it != m_frames.end()) {
        best = *it - frame;
    }
    if (it != m_frames.begin()) {
        FrameCount before = frame - *std::prev(it);
        if (best < 0 || before < best) best = before;
    }
    return best;
}

} // namespace reel
