#pragma once

/**
 * @file cue.h
 * @brief Static cue sheets and event tracks with binary-search lookup
 *
 * Both containers are sorted once at construction; every per-frame query is
 * a binary search.
 */

#include <reel/types.h>
#include <optional>
#include <string>
#include <vector>

namespace reel {

/**
 * @brief One trigger for an external collaborator (usually audio)
 */
struct Cue {
    Frame triggerFrame = 0;
    std::string id;        ///< Stable name, e.g. "wheel.weekday.settle"
    std::string assetId;   ///< Opaque asset reference, may be empty
    float volume = 1.0f;

    bool operator==(const Cue& other) const = default;
};

/**
 * @brief Sorted list of cues
 *
 * @par Example
 * @code
 * CueSheet local({{0, "tablet.enter", "decelerate.mp3", 0.6f}});
 * CueSheet global = local.offsetBy(150);   // triggers at frame 150
 * @endcode
 */
class CueSheet {
public:
    CueSheet() = default;

    /**
     * @brief Sort cues by trigger frame, keeping declaration order for ties
     * @throw ConfigurationError for an empty id or a volume outside [0, 1]
     */
    explicit CueSheet(std::vector<Cue> cues);

    const std::vector<Cue>& cues() const { return m_cues; }
    size_t size() const { return m_cues.size(); }
    bool empty() const { return m_cues.empty(); }

    /// @brief Cues triggering exactly at frame
    std::vector<Cue> cuesAt(Frame frame) const;

    /// @brief Most recent cue at or before frame
    std::optional<Cue> lastCueAtOrBefore(Frame frame) const;

    /// @brief Cues with from <= triggerFrame < to
    std::vector<Cue> cuesInRange(Frame from, Frame to) const;

    /// @brief Copy with every trigger moved by start frames
    CueSheet offsetBy(Frame start) const;

    /// @brief Union of two sheets
    CueSheet merged(const CueSheet& other) const;

private:
    std::vector<Cue> m_cues;
};

/**
 * @brief Sorted event frames (hits, beats)
 */
class EventTrack {
public:
    EventTrack() = default;
    explicit EventTrack(std::vector<Frame> frames);

    const std::vector<Frame>& frames() const { return m_frames; }
    size_t size() const { return m_frames.size(); }
    bool empty() const { return m_frames.empty(); }

    /// @brief Index of the last event strictly before frame
    std::optional<size_t> lastIndexBefore(Frame frame) const;

    /// @brief Number of events strictly before frame
    size_t countBefore(Frame frame) const;

    /// @brief |frame - nearest event|, nullopt for an empty track
    std::optional<FrameCount> distanceToNearest(Frame frame) const;

private:
    std::vector<Frame> m_frames;
};

} // namespace reel
