#pragma once

/**
 * @file stars_given.h
 * @brief "Stars Given" counter panel with a zoom-away transition
 */

#include <reel/element.h>
#include <reel/transition.h>
#include <string>

namespace reel::productivity {

/**
 * @brief Star counter that fades in, fades out and zooms aside for the tablet
 *
 * - background opacity rises over frames 0-10
 * - text scales 0.5 -> 1 with power2.out between textDelay and textDelay + textDuration
 * - everything fades out between fadeOutStart and fadeOutEnd
 * - while the zoom transition z is active the panel moves to (270z, -270z),
 *   scales by 1 + 0.5z and its opacity is multiplied by 1 - 0.7z
 *
 * Optional star hit frames flash the counter and make it count up.
 */
class StarsGiven : public Element {
public:
    // -------------------------------------------------------------------------
    /// @name Parameters (public for direct access)
    /// @{

    Param<int> starsGiven{"starsGiven", 42, 0, 10000000};
    Param<int> textDelay{"textDelay", 10, 0, 10000};
    Param<int> textDuration{"textDuration", 50, 1, 10000};
    Param<int> fadeOutStart{"fadeOutStart", 120, 0, 10000};
    Param<int> fadeOutEnd{"fadeOutEnd", 150, 1, 10000};
    Param<int> whooshFrame{"whooshFrame", 10, 0, 10000};

    /// @}
    // -------------------------------------------------------------------------

    /// @throw ConfigurationError if fps is not positive
    explicit StarsGiven(int fps = 30);

    /**
     * @brief Springs of the zoom transition, in local frames
     *
     * Defaults to smooth springs at 150 and 300, 45 frames each.
     */
    StarsGiven& zoom(SpringConfig entry, SpringConfig exit);

    /**
     * @brief Zoom with the transition of another scene of the composition
     *
     * Replaces the panel's own springs: the zoom value is read from the
     * composition's scene schedule at the global frame.
     */
    StarsGiven& followTransition(std::string sceneId);

    /// @brief Scene whose transition drives the zoom, empty when using own springs
    const std::string& followedScene() const { return m_followedScene; }

    /// @brief Frames at which a star hits the counter
    StarsGiven& hits(std::vector<Frame> frames);

    std::string name() const override { return "StarsGiven"; }

    /// @throw ConfigurationError if fadeOutEnd is not after fadeOutStart
    void validate() override;

    /// @throw ConfigurationError if ctx.fps() differs from the construction fps
    ElementState evaluate(const Context& ctx) const override;

    CueSheet cues() const override;

    /**
     * @brief Zoom transition value at a frame
     * @throw std::runtime_error if following a scene outside a composition,
     *        or the scene does not exist
     */
    float zoomProgress(const Context& ctx) const;

    const Transition& zoomTransition() const { return m_zoom; }
    const EventTrack& hitTrack() const { return m_hits; }

private:
    int m_fps;
    Transition m_zoom;
    std::string m_followedScene;
    EventTrack m_hits;
};

} // namespace reel::productivity
