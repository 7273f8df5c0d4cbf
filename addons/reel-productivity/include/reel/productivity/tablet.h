#pragma once

/**
 * @file tablet.h
 * @brief Tablet held in hands that zooms its screen to fullscreen
 *
 * The tablet slides up from below, then the device frame and the screen
 * content move in opposite directions so the tilted screen ends flat and
 * filling the view. At the end of the scene the motion reverses.
 *
 * Local timeline (frames):
 * - enterDelay .. enterDelay + enterDuration: slide up and zoom in
 * - sceneLength .. sceneLength + hideDuration: zoom back out
 */

#include <reel/productivity/productivity.h>
#include <reel/transform.h>
#include <optional>

namespace reel::productivity {

/**
 * @brief Tablet frame with the Productivity panel on its screen
 *
 * @par Example
 * @code
 * auto& tablet = comp.add<Tablet>("tablet");
 * tablet.fullscreenAmount = 0.68f;
 * tablet.productivity().weekday = 4;
 * comp.schedule("tablet", TimelineWindow(150, 195));
 * @endcode
 */
class Tablet : public Element {
public:
    // -------------------------------------------------------------------------
    /// @name Parameters (public for direct access)
    /// @{

    Param<float> fullscreenAmount{"fullscreenAmount", 0.68f, 0.0f, 1.0f};
    Param<int> enterDelay{"enterDelay", 30, 0, 10000};
    Param<int> enterDuration{"enterDuration", 16, 1, 10000};
    Param<int> sceneLength{"sceneLength", 150, 0, 10000};
    Param<int> hideDuration{"hideDuration", 45, 1, 10000};
    Param<float> slideDistance{"slideDistance", 800.0f, 0.0f, 10000.0f};
    Param<float> canvasHeight{"canvasHeight", 1080.0f, 1.0f, 10000.0f};

    /// @}
    // -------------------------------------------------------------------------

    explicit Tablet(OpposingTransformConfig zoom = {});

    std::string name() const override { return "Tablet"; }

    /// @throw ConfigurationError if the zoom configuration or the panel is invalid
    void validate() override;

    /// @throw std::runtime_error if validate() has not succeeded
    ElementState evaluate(const Context& ctx) const override;

    CueSheet cues() const override;

    /// @brief power2.out slide-up progress in [0, 1]
    float entryProgress(Frame frame) const;

    /// @brief power2.out zoom-out progress in [0, 1]
    float exitProgress(Frame frame) const;

    /// @brief fullscreenAmount * (entry - exit), drives both transform stacks
    float toFullscreen(Frame frame) const;

    Productivity& productivity() { return m_productivity; }
    const Productivity& productivity() const { return m_productivity; }

    /// @throw std::runtime_error if validate() has not succeeded
    const OpposingTransform& zoom() const;

private:
    OpposingTransformConfig m_zoomConfig;
    std::optional<OpposingTransform> m_zoom;
    Productivity m_productivity;
};

} // namespace reel::productivity
