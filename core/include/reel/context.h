#pragma once

/**
 * @file context.h
 * @brief Per-frame evaluation context
 *
 * Context replaces an ambient "current frame" with an explicit value that is
 * threaded through every evaluation call. It is a small immutable value type:
 * sub-scenes receive a copy re-based onto their own local frame.
 */

#include <reel/types.h>

namespace reel {

class SceneOrchestrator;

/**
 * @brief Frame and frame rate for one evaluation
 *
 * @par Example
 * @code
 * Context ctx(195, 30);
 * float p = spring.progress(ctx);
 * Context local = ctx.withFrame(45);  // inside a sequence starting at 150
 * @endcode
 */
class Context {
public:
    /**
     * @brief Construct a context
     * @param frame Current frame (may be negative inside trimmed sequences)
     * @param fps Frames per second, must be positive
     * @throw ConfigurationError if fps is not positive
     */
    Context(Frame frame, int fps)
        : m_frame(frame), m_fps(fps), m_globalFrame(frame) {
        if (fps <= 0) {
            throw ConfigurationError("fps must be positive, got " + std::to_string(fps));
        }
    }

    /// @brief Current frame
    Frame frame() const { return m_frame; }

    /// @brief Frames per second
    int fps() const { return m_fps; }

    /// @brief Current time in seconds
    double time() const { return static_cast<double>(m_frame) / m_fps; }

    /// @brief Same frame rate and scenes, different frame
    Context withFrame(Frame frame) const {
        Context ctx = *this;
        ctx.m_frame = frame;
        return ctx;
    }

    // -------------------------------------------------------------------------
    /// @name Composition Access
    /// @{

    /**
     * @brief Scene schedule of the composition being rendered
     * @return nullptr when evaluated outside Composition::render()
     */
    const SceneOrchestrator* scenes() const { return m_scenes; }

    /// @brief Frame on the composition timeline, equal to frame() outside a composition
    Frame globalFrame() const { return m_globalFrame; }

    /// @brief Copy attached to a composition's scenes at a global frame
    Context withScenes(const SceneOrchestrator& scenes, Frame globalFrame) const {
        Context ctx = *this;
        ctx.m_scenes = &scenes;
        ctx.m_globalFrame = globalFrame;
        return ctx;
    }

    /// @}

private:
    Frame m_frame;
    int m_fps;
    Frame m_globalFrame;
    const SceneOrchestrator* m_scenes = nullptr;
};

} // namespace reel
