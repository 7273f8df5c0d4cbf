#pragma once

/**
 * @file render_options.h
 * @brief Command line options of reel-render-state
 */

#include <reel/types.h>
#include <CLI/CLI.hpp>
#include <optional>
#include <string>

namespace reel {

struct RenderOptions {
    std::string configPath;
    Frame from = 0;
    std::optional<Frame> to;    ///< Last frame, inclusive; unset means the last frame of the video
    bool pretty = false;
    bool cuesOnly = false;

    /**
     * @brief Inclusive last frame to render
     * @throw ConfigurationError if the range is empty or runs past the video
     */
    Frame lastFrame(FrameCount duration) const {
        Frame last = to.value_or(duration - 1);
        if (last >= duration || last < from) {
            throw ConfigurationError("frame range " + std::to_string(from) + ".." + std::to_string(last) +
                                     " outside 0.." + std::to_string(duration - 1));
        }
        return last;
    }
};

inline void addRenderOptions(CLI::App& app, RenderOptions& options) {
    app.add_option("-c,--config", options.configPath, "Scene config JSON (defaults when omitted)");
    app.add_option("--from", options.from, "First frame")->check(CLI::NonNegativeNumber);
    app.add_option("--to", options.to, "Last frame, inclusive (default: last frame of the video)")
        ->check(CLI::NonNegativeNumber);
    app.add_flag("--pretty", options.pretty, "Indent JSON output");
    app.add_flag("--cues", options.cuesOnly, "Print the cue sheet instead of frame states");
}

} // namespace reel
