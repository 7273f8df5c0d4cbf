#pragma once

/**
 * @file types.h
 * @brief Basic engine types and error taxonomy
 *
 * Frames are plain integers supplied by the caller. Everything the engine
 * computes is a pure function of (frame, fps, static configuration).
 */

#include <cmath>
#include <stdexcept>
#include <string>

namespace reel {

/// @brief Discrete timeline tick
using Frame = int;

/// @brief Length of a timeline span in frames
using FrameCount = int;

/**
 * @brief Invalid static configuration
 *
 * Raised while configuration is assembled (window, spring, wheel, scene
 * construction). An element whose configuration throws is never scheduled.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief Numeric defect (division by zero, NaN)
 *
 * Only reachable when a validation step was skipped. Treated as a
 * programming error, never recovered from.
 */
class NumericError : public std::runtime_error {
public:
    explicit NumericError(const std::string& what)
        : std::runtime_error(what) {}
};

/// @brief Throw ConfigurationError if value is NaN or infinite
inline void requireFinite(float value, const std::string& what) {
    if (!std::isfinite(value)) {
        throw ConfigurationError(what + " must be finite");
    }
}

/// @brief Throw NumericError if a computed value is NaN or infinite
inline float checkedResult(float value, const char* where) {
    if (!std::isfinite(value)) {
        throw NumericError(std::string(where) + ": non-finite result");
    }
    return value;
}

} // namespace reel
