#pragma once

/**
 * @file data.h
 * @brief Input data and asset names for the stars and productivity video
 */

#include <string>
#include <vector>

namespace reel::productivity {

/// @brief Seven weekday names, Monday first
const std::vector<std::string>& weekdayNames();

/// @brief Weekday name for an index, "Monday" when out of range
std::string weekdayName(int index);

/// @brief Wheel values "0" to "23"
std::vector<std::string> hourValues();

/**
 * @brief Sample activity per hour of day (24 entries, peak at hour 10)
 */
const std::vector<float>& mockProductivityData();

/**
 * @brief Hour with the highest activity
 *
 * Ties resolve to the earliest hour. Returns 0 for empty or all-zero data.
 */
int mostProductiveHour(const std::vector<float>& perHour);

/// @name Audio assets
/// @{
constexpr const char* AUDIO_BACKGROUND_MUSIC = "music/robots-preview.mp3";
constexpr const char* AUDIO_STARS_WHOOSH = "first-whoosh.mp3";
constexpr const char* AUDIO_TABLET_ENTRY = "decelerate.mp3";
constexpr const char* AUDIO_BARS_ANIMATE = "wham.mp3";
constexpr const char* AUDIO_WHEEL_SPIN = "weigh.mp3";
/// @}

/// @name Audio volumes
/// @{
constexpr float VOLUME_BACKGROUND_MUSIC = 0.3f;
constexpr float VOLUME_STARS_WHOOSH = 0.5f;
constexpr float VOLUME_TABLET_ENTRY = 0.6f;
constexpr float VOLUME_BARS_ANIMATE = 0.4f;
constexpr float VOLUME_WHEEL_SPIN = 0.5f;
/// @}

} // namespace reel::productivity
