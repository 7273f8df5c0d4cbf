#pragma once

/**
 * @file production.h
 * @brief Builds the complete "Stars and Productivity" composition
 *
 * Timeline at the default 150-frame star panel:
 * - 0-195: star counter, zooming aside from 150
 * - 150-345: tablet with the productivity panel
 * - 301-345: star counter again while the tablet zooms back out
 */

#include <reel/composition.h>
#include <reel/config.h>
#include <memory>
#include <vector>

namespace reel::productivity {

/**
 * @brief Inputs of the production
 *
 * @par Config keys
 * fps, starsDuration, starsGiven, weekday, hour, graphData, starHits
 */
struct ProductionConfig {
    int fps = 30;
    FrameCount starsDuration = 150;   ///< Length of the star panel before the tablet enters
    int starsGiven = 42;
    int weekday = 3;                  ///< Index into weekdayNames()
    int hour = 14;
    std::vector<float> graphData;     ///< Activity per hour; empty uses mockProductivityData()
    std::vector<Frame> starHits;

    /// @throw ConfigurationError for wrongly typed keys
    static ProductionConfig fromConfig(const SceneConfig& config);

    /// @brief Frame at which the tablet scene starts
    Frame tabletStart() const { return starsDuration; }

    /// @brief starsDuration + 150 + 45
    FrameCount totalDuration() const { return starsDuration + 195; }
};

/**
 * @brief Build and initialize the composition
 *
 * Elements: "stars" (StarsGiven) and "tablet" (Tablet). Values under the
 * config's "params" object are applied before init().
 *
 * @throw ConfigurationError if the inputs cannot form a valid composition
 */
std::unique_ptr<Composition> buildProduction(const ProductionConfig& production,
                                             const SceneConfig& overrides = SceneConfig());

} // namespace reel::productivity
