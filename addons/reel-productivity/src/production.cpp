#include <reel/productivity/production.h>
#include <reel/productivity/data.h>
#include <reel/productivity/stars_given.h>
#include <reel/productivity/tablet.h>
#include <iostream>
#include <stdexcept>

namespace reel::productivity {

namespace {

constexpr FrameCount kZoomFrames = 45;
constexpr FrameCount kTabletHold = 150;
constexpr FrameCount kFadeOutFrames = 30;

void requireRange(const char* key, int value, int lo, int hi) {
    if (value < lo || value > hi) {
        throw ConfigurationError(std::string("'") + key + "' must be within [" + std::to_string(lo) +
                                 ", " + std::to_string(hi) + "], got " + std::to_string(value));
    }
}

// Selections may be written as 3 or "3"
int parseIndex(const SceneConfig& config, const char* key, int def) {
    std::string text = config.getString(key, std::to_string(def));
    size_t used = 0;
    int value = 0;
    try {
        value = std::stoi(text, &used);
    } catch (const std::logic_error&) {
        throw ConfigurationError(std::string("'") + key + "' must be an integer, got '" + text + "'");
    }
    if (used != text.size()) {
        throw ConfigurationError(std::string("'") + key + "' must be an integer, got '" + text + "'");
    }
    return value;
}

} // namespace

ProductionConfig ProductionConfig::fromConfig(const SceneConfig& config) {
    ProductionConfig p;
    p.fps = config.getInt("fps", p.fps);
    p.starsDuration = config.getInt("starsDuration", p.starsDuration);
    p.starsGiven = config.getInt("starsGiven", p.starsGiven);
    p.weekday = parseIndex(config, "weekday", p.weekday);
    p.hour = parseIndex(config, "hour", p.hour);
    p.graphData = config.getFloats("graphData", p.graphData);
    p.starHits = config.getInts("starHits", p.starHits);
    return p;
}

std::unique_ptr<Composition> buildProduction(const ProductionConfig& production,
                                             const SceneConfig& overrides) {
    const FrameCount stars = production.starsDuration;
    if (stars < kFadeOutFrames) {
        throw ConfigurationError("starsDuration must be at least " + std::to_string(kFadeOutFrames) +
                                 " frames, got " + std::to_string(stars));
    }
    requireRange("weekday", production.weekday, 0, 6);
    requireRange("hour", production.hour, 0, 23);
    if (production.starsGiven < 0) {
        throw ConfigurationError("'starsGiven' must not be negative");
    }

    const FrameCount total = production.totalDuration();
    auto comp = std::make_unique<Composition>(production.fps, total);

    SpringConfig zoomIn = SpringConfig::smooth(stars, static_cast<float>(kZoomFrames));
    SpringConfig zoomOut = SpringConfig::smooth(stars + kTabletHold, static_cast<float>(kZoomFrames));

    auto& counter = comp->add<StarsGiven>("stars", production.fps);
    counter.starsGiven = production.starsGiven;
    counter.fadeOutStart = stars - kFadeOutFrames;
    counter.fadeOutEnd = stars;
    counter.followTransition("tablet");
    counter.hits(production.starHits);

    auto& tablet = comp->add<Tablet>("tablet");
    tablet.sceneLength = kTabletHold;
    tablet.hideDuration = kZoomFrames;
    tablet.productivity().weekday = production.weekday;
    tablet.productivity().hour = production.hour;
    if (!production.graphData.empty()) {
        tablet.productivity().graphData(production.graphData);
    }

    // The counter is covered by the fullscreen tablet between the zooms
    comp->schedule("stars", TimelineWindow(0, total),
                   {TimelineWindow(stars + kZoomFrames + 1, kTabletHold - kZoomFrames)});
    comp->schedule("tablet", TimelineWindow(stars, kTabletHold + kZoomFrames));
    comp->transition("tablet", zoomIn, zoomOut);
    comp->cue({0, "music.background", AUDIO_BACKGROUND_MUSIC, VOLUME_BACKGROUND_MUSIC});

    size_t written = overrides.applyParams(*comp);
    if (written > 0) {
        std::clog << "[Production] Applied " << written << " parameter overrides\n";
    }

    comp->init();
    return comp;
}

} // namespace reel::productivity
