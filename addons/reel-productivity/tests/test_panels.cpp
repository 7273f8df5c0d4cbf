/**
 * @file test_panels.cpp
 * @brief Unit tests for the productivity panels
 *
 * Tests data helpers, bar graph, wheels, tablet and star counter elements
 * in isolation, at local frames.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <reel/productivity/data.h>
#include <reel/productivity/stars_given.h>
#include <reel/productivity/tablet.h>
#include <limits>

using namespace reel;
using namespace reel::productivity;
using Catch::Matchers::WithinAbs;

// =============================================================================
// Data
// =============================================================================

TEST_CASE("Weekday and hour values", "[productivity][data]") {
    REQUIRE(weekdayNames().size() == 7);
    REQUIRE(weekdayName(3) == "Thursday");
    REQUIRE(weekdayName(6) == "Sunday");
    REQUIRE(weekdayName(9) == "Monday");
    REQUIRE(weekdayName(-1) == "Monday");

    std::vector<std::string> hours = hourValues();
    REQUIRE(hours.size() == 24);
    REQUIRE(hours.front() == "0");
    REQUIRE(hours.back() == "23");
}

TEST_CASE("mostProductiveHour", "[productivity][data]") {
    REQUIRE(mockProductivityData().size() == 24);
    REQUIRE(mostProductiveHour(mockProductivityData()) == 10);

    SECTION("first maximum wins") {
        REQUIRE(mostProductiveHour({1, 5, 5, 2}) == 1);
    }

    SECTION("empty or idle days report hour 0") {
        REQUIRE(mostProductiveHour({}) == 0);
        REQUIRE(mostProductiveHour(std::vector<float>(24, 0.0f)) == 0);
    }
}

// =============================================================================
// BarGraph
// =============================================================================

TEST_CASE("BarGraph fill and peak", "[productivity][bars]") {
    BarGraph graph;
    graph.data(mockProductivityData());
    graph.validate();

    REQUIRE(graph.barCount() == 24);
    REQUIRE(graph.maxValue() == 70.0f);

    Bar peak = graph.bar(10, 200);
    REQUIRE(peak.mostProductive);
    REQUIRE(peak.fill == 1.0f);

    Bar morning = graph.bar(8, 200);
    REQUIRE_FALSE(morning.mostProductive);
    REQUIRE_THAT(morning.fill, WithinAbs(45.0f / 70.0f, 1e-6f));

    REQUIRE(graph.bar(0, 200).fill == 0.0f);
}

TEST_CASE("BarGraph growth is staggered", "[productivity][bars]") {
    BarGraph graph;
    graph.data(mockProductivityData());

    SECTION("first bar grows over frames 30 to 90") {
        REQUIRE(graph.bar(0, 30).height == 0.0f);
        float mid = graph.bar(0, 60).height;
        REQUIRE(mid > 0.5f);
        REQUIRE(mid < 1.0f);
        REQUIRE(graph.bar(0, 90).height == 1.0f);
    }

    SECTION("each bar starts two frames after the previous one") {
        REQUIRE(graph.bar(10, 50).height == 0.0f);
        REQUIRE(graph.bar(10, 51).height > 0.0f);
        REQUIRE(graph.bar(10, 110).height == 1.0f);
    }

    SECTION("later bars are never taller than earlier ones mid-growth") {
        for (int i = 1; i < graph.barCount(); ++i) {
            REQUIRE(graph.bar(i, 70).height <= graph.bar(i - 1, 70).height);
        }
    }
}

TEST_CASE("BarGraph with an idle day", "[productivity][bars]") {
    BarGraph graph;
    graph.data(std::vector<float>(24, 0.0f));
    REQUIRE_NOTHROW(graph.validate());

    for (int i = 0; i < graph.barCount(); ++i) {
        Bar b = graph.bar(i, 200);
        REQUIRE(b.fill == 0.0f);
        REQUIRE_FALSE(b.mostProductive);
    }
}

TEST_CASE("BarGraph rejects bad data", "[productivity][bars]") {
    BarGraph graph;

    SECTION("empty") {
        graph.data({});
        REQUIRE_THROWS_AS(graph.validate(), ConfigurationError);
    }

    SECTION("negative") {
        graph.data({1.0f, -1.0f});
        REQUIRE_THROWS_AS(graph.validate(), ConfigurationError);
    }

    SECTION("not finite") {
        graph.data({std::numeric_limits<float>::quiet_NaN()});
        REQUIRE_THROWS_AS(graph.validate(), ConfigurationError);
    }

    SECTION("index out of range") {
        graph.data({1.0f, 2.0f});
        REQUIRE_THROWS_AS(graph.bar(2, 0), std::out_of_range);
    }
}

TEST_CASE("BarGraph state tree", "[productivity][bars]") {
    BarGraph graph;
    graph.data(mockProductivityData());
    graph.validate();

    ElementState state = graph.evaluate(Context(200, 30));
    REQUIRE(state.id == "graph");
    REQUIRE(state.children.size() == 24);

    const ElementState* bar = state.child("bar.10");
    REQUIRE(bar != nullptr);
    REQUIRE(bar->value == 1.0f);
    REQUIRE(bar->child("fill")->assetId == "bar-peak");
    REQUIRE(bar->child("hour")->label == "10");
    REQUIRE(state.child("bar.9")->child("fill")->assetId == "bar");
}

// =============================================================================
// TopDay and Productivity
// =============================================================================

TEST_CASE("TopDay wheel", "[productivity][wheel]") {
    WheelConfig config;
    config.values = weekdayNames();
    config.delay = 60;
    TopDay day("weekday", "Most productive day", config);

    SECTION("used before validate") {
        REQUIRE_THROWS_AS(day.wheel(), std::runtime_error);
        REQUIRE_THROWS_AS(day.evaluate(Context(0, 30)), std::runtime_error);
    }

    SECTION("value parameter picks the selection") {
        day.value = 4;
        day.validate();
        REQUIRE(day.wheel().config().selectedValue == 4);

        ElementState state = day.evaluate(Context(200, 30));
        REQUIRE(state.id == "weekday");
        REQUIRE(state.child("heading")->label == "Most productive day");

        const ElementState* wheel = state.child("wheel");
        REQUIRE(wheel->value == 1.0f);
        REQUIRE(wheel->children.size() == 7);
        REQUIRE(wheel->child("item.0")->child("label")->label == "Friday");
        REQUIRE(wheel->child("item.0")->opacity == WHEEL_SELECTED_OPACITY);
        REQUIRE(wheel->child("item.1")->opacity == WHEEL_IDLE_OPACITY);
    }

    SECTION("selection outside the values fails validation") {
        day.value = 7;
        REQUIRE_THROWS_AS(day.validate(), ConfigurationError);
    }

    SECTION("spin and settle cues") {
        day.soundFrame = 45;
        day.validate();
        CueSheet cues = day.cues();
        REQUIRE(cues.size() == 2);
        REQUIRE(cues.cues()[0].id == "wheel.weekday.spin");
        REQUIRE(cues.cues()[0].triggerFrame == 45);
        REQUIRE(cues.cues()[1].id == "wheel.weekday.settle");
        REQUIRE(cues.cues()[1].triggerFrame == day.wheel().settleFrame());
    }
}

TEST_CASE("Productivity panel", "[productivity]") {
    Productivity panel;
    panel.weekday = 5;
    panel.hour = 9;
    panel.validate();

    SECTION("selections reach the wheels") {
        REQUIRE(panel.weekdayWheel().wheel().config().selectedValue == 5);
        REQUIRE(panel.hourWheel().wheel().config().selectedValue == 9);
        REQUIRE(panel.hourWheel().wheel().label(9) == "9 am");
    }

    SECTION("state tree") {
        ElementState state = panel.evaluate(Context(250, 30));
        REQUIRE(state.id == "productivity");
        REQUIRE(state.child("weekday") != nullptr);
        REQUIRE(state.child("hour") != nullptr);
        REQUIRE(state.child("graph")->children.size() == 24);
        REQUIRE(state.child("weekday")->child("wheel")->child("item.0")->child("label")->label == "Saturday");
    }

    SECTION("cues in local frames") {
        std::vector<Frame> frames;
        for (const Cue& cue : panel.cues().cues()) {
            frames.push_back(cue.triggerFrame);
        }
        REQUIRE(frames == std::vector<Frame>{30, 45, 70, 160, 170});
        REQUIRE(panel.cues().cues()[0].assetId == AUDIO_BARS_ANIMATE);
    }

    SECTION("custom graph data") {
        Productivity custom;
        custom.graphData({1, 2, 3});
        custom.validate();
        REQUIRE(custom.graph().barCount() == 3);
        REQUIRE(custom.graph().bar(2, 1000).mostProductive);
    }
}

// =============================================================================
// Tablet
// =============================================================================

TEST_CASE("Tablet fullscreen progress", "[productivity][tablet]") {
    Tablet tablet;
    tablet.validate();

    SECTION("flat before the entry") {
        REQUIRE(tablet.toFullscreen(0) == 0.0f);
        REQUIRE(tablet.toFullscreen(30) == 0.0f);
    }

    SECTION("reaches the fullscreen amount after sixteen frames") {
        REQUIRE(tablet.toFullscreen(38) > 0.0f);
        REQUIRE(tablet.toFullscreen(38) < 0.68f);
        REQUIRE_THAT(tablet.toFullscreen(46), WithinAbs(0.68f, 1e-6f));
        REQUIRE_THAT(tablet.toFullscreen(150), WithinAbs(0.68f, 1e-6f));
    }

    SECTION("zooms back out over the hide duration") {
        float mid = tablet.toFullscreen(170);
        REQUIRE(mid > 0.0f);
        REQUIRE(mid < 0.68f);
        REQUIRE_THAT(tablet.toFullscreen(195), WithinAbs(0.0f, 1e-6f));
    }

    SECTION("never leaves [0, fullscreenAmount]") {
        for (Frame f = 0; f < 220; ++f) {
            float p = tablet.toFullscreen(f);
            REQUIRE(p >= 0.0f);
            REQUIRE(p <= 0.68f + 1e-6f);
        }
    }
}

TEST_CASE("Tablet state tree", "[productivity][tablet]") {
    Tablet tablet;

    SECTION("used before validate") {
        REQUIRE_THROWS_AS(tablet.zoom(), std::runtime_error);
    }

    tablet.validate();

    SECTION("device pivots on the bottom-left corner") {
        REQUIRE(tablet.zoom().config().frameOrigin == glm::vec3(0.0f, 1080.0f, 0.0f));
    }

    SECTION("layers at fullscreen") {
        ElementState state = tablet.evaluate(Context(100, 30));
        REQUIRE(state.id == "tablet");
        REQUIRE_THAT(*state.value, WithinAbs(0.68f, 1e-6f));

        const ElementState* frame = state.child("frame");
        REQUIRE(frame != nullptr);
        REQUIRE(frame->child("device")->assetId == "tablet.svg");

        const ElementState* screen = state.child("screen");
        REQUIRE(screen != nullptr);
        REQUIRE(screen->child("productivity") != nullptr);
    }

    SECTION("cues") {
        CueSheet cues = tablet.cues();
        REQUIRE(cues.cues().front().id == "tablet.enter");
        REQUIRE(cues.cues().front().triggerFrame == 0);
        REQUIRE(cues.size() == 6);
    }
}

TEST_CASE("Tablet rejects a scene shorter than its entry", "[productivity][tablet]") {
    Tablet tablet;
    tablet.sceneLength = 40;
    REQUIRE_THROWS_AS(tablet.validate(), ConfigurationError);
}

// =============================================================================
// StarsGiven
// =============================================================================

TEST_CASE("StarsGiven panel", "[productivity][stars]") {
    StarsGiven stars;
    stars.validate();

    SECTION("opaque and unzoomed before the zoom") {
        ElementState state = stars.evaluate(Context(100, 30));
        REQUIRE(state.value == 0.0f);
        REQUIRE(state.opacity == 1.0f);
        REQUIRE(state.child("text")->child("count")->label == "42");
        REQUIRE(state.child("text")->child("count")->value == 42.0f);
    }

    SECTION("fully zoomed between the springs") {
        REQUIRE(stars.zoomProgress(Context(150, 30)) == 0.0f);
        ElementState state = stars.evaluate(Context(250, 30));
        REQUIRE_THAT(*state.value, WithinAbs(1.0f, 1e-6f));
        REQUIRE_THAT(state.opacity, WithinAbs(0.3f, 1e-5f));
    }

    SECTION("text fades in then out") {
        REQUIRE(stars.evaluate(Context(10, 30)).child("text")->opacity == 0.0f);
        REQUIRE(stars.evaluate(Context(60, 30)).child("text")->opacity == 1.0f);
        REQUIRE(stars.evaluate(Context(150, 30)).child("text")->opacity == 0.0f);
    }

    SECTION("whoosh cue") {
        REQUIRE(stars.cues().size() == 1);
        REQUIRE(stars.cues().cues()[0].triggerFrame == 10);
        REQUIRE(stars.cues().cues()[0].assetId == AUDIO_STARS_WHOOSH);
    }
}

TEST_CASE("StarsGiven counts hits", "[productivity][stars]") {
    StarsGiven stars;
    stars.hits({40, 52});
    stars.validate();

    auto count = [&](Frame f) {
        return *stars.evaluate(Context(f, 30)).child("text")->child("count")->value;
    };
    auto flash = [&](Frame f) {
        return stars.evaluate(Context(f, 30)).child("text")->child("flash")->opacity;
    };

    REQUIRE(count(39) == 0.0f);
    REQUIRE(count(40) == 1.0f);
    REQUIRE(count(60) == 2.0f);

    REQUIRE(flash(40) == 1.0f);
    REQUIRE(flash(41) == 0.5f);
    REQUIRE(flash(46) == 0.0f);
}

TEST_CASE("StarsGiven following a scene needs a composition", "[productivity][stars]") {
    StarsGiven stars;
    stars.followTransition("tablet");
    stars.validate();

    REQUIRE(stars.followedScene() == "tablet");
    REQUIRE_THROWS_AS(stars.evaluate(Context(200, 30)), std::runtime_error);
}

TEST_CASE("StarsGiven checks its fade", "[productivity][stars]") {
    StarsGiven stars;
    stars.fadeOutStart = 120;
    stars.fadeOutEnd = 100;
    REQUIRE_THROWS_AS(stars.validate(), ConfigurationError);
}
