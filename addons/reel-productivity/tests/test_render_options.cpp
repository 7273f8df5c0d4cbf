/**
 * @file test_render_options.cpp
 * @brief Unit tests for reel-render-state command line options
 */

#include <catch2/catch_test_macros.hpp>
#include "render_options.h"

using namespace reel;

namespace {

RenderOptions parse(const std::string& args) {
    CLI::App app{"test"};
    RenderOptions options;
    addRenderOptions(app, options);
    app.parse(args);
    return options;
}

} // namespace

TEST_CASE("Render options defaults", "[cli]") {
    RenderOptions options = parse("");
    REQUIRE(options.from == 0);
    REQUIRE_FALSE(options.to.has_value());
    REQUIRE(options.lastFrame(345) == 344);
}

TEST_CASE("Render options frame range", "[cli]") {
    SECTION("explicit range") {
        RenderOptions options = parse("--from 10 --to 20 --pretty");
        REQUIRE(options.pretty);
        REQUIRE(options.lastFrame(345) == 20);
    }

    SECTION("frame zero is a valid last frame") {
        REQUIRE(parse("--to 0").lastFrame(345) == 0);
    }

    SECTION("negative frames are rejected") {
        REQUIRE_THROWS_AS(parse("--to -5"), CLI::ValidationError);
        REQUIRE_THROWS_AS(parse("--from -1"), CLI::ValidationError);
    }

    SECTION("range past the video") {
        REQUIRE_THROWS_AS(parse("--to 345").lastFrame(345), ConfigurationError);
    }

    SECTION("empty range") {
        REQUIRE_THROWS_AS(parse("--from 30 --to 20").lastFrame(345), ConfigurationError);
    }
}
