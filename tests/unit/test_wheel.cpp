/**
 * @file test_wheel.cpp
 * @brief Unit tests for circular wheel layout
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <reel/wheel.h>
#include <glm/gtc/constants.hpp>
#include <cmath>

using namespace reel;
using Catch::Matchers::WithinAbs;

namespace {

WheelConfig weekdayConfig(int selected) {
    WheelConfig config;
    config.values = {"Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday"};
    config.selectedValue = selected;
    config.radius = 130.0f;
    config.delay = 60;
    return config;
}

} // namespace

TEST_CASE("Wheel values wrap around", "[wheel]") {
    SECTION("slot 6 of 7 with selection 3 shows value 2") {
        WheelItem item = wheelItem(6, 7, 1.0f, 130.0f, 3);
        REQUIRE(item.value == 2);
    }

    SECTION("slot 0 shows the selected value") {
        REQUIRE(wheelItem(0, 7, 1.0f, 130.0f, 3).value == 3);
    }

    SECTION("every value appears exactly once") {
        std::vector<int> seen(24, 0);
        for (int i = 0; i < 24; ++i) {
            seen[wheelItem(i, 24, 0.5f, 300.0f, 14).value]++;
        }
        for (int count : seen) {
            REQUIRE(count == 1);
        }
    }
}

TEST_CASE("Exactly one item is selected once settled", "[wheel]") {
    int selected = 0;
    for (int i = 0; i < 7; ++i) {
        WheelItem item = wheelItem(i, 7, 1.0f, 130.0f, 3);
        if (item.isSelected) {
            ++selected;
            REQUIRE(item.opacity == WHEEL_SELECTED_OPACITY);
        } else {
            REQUIRE(item.opacity == WHEEL_IDLE_OPACITY);
        }
    }
    REQUIRE(selected == 1);
}

TEST_CASE("Nothing is selected while spinning", "[wheel]") {
    for (int i = 0; i < 7; ++i) {
        REQUIRE_FALSE(wheelItem(i, 7, 0.5f, 130.0f, 3).isSelected);
    }
}

TEST_CASE("Wheel geometry", "[wheel]") {
    SECTION("settled slot 0 faces the viewer at full radius") {
        WheelItem item = wheelItem(0, 7, 1.0f, 130.0f, 3);
        REQUIRE_THAT(item.angle, WithinAbs(0.0f, 1e-5f));
        REQUIRE_THAT(item.depthZ, WithinAbs(130.0f, 1e-3f));
        REQUIRE_THAT(item.verticalY, WithinAbs(0.0f, 1e-3f));
        REQUIRE(item.facingViewer);
    }

    SECTION("slots are evenly spaced") {
        WheelItem a = wheelItem(1, 4, 1.0f, 100.0f, 0);
        REQUIRE_THAT(a.angle, WithinAbs(-glm::half_pi<float>(), 1e-5f));
        REQUIRE_THAT(a.verticalY, WithinAbs(-100.0f, 1e-3f));
    }

    SECTION("opposite slot faces away") {
        REQUIRE_FALSE(wheelItem(2, 4, 1.0f, 100.0f, 0).facingViewer);
    }

    SECTION("rotation starts one full turn away") {
        REQUIRE_THAT(wheelRotationOffset(0.0f), WithinAbs(1.0f, 1e-6f));
        REQUIRE_THAT(wheelRotationOffset(1.0f), WithinAbs(0.0f, 1e-6f));
        REQUIRE_THAT(wheelRotationOffset(2.0f), WithinAbs(0.0f, 1e-6f));
    }
}

TEST_CASE("Wheel item labels stay upright", "[wheel]") {
    WheelItem item = wheelItem(3, 7, 0.4f, 130.0f, 3);
    TransformState slot = wheelItemTransform(item);
    TransformState label = wheelLabelTransform(item);
    REQUIRE(isIdentity(netRotation(slot, label)));
}

TEST_CASE("Wheel argument checks", "[wheel]") {
    REQUIRE_THROWS_AS(wheelItem(0, 0, 1.0f, 130.0f, 0), ConfigurationError);
    REQUIRE_THROWS_AS(wheelItem(7, 7, 1.0f, 130.0f, 0), ConfigurationError);
    REQUIRE_THROWS_AS(wheelItem(0, 7, 1.0f, 130.0f, 7), ConfigurationError);
    REQUIRE_THROWS_AS(wheelItem(0, 7, 1.0f, 130.0f, -1), ConfigurationError);
}

TEST_CASE("formatHour", "[wheel]") {
    REQUIRE(formatHour(0) == "12 am");
    REQUIRE(formatHour(5) == "5 am");
    REQUIRE(formatHour(12) == "12 pm");
    REQUIRE(formatHour(13) == "1 pm");
    REQUIRE(formatHour(23) == "11 pm");

    LabelFormatter fmt = hourLabelFormatter();
    REQUIRE(fmt("14") == "2 pm");
    REQUIRE_THROWS_AS(fmt("noon"), ConfigurationError);
    REQUIRE_THROWS_AS(fmt("5abc"), ConfigurationError);
    REQUIRE_THROWS_AS(fmt("14 "), ConfigurationError);
    REQUIRE_THROWS_AS(fmt("24"), ConfigurationError);
    REQUIRE_THROWS_AS(fmt(""), ConfigurationError);
}

TEST_CASE("Wheel over time", "[wheel]") {
    Wheel wheel(weekdayConfig(3));

    SECTION("idle before the delay") {
        REQUIRE(wheel.rotationProgress(0) == 0.0f);
        REQUIRE(wheel.rotationProgress(60) == 0.0f);
    }

    SECTION("spin completes at the settle frame") {
        REQUIRE(wheel.settleFrame() == 160);
        REQUIRE(wheel.rotationProgress(110) == 0.5f);
        REQUIRE(wheel.rotationProgress(160) == 1.0f);
        REQUIRE(wheel.rotationProgress(400) == 1.0f);
    }

    SECTION("highlight waits for the settle margin") {
        REQUIRE_FALSE(wheel.settled(65));
        REQUIRE(wheel.settled(66));
    }

    SECTION("items at a frame") {
        std::vector<WheelItem> items = wheel.items(Context(200, 30));
        REQUIRE(items.size() == 7);
        REQUIRE(items[0].isSelected);
        REQUIRE(wheel.label(items[6].value) == "Wednesday");
    }

    SECTION("selection outside the values is rejected") {
        REQUIRE_THROWS_AS(Wheel(weekdayConfig(7)), ConfigurationError);
    }

    SECTION("formatter is applied to labels") {
        WheelConfig hours;
        for (int h = 0; h < 24; ++h) hours.values.push_back(std::to_string(h));
        hours.selectedValue = 14;
        hours.labelFormatter = hourLabelFormatter();
        Wheel hourWheel(hours);
        REQUIRE(hourWheel.label(14) == "2 pm");
    }

    SECTION("formatter failures surface at construction") {
        WheelConfig bad;
        bad.values = {"1", "x"};
        bad.labelFormatter = hourLabelFormatter();
        REQUIRE_THROWS_AS(Wheel(bad), ConfigurationError);
    }
}

TEST_CASE("Settled seven-item wheel, slot 4", "[wheel]") {
    WheelItem item = wheelItem(4, 7, 1.0f, 130.0f, 3);
    float angle = (4.0f / 7.0f) * -glm::two_pi<float>();

    REQUIRE(item.value == 0);
    REQUIRE_THAT(item.angle, WithinAbs(angle, 1e-5f));
    REQUIRE_THAT(item.depthZ, WithinAbs(std::cos(angle) * 130.0f, 1e-3f));
    REQUIRE_THAT(item.verticalY, WithinAbs(std::sin(angle) * 130.0f, 1e-3f));
    REQUIRE_FALSE(item.isSelected);
}

TEST_CASE("Wheel layout is deterministic", "[wheel]") {
    Wheel wheel(weekdayConfig(3));
    for (Frame f : {0, 61, 90, 159, 160, 300}) {
        std::vector<WheelItem> a = wheel.items(Context(f, 30));
        std::vector<WheelItem> b = wheel.items(Context(f, 30));
        for (size_t i = 0; i < a.size(); ++i) {
            REQUIRE(a[i].angle == b[i].angle);
            REQUIRE(a[i].isSelected == b[i].isSelected);
        }
    }
}
