/**
 * @file test_transform.cpp
 * @brief Unit tests for transform stacks, counter-rotation and opposing transforms
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <reel/transform.h>

using namespace reel;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("TransformState builds an ordered op list", "[transform]") {
    TransformState t;
    t.translate(10, 20).rotateX(45).scale(2);

    REQUIRE(t.size() == 3);
    REQUIRE(std::holds_alternative<Translate>(t.ops()[0]));
    REQUIRE(std::holds_alternative<Rotate>(t.ops()[1]));
    REQUIRE(std::holds_alternative<Scale>(t.ops()[2]));
    REQUIRE(t.css() == "translate(10px, 20px) rotateX(45deg) scale(2)");
}

TEST_CASE("Empty transform", "[transform]") {
    TransformState t;
    REQUIRE(t.empty());
    REQUIRE(t.css() == "none");
    REQUIRE(isIdentity(glm::mat3(t.matrix())));
}

TEST_CASE("Matrix composition applies ops left to right", "[transform]") {
    SECTION("translate then scale scales around the translated point") {
        TransformState t;
        t.translate(10, 0).scale(2);
        glm::vec4 p = t.matrix() * glm::vec4(1, 0, 0, 1);
        REQUIRE_THAT(p.x, WithinAbs(12.0f, 1e-5f));
    }

    SECTION("origin pivots the stack") {
        TransformState t;
        t.scale(2).origin(100, 100);
        glm::vec4 pivot = t.matrix() * glm::vec4(100, 100, 0, 1);
        REQUIRE_THAT(pivot.x, WithinAbs(100.0f, 1e-4f));
        REQUIRE_THAT(pivot.y, WithinAbs(100.0f, 1e-4f));
    }

    SECTION("skewX shifts x by tan(angle) * y") {
        TransformState t;
        t.skewX(45);
        glm::vec4 p = t.matrix() * glm::vec4(0, 1, 0, 1);
        REQUIRE_THAT(p.x, WithinAbs(1.0f, 1e-5f));
        REQUIRE_THAT(p.y, WithinAbs(1.0f, 1e-5f));
    }
}

TEST_CASE("then appends another stack", "[transform]") {
    TransformState a;
    a.translateX(5);
    TransformState b;
    b.rotateZ(90);
    a.then(b);
    REQUIRE(a.size() == 2);
    REQUIRE_THAT(a.css(), ContainsSubstring("rotateZ(90deg)"));
}

TEST_CASE("Perspective must be positive", "[transform]") {
    TransformState t;
    REQUIRE_THROWS_AS(t.perspective(0.0f), ConfigurationError);
    REQUIRE_THROWS_AS(t.perspective(-100.0f), ConfigurationError);
    REQUIRE_NOTHROW(t.perspective(1200.0f));
}

TEST_CASE("Counter-rotation cancels the parent's rotation", "[transform]") {
    SECTION("single axis") {
        TransformState parent;
        parent.translateZ(120).translateY(-40).rotateX(-72);
        glm::mat3 net = netRotation(parent, counterRotation(parent));
        REQUIRE(isIdentity(net));
    }

    SECTION("several axes in sequence") {
        TransformState parent;
        parent.rotateY(15).rotateX(-10).rotateZ(33);
        REQUIRE(isIdentity(netRotation(parent, counterRotation(parent))));
    }

    SECTION("without the counter-rotation the child stays rotated") {
        TransformState parent;
        parent.rotateX(30);
        REQUIRE_FALSE(isIdentity(netRotation(parent, TransformState())));
    }

    SECTION("counter-rotation lists inverse rotations in reverse order") {
        TransformState parent;
        parent.rotateY(10).rotateX(20);
        TransformState inverse = counterRotation(parent);
        REQUIRE(inverse.css() == "rotateX(-20deg) rotateY(-10deg)");
    }
}

TEST_CASE("OpposingTransform", "[transform]") {
    OpposingTransform zoom;

    SECTION("content is tilted at rest and flat at full progress") {
        REQUIRE(zoom.content(0.0f).css() ==
                "translate(350px, 480px) perspective(1200px) rotateY(15deg) rotateX(-10deg) "
                "skewX(7deg) skewY(-4deg) scale(0.4)");
        TransformState flat = zoom.content(1.0f);
        REQUIRE_THAT(zoom.contentScale(1.0f), WithinAbs(1.0f, 1e-6f));
        REQUIRE_THAT(flat.css(), ContainsSubstring("rotateY(0deg)"));
    }

    SECTION("frame starts untilted and rotates the opposite way") {
        REQUIRE_THAT(zoom.frame(0.0f).css(), ContainsSubstring("rotateY(-0deg)"));
        REQUIRE_THAT(zoom.frame(1.0f).css(), ContainsSubstring("rotateY(-15deg)"));
        REQUIRE_THAT(zoom.frame(1.0f).css(), ContainsSubstring("rotateX(10deg)"));
    }

    SECTION("scales") {
        REQUIRE_THAT(zoom.masterScale(0.0f), WithinAbs(0.8f, 1e-6f));
        REQUIRE_THAT(zoom.masterScale(1.0f), WithinAbs(1.0f, 1e-6f));
        REQUIRE_THAT(zoom.frameCompensation(0.0f), WithinAbs(1.0f, 1e-6f));
        REQUIRE_THAT(zoom.frameCompensation(1.0f), WithinAbs(1.3f / 0.6f, 1e-5f));
        REQUIRE_THAT(zoom.contentScale(0.0f), WithinAbs(0.4f, 1e-6f));
    }

    SECTION("pivot point is fixed at rest") {
        glm::vec4 origin = zoom.frame(0.0f).matrix() * glm::vec4(0, 0, 0, 1);
        REQUIRE_THAT(origin.x, WithinAbs(0.0f, 1e-4f));
    }

    SECTION("invalid configuration") {
        OpposingTransformConfig bad;
        bad.contentRestScale = 1.0f;
        REQUIRE_THROWS_AS(OpposingTransform(bad), ConfigurationError);
        bad = OpposingTransformConfig();
        bad.contentPerspective = 0.0f;
        REQUIRE_THROWS_AS(OpposingTransform(bad), ConfigurationError);
    }
}
