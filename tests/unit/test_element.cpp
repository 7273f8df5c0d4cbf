/**
 * @file test_element.cpp
 * @brief Unit tests for element parameters, state output and scene config
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <reel/composition.h>
#include <reel/config.h>
#include <reel/interpolate.h>

using namespace reel;
using Catch::Matchers::WithinAbs;

namespace {

class Fade : public Element {
public:
    Param<int> length{"length", 30, 1, 600};
    Param<float> peak{"peak", 1.0f, 0.0f, 1.0f};
    Param<bool> invert{"invert", false};

    Fade() {
        registerParam(length);
        registerParam(peak);
        registerParam(invert);
    }

    std::string name() const override { return "Fade"; }

    ElementState evaluate(const Context& ctx) const override {
        ElementState s;
        float v = interpolate(static_cast<float>(ctx.frame()), {0.0f, static_cast<float>(length)},
                              {0.0f, peak}, Extrapolation::clamped());
        s.opacity = invert ? peak - v : v;
        return s;
    }
};

} // namespace

TEST_CASE("Param direct access", "[element][param]") {
    Fade fade;
    REQUIRE(fade.length.get() == 30);
    fade.length = 60;
    REQUIRE(fade.length.get() == 60);
    REQUIRE(fade.length.min() == 1);
    REQUIRE(fade.length.max() == 600);
}

TEST_CASE("Element setParam/getParam", "[element][param]") {
    Fade fade;
    float out[4] = {0};

    SECTION("declarations list every parameter") {
        std::vector<ParamDecl> decls = fade.params();
        REQUIRE(decls.size() == 3);
        REQUIRE(decls[0].name == "length");
        REQUIRE(decls[0].type == ParamType::Int);
        REQUIRE(decls[2].type == ParamType::Bool);
        REQUIRE(std::string(paramTypeName(decls[1].type)) == "float");
    }

    SECTION("setParam writes the value") {
        float value[4] = {90, 0, 0, 0};
        REQUIRE(fade.setParam("length", value));
        REQUIRE(fade.getParam("length", out));
        REQUIRE(out[0] == 90.0f);
    }

    SECTION("bool parameters read non-zero as true") {
        float value[4] = {1, 0, 0, 0};
        REQUIRE(fade.setParam("invert", value));
        REQUIRE(fade.invert.get());
    }

    SECTION("out-of-range values are rejected and leave the value alone") {
        float value[4] = {1000, 0, 0, 0};
        REQUIRE_FALSE(fade.setParam("length", value));
        REQUIRE(fade.length.get() == 30);
    }

    SECTION("unknown param returns false") {
        float value[4] = {0};
        REQUIRE_FALSE(fade.setParam("nonexistent", value));
        REQUIRE_FALSE(fade.getParam("nonexistent", out));
    }
}

TEST_CASE("ElementState JSON", "[element]") {
    ElementState root;
    root.id = "panel";
    root.opacity = 0.5f;
    root.transform.translate(10, 20);
    root.label = "Stars Given";

    ElementState child;
    child.id = "count";
    child.value = 42.0f;
    root.children.push_back(child);

    nlohmann::json j = root.toJson();
    REQUIRE(j["id"] == "panel");
    REQUIRE(j["label"] == "Stars Given");
    REQUIRE(j["transform"]["css"] == "translate(10px, 20px)");
    REQUIRE(j["children"][0]["value"] == 42.0f);
    REQUIRE_FALSE(j.contains("asset"));

    REQUIRE(root.child("count") != nullptr);
    REQUIRE(root.child("missing") == nullptr);
}

TEST_CASE("SceneConfig typed getters", "[config]") {
    SceneConfig config = SceneConfig::fromJson({
        {"fps", 30},
        {"scale", 1.5},
        {"loop", true},
        {"weekday", 3},
        {"title", "Stars"},
        {"graph", {1, 2, 3}},
        {"tablet", {{"radius", 300}}}
    });

    SECTION("present keys") {
        REQUIRE(config.getInt("fps", 0) == 30);
        REQUIRE_THAT(config.getFloat("scale", 0.0f), WithinAbs(1.5f, 1e-6f));
        REQUIRE(config.getBool("loop", false));
        REQUIRE(config.getString("title", "") == "Stars");
        REQUIRE(config.getFloats("graph", {}).size() == 3);
        REQUIRE(config.getInts("graph", {}) == std::vector<int>{1, 2, 3});
    }

    SECTION("integers are accepted where strings are expected") {
        REQUIRE(config.getString("weekday", "") == "3");
    }

    SECTION("missing keys fall back to defaults") {
        REQUIRE(config.getInt("missing", 7) == 7);
        REQUIRE(config.section("missing").getFloat("x", 2.0f) == 2.0f);
    }

    SECTION("nested sections") {
        REQUIRE(config.section("tablet").getInt("radius", 0) == 300);
    }

    SECTION("wrong types name the key") {
        REQUIRE_THROWS_AS(config.getInt("scale", 0), ConfigurationError);
        REQUIRE_THROWS_AS(config.getBool("fps", false), ConfigurationError);
        REQUIRE_THROWS_AS(config.getFloats("title", {}), ConfigurationError);
        REQUIRE_THROWS_AS(config.section("fps"), ConfigurationError);
    }

    SECTION("root must be an object") {
        REQUIRE_THROWS_AS(SceneConfig::fromJson(nlohmann::json::array()), ConfigurationError);
    }

    SECTION("missing file") {
        REQUIRE_THROWS_AS(SceneConfig::fromFile("/nonexistent/scene.json"), ConfigurationError);
    }
}

TEST_CASE("SceneConfig::applyParams", "[config]") {
    Composition comp(30, 100);
    Fade& fade = comp.add<Fade>("fade");

    SECTION("writes known parameters") {
        SceneConfig config = SceneConfig::fromJson({
            {"params", {{"fade", {{"length", 45}, {"invert", true}}}}}
        });
        REQUIRE(config.applyParams(comp) == 2);
        REQUIRE(fade.length.get() == 45);
        REQUIRE(fade.invert.get());
    }

    SECTION("unknown elements and parameters are skipped") {
        SceneConfig config = SceneConfig::fromJson({
            {"params", {{"ghost", {{"length", 45}}}, {"fade", {{"speed", 2}}}}}
        });
        REQUIRE(config.applyParams(comp) == 0);
        REQUIRE(fade.length.get() == 30);
    }

    SECTION("out-of-range values throw") {
        SceneConfig config = SceneConfig::fromJson({{"params", {{"fade", {{"length", 0}}}}}});
        REQUIRE_THROWS_AS(config.applyParams(comp), ConfigurationError);
    }

    SECTION("non-numeric values throw") {
        SceneConfig config = SceneConfig::fromJson({{"params", {{"fade", {{"length", "long"}}}}}});
        REQUIRE_THROWS_AS(config.applyParams(comp), ConfigurationError);
    }
}
