#include "core/output_registry.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace scape::core;

TEST_CASE("OutputRegistry packs new outputs left to right", "[output_registry]") {
    OutputRegistry registry;
    auto a = registry.add("DP-1", {1920, 1080, 60000}, true);
    auto b = registry.add("HDMI-A-1", {1280, 1024, 60000}, true);

    REQUIRE(a != INVALID_ID);
    REQUIRE(b != a);
    REQUIRE(registry.find(a)->rect() == Rect{0, 0, 1920, 1080});
    REQUIRE(registry.find(b)->rect() == Rect{1920, 0, 1280, 1024});
    REQUIRE(registry.layout_bounds() == Rect{0, 0, 3200, 1080});
    REQUIRE(registry.find_by_name("HDMI-A-1")->id == b);
    REQUIRE(registry.find_by_name("missing") == nullptr);
}

TEST_CASE("OutputRegistry honors placement hints and scale", "[output_registry]") {
    OutputRegistry registry;
    auto id = registry.add("eDP-1", {2880, 1800, 60000}, true,
                           OutputPlacementHint{.position = {-1440, 200}, .scale = 2.0});

    const auto* output = registry.find(id);
    REQUIRE(output->scale == 2.0);
    REQUIRE(output->rect() == Rect{-1440, 200, 1440, 900});

    REQUIRE_FALSE(registry.set_scale(id, 0.0));
    REQUIRE(registry.set_scale(id, 1.0));
    REQUIRE(registry.find(id)->rect().width == 2880);
}

TEST_CASE("OutputRegistry lookups skip disabled outputs", "[output_registry]") {
    OutputRegistry registry;
    auto left = registry.add("left", {1000, 1000, 60000}, true);
    auto right = registry.add("right", {1000, 1000, 60000}, true);

    REQUIRE(registry.output_at({1500, 10})->id == right);
    REQUIRE(registry.first_enabled()->id == left);

    registry.set_enabled(left, false);
    REQUIRE(registry.output_at({10, 10}) == nullptr);
    REQUIRE(registry.first_enabled()->id == right);
    REQUIRE(registry.layout_bounds() == Rect{1000, 0, 1000, 1000});
}

TEST_CASE("OutputRegistry nearest_enabled measures distance to rectangles", "[output_registry]") {
    OutputRegistry registry;
    auto left = registry.add("left", {1000, 1000, 60000}, true);
    auto right = registry.add("right", {1000, 1000, 60000}, true);

    REQUIRE(registry.nearest_enabled({-50, 500})->id == left);
    REQUIRE(registry.nearest_enabled({2500, 500})->id == right);
    REQUIRE(registry.nearest_enabled({500, 500}, left)->id == right);

    SECTION("Ties keep registry order") {
        OutputRegistry stacked;
        auto top = stacked.add("top", {100, 100, 60000}, true,
                               OutputPlacementHint{.position = {0, 0}});
        stacked.add("bottom", {100, 100, 60000}, true, OutputPlacementHint{.position = {0, 200}});
        REQUIRE(stacked.nearest_enabled({50, 150})->id == top);
    }
}

TEST_CASE("OutputRegistry clamps points into the layout", "[output_registry]") {
    OutputRegistry registry;
    REQUIRE(registry.clamp_to_layout({5, 5}) == Point{5, 5});

    registry.add("only", {800, 600, 60000}, true);
    REQUIRE(registry.clamp_to_layout({100, 100}) == Point{100, 100});
    REQUIRE(registry.clamp_to_layout({-20, 5000}) == Point{0, 599});
    REQUIRE(registry.clamp_to_layout({900, 50}) == Point{799, 50});
}

TEST_CASE("OutputRegistry remove forgets the output", "[output_registry]") {
    OutputRegistry registry;
    auto id = registry.add("DP-1", {1920, 1080, 60000}, true);
    REQUIRE(registry.remove(id));
    REQUIRE_FALSE(registry.remove(id));
    REQUIRE(registry.find(id) == nullptr);
    REQUIRE(registry.empty());

    // Ids are never reused
    auto next = registry.add("DP-1", {1920, 1080, 60000}, true);
    REQUIRE(next != id);
}
