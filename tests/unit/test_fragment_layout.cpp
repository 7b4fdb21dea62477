/**
 * @file test_fragment_layout.cpp
 * @brief Unit tests for mapping fragments to box instances
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <tessera/fragment_layout.h>
#include <tessera/refinement_engine.h>
#include "../test_images.h"

using namespace tessera;
using namespace tessera::test;
using Catch::Matchers::WithinAbs;

TEST_CASE("Root box spans the whole extent", "[layout]") {
    RefinementEngine engine;
    engine.reset(makeShared(uniformImage(40, 20, Color(0.6f, 0.6f, 0.6f))));

    FragmentLayout layout;
    layout.applyReset(engine);
    REQUIRE(layout.size() == 1);

    const FragmentBox* box = layout.find(1);
    REQUIRE(box != nullptr);
    REQUIRE_THAT(box->position.x, WithinAbs(0.0, 1e-6));
    REQUIRE_THAT(box->position.y, WithinAbs(0.0, 1e-6));
    REQUIRE_THAT(box->scale.x, WithinAbs(2.0 - 0.002, 1e-6));
    REQUIRE_THAT(box->scale.y, WithinAbs(2.0 - 0.002, 1e-6));

    SECTION("depth follows brightness") {
        REQUIRE_THAT(box->scale.z, WithinAbs(0.06, 1e-6));
        REQUIRE_THAT(box->position.z, WithinAbs(0.03, 1e-6));
    }

    SECTION("color is converted to linear light") {
        REQUIRE_THAT(box->color.r, WithinAbs(Color::srgbToLinear(0.6f), 1e-6));
    }
}

TEST_CASE("Quadrant boxes land in their corners", "[layout]") {
    RefinementEngine engine;
    engine.reset(makeShared(noiseImage(16, 16)));
    FragmentLayout layout;
    layout.applyReset(engine);

    StepResult result = engine.step();
    REQUIRE(layout.applyStep(result));

    const FragmentBox* topLeft = layout.find(result.added[0].id);
    const FragmentBox* bottomRight = layout.find(result.added[3].id);
    REQUIRE(topLeft != nullptr);
    REQUIRE(bottomRight != nullptr);

    // Y points up: the top-left quadrant is at negative X, positive Y
    REQUIRE_THAT(topLeft->position.x, WithinAbs(-0.5, 1e-6));
    REQUIRE_THAT(topLeft->position.y, WithinAbs(0.5, 1e-6));
    REQUIRE_THAT(bottomRight->position.x, WithinAbs(0.5, 1e-6));
    REQUIRE_THAT(bottomRight->position.y, WithinAbs(-0.5, 1e-6));
    REQUIRE_THAT(topLeft->scale.x, WithinAbs(1.0 - 0.002, 1e-6));
}

TEST_CASE("Layout mirrors the engine through deltas", "[layout]") {
    RefinementEngine engine;
    engine.reset(makeShared(noiseImage(32, 24)));
    FragmentLayout layout;
    layout.applyReset(engine);

    for (int i = 0; i < 50; i++) {
        StepResult result = engine.step();
        REQUIRE(layout.applyStep(result));
        REQUIRE(layout.find(result.removed.id) == nullptr);
    }
    REQUIRE(layout.size() == engine.fragmentCount());

    FragmentLayout rebuilt;
    rebuilt.applyReset(engine);
    REQUIRE(rebuilt.size() == layout.size());
    for (const auto& [id, box] : rebuilt.boxes()) {
        const FragmentBox* mirrored = layout.find(id);
        REQUIRE(mirrored != nullptr);
        REQUIRE(mirrored->position == box.position);
        REQUIRE(mirrored->scale == box.scale);
        REQUIRE(mirrored->color == box.color);
    }
}

TEST_CASE("Layout ignores deltas it cannot apply", "[layout]") {
    FragmentLayout layout;

    SECTION("no progress") {
        REQUIRE_FALSE(layout.applyStep(StepResult{}));
    }

    SECTION("unknown removed id") {
        StepResult result;
        result.progress = true;
        result.removed.id = 42;
        REQUIRE_FALSE(layout.applyStep(result));
        REQUIRE(layout.size() == 0);
    }
}

TEST_CASE("Custom layout extent", "[layout]") {
    LayoutConfig config;
    config.extent = 10.0f;
    config.gap = 0.0f;

    RefinementEngine engine;
    engine.reset(makeShared(noiseImage(8, 8)));
    FragmentLayout layout(config);
    layout.applyReset(engine);

    REQUIRE_THAT(layout.find(1)->scale.x, WithinAbs(10.0, 1e-6));
}
