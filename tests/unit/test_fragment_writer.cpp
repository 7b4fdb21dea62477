/**
 * @file test_fragment_writer.cpp
 * @brief Unit tests for snapshot and delta serialization
 */

#include <catch2/catch_test_macros.hpp>
#include <tessera/io/fragment_writer.h>
#include <tessera/refinement_engine.h>
#include "../test_images.h"

#include <sstream>
#include <string>

using namespace tessera;
using namespace tessera::test;
using json = nlohmann::json;

TEST_CASE("Snapshot lists active fragments by id", "[writer]") {
    RefinementEngine engine;
    engine.reset(makeShared(noiseImage(20, 10)));
    engine.step();

    json snapshot = io::snapshotToJson(engine);
    REQUIRE(snapshot["width"] == 20);
    REQUIRE(snapshot["height"] == 10);
    REQUIRE(snapshot["maxFragments"] == 2000);
    REQUIRE(snapshot["fragmentCount"] == 4);
    REQUIRE(snapshot["fragments"].size() == 4);

    const json& first = snapshot["fragments"][0];
    REQUIRE(first["id"] == 2);
    REQUIRE(first["region"] == json::array({0.0, 0.0, 10.0, 5.0}));
    REQUIRE(first["color"].size() == 3);
    REQUIRE(first.contains("score"));
    REQUIRE(first.contains("weightedScore"));
}

TEST_CASE("Snapshot of an idle engine", "[writer]") {
    RefinementEngine engine;
    json snapshot = io::snapshotToJson(engine);
    REQUIRE(snapshot["width"] == 0);
    REQUIRE(snapshot["fragments"].empty());
}

TEST_CASE("Step deltas are single JSON lines", "[writer]") {
    RefinementEngine engine;
    engine.reset(makeShared(noiseImage(16, 16)));
    StepResult result = engine.step();

    std::ostringstream out;
    io::writeStepLine(out, result, 1);
    std::string text = out.str();
    REQUIRE(text.back() == '\n');
    REQUIRE(text.find('\n') == text.size() - 1);

    json line = json::parse(text);
    REQUIRE(line["step"] == 1);
    REQUIRE(line["removed"] == 1);
    REQUIRE(line["added"].size() == 4);
    REQUIRE(line["added"][3]["id"] == 5);
}

TEST_CASE("Reset lines carry the full replacement set", "[writer]") {
    RefinementEngine engine;
    engine.reset(makeShared(noiseImage(8, 8)));

    std::ostringstream out;
    io::writeResetLine(out, engine, "image2");

    json line = json::parse(out.str());
    REQUIRE(line["reset"] == "image2");
    REQUIRE(line["snapshot"]["fragmentCount"] == 1);
    REQUIRE(line["snapshot"]["fragments"][0]["id"] == 1);
}

TEST_CASE("Snapshot write failures are reported", "[writer][errors]") {
    RefinementEngine engine;
    engine.reset(makeShared(noiseImage(8, 8)));
    REQUIRE_FALSE(io::writeSnapshot("/nonexistent/dir/snapshot.json", engine));
}
