// =============================================================================
// Runnel - Water Simulation Tests
// =============================================================================

#include <catch2/catch_all.hpp>
#include "hydro/WaterSimulation.h"
#include <cmath>
#include <limits>
#include <vector>

using namespace Runnel;
using Catch::Approx;
using Catch::Matchers::WithinAbs;

namespace {

std::vector<f32> flatElevation(u32 width, u32 height, f32 value) {
    return std::vector<f32>(static_cast<usize>(width) * height, value);
}

bool allFiniteAndNonNegative(const std::vector<f32>& water) {
    for (f32 w : water) {
        if (!std::isfinite(w) || w < 0.0f) return false;
    }
    return true;
}

} // namespace

TEST_CASE("WaterSimulation initialization", "[water][sim]") {
    WaterSimulation sim;
    REQUIRE_FALSE(sim.isInitialized());

    SECTION("Valid input allocates zeroed water") {
        REQUIRE(sim.initialize(flatElevation(4, 3, 1.0f), 4, 3, 0.5f));
        REQUIRE(sim.isInitialized());
        REQUIRE(sim.getWidth() == 4);
        REQUIRE(sim.getHeight() == 3);
        REQUIRE(sim.getCellSize() == Approx(0.5f));
        REQUIRE(sim.getWater().size() == 12);
        REQUIRE(sim.totalWaterDepth() == 0.0);
    }

    SECTION("Malformed input is rejected") {
        REQUIRE_FALSE(sim.initialize(flatElevation(4, 3, 1.0f), 4, 4, 0.5f));
        REQUIRE_FALSE(sim.initialize({}, 0, 0, 0.5f));
        REQUIRE_FALSE(sim.initialize(flatElevation(2, 2, 1.0f), 2, 2, 0.0f));
        REQUIRE_FALSE(sim.isInitialized());
    }

    SECTION("Rejected input keeps the previous terrain") {
        REQUIRE(sim.initialize(flatElevation(3, 3, 1.0f), 3, 3, 1.0f));
        sim.setWaterDepth(1, 1, 0.2f);
        REQUIRE_FALSE(sim.initialize(flatElevation(5, 5, 1.0f), 5, 4, 1.0f));
        REQUIRE(sim.getWidth() == 3);
        REQUIRE(sim.getHeight() == 3);
        REQUIRE(sim.getWaterDepth(1, 1) == Approx(0.2f));
    }

    SECTION("Re-initialization replaces the grid") {
        REQUIRE(sim.initialize(flatElevation(3, 3, 1.0f), 3, 3, 1.0f));
        sim.setWaterDepth(0, 0, 1.0f);
        REQUIRE(sim.initialize(flatElevation(6, 2, 0.0f), 6, 2, 0.25f));
        REQUIRE(sim.getWidth() == 6);
        REQUIRE(sim.getHeight() == 2);
        REQUIRE(sim.totalWaterDepth() == 0.0);
    }
}

TEST_CASE("WaterSimulation step without terrain is a no-op", "[water][sim]") {
    WaterSimulation sim;
    sim.setRaining(true);
    sim.step();
    REQUIRE(sim.getStepCount() == 0);
    REQUIRE(sim.getWater().empty());
}

TEST_CASE("Water spreads from a raised column", "[water][flow]") {
    WaterSimulation sim;
    REQUIRE(sim.initialize(flatElevation(3, 3, 0.0f), 3, 3, 1.0f));
    sim.setWaterDepth(1, 1, 1.0f);

    sim.step();

    // Slope 1 over four equal neighbours: rate 0.5, split evenly
    REQUIRE_THAT(sim.getWaterDepth(1, 1), WithinAbs(0.5, 1e-6));
    REQUIRE_THAT(sim.getWaterDepth(0, 1), WithinAbs(0.125, 1e-6));
    REQUIRE_THAT(sim.getWaterDepth(2, 1), WithinAbs(0.125, 1e-6));
    REQUIRE_THAT(sim.getWaterDepth(1, 0), WithinAbs(0.125, 1e-6));
    REQUIRE_THAT(sim.getWaterDepth(1, 2), WithinAbs(0.125, 1e-6));
    REQUIRE(sim.getWaterDepth(0, 0) == 0.0f);
    REQUIRE(sim.getStepCount() == 1);
}

TEST_CASE("Water drains off the grid edge", "[water][flow]") {
    WaterSimulation sim;
    REQUIRE(sim.initialize(flatElevation(1, 1, 0.0f), 1, 1, 1.0f));
    sim.setWaterDepth(0, 0, 1.0f);

    f32 previous = sim.getWaterDepth(0, 0);
    for (int i = 0; i < 100; ++i) {
        sim.step();
        f32 depth = sim.getWaterDepth(0, 0);
        REQUIRE(std::isfinite(depth));
        REQUIRE(depth >= 0.0f);
        REQUIRE(depth <= previous);
        previous = depth;
    }

    REQUIRE(previous <= Physics::kMinFlowThreshold);
}

TEST_CASE("Edge cells below the drain level keep their water on the grid", "[water][flow]") {
    WaterSimulation sim;
    REQUIRE(sim.initialize(std::vector<f32>{-2.0f, -5.0f, -2.0f}, 3, 1, 1.0f));
    sim.setWaterDepth(0, 0, 1.0f);

    sim.step();

    // Surface at -1 m: only the 4 m drop into the middle cell counts.
    // Slope 4 gives rate 0.25 * (1 + 2) = 0.75, all of it to the middle.
    REQUIRE_THAT(sim.getWaterDepth(0, 0), WithinAbs(0.25, 1e-6));
    REQUIRE_THAT(sim.getWaterDepth(1, 0), WithinAbs(0.75, 1e-6));
    REQUIRE(sim.getWaterDepth(2, 0) == 0.0f);
    REQUIRE_THAT(sim.totalWaterDepth(), WithinAbs(1.0, 1e-6));
}

TEST_CASE("Water never flows uphill", "[water][flow]") {
    WaterSimulation sim;
    std::vector<f32> elevation = flatElevation(3, 3, 10.0f);
    elevation[4] = 0.0f;
    REQUIRE(sim.initialize(std::move(elevation), 3, 3, 0.5f));
    sim.setWaterDepth(1, 1, 1.0f);

    for (int i = 0; i < 10; ++i) {
        sim.step();
    }

    REQUIRE(sim.getWaterDepth(1, 1) == Approx(1.0f));
    REQUIRE(sim.wetCellCount(0.0f) == 1);
}

TEST_CASE("Flow conserves water away from the edges", "[water][flow]") {
    WaterSimulation sim;
    // Deep below the off-grid reference height, so nothing drains out
    REQUIRE(sim.initialize(flatElevation(7, 7, -10.0f), 7, 7, 0.5f));
    sim.setWaterDepth(3, 3, 2.0f);
    sim.setWaterDepth(1, 5, 0.5f);

    for (int i = 0; i < 50; ++i) {
        sim.step();
        REQUIRE(allFiniteAndNonNegative(sim.getWater()));
        REQUIRE_THAT(sim.totalWaterDepth(), WithinAbs(2.5, 1e-4));
    }
    REQUIRE(sim.wetCellCount() > 2);
}

TEST_CASE("Total water never grows without rain", "[water][flow]") {
    WaterSimulation sim;
    std::vector<f32> elevation(64);
    for (u32 y = 0; y < 8; ++y) {
        for (u32 x = 0; x < 8; ++x) {
            elevation[y * 8 + x] = 0.1f * static_cast<f32>(x) + 0.05f * static_cast<f32>(y);
        }
    }
    REQUIRE(sim.initialize(std::move(elevation), 8, 8, 0.5f));
    for (u32 i = 0; i < 8; ++i) {
        sim.setWaterDepth(i, i, 0.3f);
    }

    f64 previous = sim.totalWaterDepth();
    for (int i = 0; i < 40; ++i) {
        sim.step();
        REQUIRE(allFiniteAndNonNegative(sim.getWater()));
        f64 total = sim.totalWaterDepth();
        REQUIRE(total <= previous + 1e-6);
        previous = total;
    }
}

TEST_CASE("Cells without elevation are excluded from flow", "[water][flow]") {
    WaterSimulation sim;
    std::vector<f32> elevation = flatElevation(3, 3, 0.0f);
    elevation[4] = std::numeric_limits<f32>::quiet_NaN();
    REQUIRE(sim.initialize(std::move(elevation), 3, 3, 1.0f));

    SECTION("Not a sink") {
        sim.setWaterDepth(0, 1, 1.0f);
        sim.step();
        REQUIRE(sim.getWaterDepth(1, 1) == 0.0f);
        REQUIRE(allFiniteAndNonNegative(sim.getWater()));
    }

    SECTION("Not a source") {
        sim.setWaterDepth(1, 1, 1.0f);
        sim.step();
        REQUIRE(sim.getWaterDepth(1, 1) == Approx(1.0f));
        REQUIRE(sim.getWaterDepth(0, 1) == 0.0f);
    }
}

TEST_CASE("Rain, evaporation and infiltration", "[water][sources]") {
    WaterSimulation sim;
    REQUIRE(sim.initialize(flatElevation(4, 4, -10.0f), 4, 4, 0.5f));

    SimulationParams params;
    params.rainRate = 0.01f;
    sim.setParams(params);

    SECTION("Rain only falls while raining") {
        sim.step();
        REQUIRE(sim.totalWaterDepth() == 0.0);

        sim.setRaining(true);
        sim.step();
        for (f32 w : sim.getWater()) {
            REQUIRE(w == Approx(0.01f));
        }
    }

    SECTION("Evaporation removes a uniform depth") {
        params.evaporation = 0.004f;
        sim.setParams(params);
        sim.setRaining(true);
        sim.step();
        for (f32 w : sim.getWater()) {
            REQUIRE(w == Approx(0.006f));
        }
    }

    SECTION("Infiltration adds to evaporation") {
        params.evaporation = 0.002f;
        params.infiltration = 0.003f;
        sim.setParams(params);
        sim.setRaining(true);
        sim.step();
        for (f32 w : sim.getWater()) {
            REQUIRE(w == Approx(0.005f));
        }
    }

    SECTION("Losses never drive depth negative") {
        params.evaporation = 1.0f;
        sim.setParams(params);
        sim.setRaining(true);
        sim.step();
        for (f32 w : sim.getWater()) {
            REQUIRE(w == 0.0f);
        }
    }
}

TEST_CASE("Rain falls on cells without elevation", "[water][sources]") {
    WaterSimulation sim;
    std::vector<f32> elevation = flatElevation(2, 2, -10.0f);
    elevation[0] = std::numeric_limits<f32>::quiet_NaN();
    REQUIRE(sim.initialize(std::move(elevation), 2, 2, 1.0f));

    SimulationParams params;
    params.rainRate = 0.02f;
    sim.setParams(params);
    sim.setRaining(true);
    sim.step();

    REQUIRE(sim.getWaterDepth(0, 0) == Approx(0.02f));
}

TEST_CASE("Simulation parameters are clamped", "[water][params]") {
    WaterSimulation sim;

    SimulationParams params;
    params.rainRate = -1.0f;
    params.evaporation = std::numeric_limits<f32>::quiet_NaN();
    params.infiltration = std::numeric_limits<f32>::infinity();
    params.flowRate = 2.0f;
    params.minFlowThreshold = 0.0f;
    sim.setParams(params);

    const SimulationParams& applied = sim.getParams();
    REQUIRE(applied.rainRate == 0.0f);
    REQUIRE(applied.evaporation == 0.0f);
    REQUIRE(applied.infiltration == 0.0f);
    REQUIRE(applied.flowRate == Approx(Physics::kMaxFlowRateSetting));
    REQUIRE(applied.minFlowThreshold == Approx(Physics::kMinFlowThreshold));

    params.flowRate = 0.0f;
    sim.setParams(params);
    REQUIRE(sim.getParams().flowRate == Approx(Physics::kMinFlowRateSetting));
}

TEST_CASE("Reset clears water and keeps mode", "[water][sim]") {
    WaterSimulation sim;
    REQUIRE(sim.initialize(flatElevation(3, 3, 0.0f), 3, 3, 1.0f));
    sim.setRunning(true);
    sim.setRaining(true);
    sim.setWaterDepth(2, 2, 0.7f);

    sim.reset();

    REQUIRE(sim.totalWaterDepth() == 0.0);
    REQUIRE(sim.isRunning());
    REQUIRE(sim.isRaining());
    REQUIRE(sim.isInitialized());
}

TEST_CASE("Water depth setter", "[water][sim]") {
    WaterSimulation sim;
    REQUIRE(sim.initialize(flatElevation(2, 2, 0.0f), 2, 2, 2.0f));

    sim.setWaterDepth(1, 0, 0.5f);
    REQUIRE(sim.getWaterDepth(1, 0) == Approx(0.5f));
    REQUIRE(sim.totalWaterVolume() == Approx(2.0));

    sim.setWaterDepth(0, 0, -3.0f);
    REQUIRE(sim.getWaterDepth(0, 0) == 0.0f);

    sim.setWaterDepth(5, 5, 1.0f);
    REQUIRE(sim.totalWaterDepth() == Approx(0.5));
}
