#include <gtest/gtest.h>
#include "Simulation.hpp"
#include <cmath>
#include <random>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace {

constexpr double kTickSec = 0.05;

Config stressConfig(int floors, int elevators, double ratePerMin, std::uint32_t seed) {
    Config config;
    config.numFloors = floors;
    config.numElevators = elevators;
    config.spawnRatePerMin = ratePerMin;
    config.randomSeed = seed;
    return config;
}

// Everything that must hold after any tick
void checkInvariants(const SimulationEngine& engine, std::vector<double>& lastPositions) {
    const Config& config = engine.getConfig();
    const Building& building = engine.getBuilding();
    const double maxStep = config.speedFloorsPerSec * kTickSec + kArrivalEpsilon + 1e-9;

    auto elevators = engine.getElevatorViews();
    ASSERT_EQ(elevators.size(), lastPositions.size());
    for (const auto& view : elevators) {
        ASSERT_LE(view.passengerCount, view.capacity) << "elevator " << view.id;
        ASSERT_GE(view.position, 0.0);
        ASSERT_LE(view.position, config.numFloors - 1.0);
        ASSERT_LE(std::abs(view.velocity), config.speedFloorsPerSec + 1e-9);
        ASSERT_LE(std::abs(view.position - lastPositions[view.id]), maxStep)
            << "elevator " << view.id << " jumped at T=" << engine.getTime();
        lastPositions[view.id] = view.position;
    }

    // Claims sit on non-empty queues and their owner is headed there
    for (const auto& floor : engine.getFloorViews()) {
        if (floor.upClaim) {
            ASSERT_GT(floor.waitingUp, 0) << "floor " << floor.floor;
            ASSERT_TRUE(building.getElevator(*floor.upClaim).hasTarget(floor.floor));
        }
        if (floor.downClaim) {
            ASSERT_GT(floor.waitingDown, 0) << "floor " << floor.floor;
            ASSERT_TRUE(building.getElevator(*floor.downClaim).hasTarget(floor.floor));
        }
    }

    SimStats stats = engine.getStats();
    ASSERT_EQ(engine.getSpawnedCount(),
              building.getWaitingCount() + building.getOnboardCount() + stats.completed);
    ASSERT_GE(stats.avgWaitSec, 0.0);
    ASSERT_GE(stats.maxWaitSec + 1e-9, stats.avgWaitSec);
}

void runChecked(SimulationEngine& engine, double durationSec) {
    std::vector<double> lastPositions;
    for (const auto& view : engine.getElevatorViews()) {
        lastPositions.push_back(view.position);
    }

    const int ticks = static_cast<int>(std::lround(durationSec / kTickSec));
    for (int i = 0; i < ticks; ++i) {
        engine.tick(kTickSec);
        ASSERT_NO_FATAL_FAILURE(checkInvariants(engine, lastPositions));
    }
}

} // namespace

// ============== Sustained Traffic Tests ==============

class AlgorithmStressTest : public testing::TestWithParam<AlgorithmKind> {};

TEST_P(AlgorithmStressTest, SustainedTrafficKeepsInvariants) {
    std::ostringstream sink;
    Config config = stressConfig(10, 3, 40.0, 2024);
    config.algorithm = GetParam();

    SimulationEngine engine(config, sink);
    engine.getLogger().disable();

    ASSERT_NO_FATAL_FAILURE(runChecked(engine, 20 * 60.0));
    EXPECT_GT(engine.getSpawnedCount(), 0);
    EXPECT_GT(engine.getStats().completed, 0);
}

TEST_P(AlgorithmStressTest, OverloadedSmallCarsKeepInvariants) {
    std::ostringstream sink;
    Config config = stressConfig(12, 2, 300.0, 77);
    config.algorithm = GetParam();
    config.carCapacity = 2;

    SimulationEngine engine(config, sink);
    engine.getLogger().disable();

    ASSERT_NO_FATAL_FAILURE(runChecked(engine, 10 * 60.0));
    EXPECT_GT(engine.getStats().completed, 0);
}

INSTANTIATE_TEST_SUITE_P(AllBuiltIns, AlgorithmStressTest,
    testing::Values(AlgorithmKind::Nearest, AlgorithmKind::ExclusiveNearest,
                    AlgorithmKind::Collective, AlgorithmKind::Zoned,
                    AlgorithmKind::IdleLobby),
    [](const testing::TestParamInfo<AlgorithmKind>& info) {
        return algorithmKindToString(info.param);
    });

TEST(StressTest, LargeFleet) {
    std::ostringstream sink;
    Config config = stressConfig(50, 16, 500.0, 5);
    config.speedFloorsPerSec = 4.0;
    config.accelerationFloorsPerSec2 = 2.0;

    SimulationEngine engine(config, sink);
    engine.getLogger().disable();

    ASSERT_NO_FATAL_FAILURE(runChecked(engine, 5 * 60.0));
    EXPECT_GT(engine.getStats().completed, 0);
}

TEST(StressTest, TwoFloorBuilding) {
    std::ostringstream sink;
    Config config = stressConfig(2, 1, 120.0, 9);
    config.stopDurationSec = 0.0;

    SimulationEngine engine(config, sink);
    engine.getLogger().disable();

    ASSERT_NO_FATAL_FAILURE(runChecked(engine, 10 * 60.0));
    EXPECT_GT(engine.getStats().completed, 0);
}

TEST(StressTest, ModerateLoadIsMostlyServed) {
    std::ostringstream sink;
    SimulationEngine engine(stressConfig(10, 3, 20.0, 31), sink);
    engine.getLogger().disable();

    ASSERT_NO_FATAL_FAILURE(runChecked(engine, 30 * 60.0));
    EXPECT_GE(engine.getStats().completed * 2, engine.getSpawnedCount());
}

// ============== Manual Call Burst Test ==============

TEST(StressTest, ManualCallBurstDrains) {
    std::ostringstream sink;
    SimulationEngine engine(stressConfig(12, 3, 0.0, 3), sink);
    engine.getLogger().disable();

    std::mt19937 gen(12345);
    std::uniform_int_distribution<> floorDist(0, 11);
    std::uniform_int_distribution<> dirDist(0, 1);

    int accepted = 0;
    for (int i = 0; i < 200; ++i) {
        int floor = floorDist(gen);
        Direction dir = (dirDist(gen) == 0) ? Direction::Up : Direction::Down;

        // Adjust for boundary floors
        if (floor == 0) dir = Direction::Up;
        if (floor == 11) dir = Direction::Down;

        if (engine.requestHallCall(floor, dir)) ++accepted;
    }
    ASSERT_EQ(accepted, 200);

    std::vector<double> lastPositions(3, 0.0);
    for (int i = 0; i < 72000 && engine.getStats().completed < accepted; ++i) {
        engine.tick(kTickSec);
        ASSERT_NO_FATAL_FAILURE(checkInvariants(engine, lastPositions));
    }

    EXPECT_EQ(engine.getStats().completed, accepted);
    EXPECT_EQ(engine.getBuilding().getWaitingCount(), 0);
    EXPECT_EQ(engine.getBuilding().getOnboardCount(), 0);
}

// ============== Determinism Test ==============

TEST(StressTest, SameSeedSameRun) {
    std::ostringstream sinkA;
    std::ostringstream sinkB;
    Config config = stressConfig(15, 4, 90.0, 4242);
    config.algorithm = AlgorithmKind::Collective;

    SimulationEngine a(config, sinkA);
    SimulationEngine b(config, sinkB);
    for (int i = 0; i < 6000; ++i) {
        a.tick(kTickSec);
        b.tick(kTickSec);
    }

    EXPECT_EQ(a.getSpawnedCount(), b.getSpawnedCount());
    EXPECT_EQ(a.getStats().completed, b.getStats().completed);
    EXPECT_DOUBLE_EQ(a.getStats().avgWaitSec, b.getStats().avgWaitSec);

    auto viewsA = a.getElevatorViews();
    auto viewsB = b.getElevatorViews();
    for (std::size_t i = 0; i < viewsA.size(); ++i) {
        EXPECT_DOUBLE_EQ(viewsA[i].position, viewsB[i].position);
        EXPECT_EQ(viewsA[i].targets, viewsB[i].targets);
    }
}

// ============== Misbehaving Custom Algorithm Tests ==============

TEST(StressTest, ChaoticCustomAlgorithm) {
    std::ostringstream sink;
    SimulationEngine engine(stressConfig(10, 3, 60.0, 8), sink);

    std::mt19937 chaos(99);
    int calls = 0;
    engine.setCustomAlgorithm([&chaos, &calls](const AlgorithmState& state) {
        if (++calls % 7 == 0) {
            throw std::runtime_error("scheduled failure");
        }
        std::uniform_int_distribution<> elevatorDist(-2, static_cast<int>(state.elevators.size()) + 2);
        std::uniform_int_distribution<> floorDist(-3, state.floors + 3);

        std::vector<AlgorithmDecision> out;
        for (int i = 0; i < 4; ++i) {
            out.push_back({elevatorDist(chaos), {floorDist(chaos), floorDist(chaos)}});
        }
        return out;
    }, "Chaos");

    ASSERT_NO_FATAL_FAILURE(runChecked(engine, 5 * 60.0));
    EXPECT_NE(sink.str().find("[WARN] Chaos failed: scheduled failure"), std::string::npos);
}

TEST(StressTest, CustomAlgorithmClaimingEverythingForOneCar) {
    std::ostringstream sink;
    SimulationEngine engine(stressConfig(10, 3, 60.0, 10), sink);
    engine.getLogger().disable();

    engine.setCustomAlgorithm([](const AlgorithmState& state) {
        std::vector<AlgorithmDecision> out;
        AlgorithmDecision all{0, {}};
        all.addTargets.insert(all.addTargets.end(), state.calls.up.begin(), state.calls.up.end());
        all.addTargets.insert(all.addTargets.end(), state.calls.down.begin(), state.calls.down.end());
        out.push_back(all);
        // Second car competes for the same floors
        out.push_back({1, all.addTargets});
        return out;
    }, "Greedy");

    ASSERT_NO_FATAL_FAILURE(runChecked(engine, 5 * 60.0));
    EXPECT_GT(engine.getStats().completed, 0);
}

// ============== Main ==============

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
