#include "Scheduler.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <limits>

namespace {

// Floors some car is already headed to
std::set<int> coveredFloors(const AlgorithmState& state) {
    std::set<int> covered;
    for (const auto& elev : state.elevators) {
        covered.insert(elev.targets.begin(), elev.targets.end());
    }
    return covered;
}

// Up calls first, then down calls, each ascending
std::vector<int> allCalls(const AlgorithmState& state) {
    std::vector<int> calls(state.calls.up);
    calls.insert(calls.end(), state.calls.down.begin(), state.calls.down.end());
    return calls;
}

bool isFull(const ElevatorSnapshot& elev) {
    return static_cast<int>(elev.passengers.size()) >= elev.capacity;
}

std::vector<AlgorithmDecision> assignByCost(const AlgorithmState& state, double loadPenalty) {
    std::vector<AlgorithmDecision> decisions;
    std::set<int> covered = coveredFloors(state);
    std::vector<int> assignedCount(state.elevators.size(), 0);

    for (int floor : allCalls(state)) {
        if (covered.count(floor)) continue;

        int best = -1;
        double bestScore = std::numeric_limits<double>::infinity();
        for (std::size_t i = 0; i < state.elevators.size(); ++i) {
            const auto& elev = state.elevators[i];
            if (isFull(elev)) continue;

            double score = estimateArrival(elev, floor) + assignedCount[i] * loadPenalty;
            if (score < bestScore) {
                bestScore = score;
                best = static_cast<int>(i);
            }
        }
        if (best < 0) continue;

        ++assignedCount[best];
        covered.insert(floor);
        decisions.push_back({best, {floor}});
    }

    return decisions;
}

} // namespace

double estimateArrival(const ElevatorSnapshot& elev, int floor) {
    double distance = std::abs(elev.position - floor);
    bool movingAway = (elev.direction == Direction::Up && floor < elev.position) ||
                      (elev.direction == Direction::Down && floor > elev.position);
    bool idle = elev.direction == Direction::Idle;

    return distance + (movingAway ? 3.0 : 0.0) - (idle ? 0.3 : 0.0);
}

// ============== Nearest Car Implementation ==============

std::vector<AlgorithmDecision> NearestCarScheduler::decide(const AlgorithmState& state) {
    return assignByCost(state, 0.0);
}

// ============== Single Responder Implementation ==============

std::vector<AlgorithmDecision> ExclusiveNearestScheduler::decide(const AlgorithmState& state) {
    return assignByCost(state, 0.5);
}

// ============== Collective Implementation ==============

std::vector<AlgorithmDecision> CollectiveScheduler::decide(const AlgorithmState& state) {
    std::vector<AlgorithmDecision> decisions;
    std::set<int> covered = coveredFloors(state);
    const std::vector<int> calls = allCalls(state);

    for (std::size_t i = 0; i < state.elevators.size(); ++i) {
        const auto& elev = state.elevators[i];
        if (isFull(elev)) continue;

        if (elev.direction == Direction::Idle) {
            // Idle: claim the nearest unserved call
            int bestFloor = -1;
            double bestDistance = std::numeric_limits<double>::infinity();
            for (int floor : calls) {
                if (covered.count(floor)) continue;
                double distance = std::abs(floor - elev.position);
                if (distance < bestDistance) {
                    bestDistance = distance;
                    bestFloor = floor;
                }
            }
            if (bestFloor >= 0) {
                covered.insert(bestFloor);
                decisions.push_back({static_cast<int>(i), {bestFloor}});
            }
            continue;
        }

        // Moving: stop for every call ahead in our direction of travel
        const bool up = elev.direction == Direction::Up;
        const auto& sameWay = up ? state.calls.up : state.calls.down;
        std::vector<int> passCalls;
        for (int floor : sameWay) {
            bool ahead = up ? floor >= elev.position : floor <= elev.position;
            if (ahead && !covered.count(floor)) {
                passCalls.push_back(floor);
            }
        }
        if (!passCalls.empty()) {
            covered.insert(passCalls.begin(), passCalls.end());
            decisions.push_back({static_cast<int>(i), passCalls});
        }
    }

    return decisions;
}

// ============== Zoned Implementation ==============

int ZonedScheduler::zoneOwner(int floor, int floors, int elevators) {
    int zoneSize = (floors + elevators - 1) / elevators;
    return std::min(elevators - 1, floor / zoneSize);
}

std::vector<AlgorithmDecision> ZonedScheduler::decide(const AlgorithmState& state) {
    std::vector<AlgorithmDecision> decisions;
    const int elevators = static_cast<int>(state.elevators.size());
    if (elevators == 0 || state.floors <= 0) {
        return decisions;
    }

    std::set<int> assigned;
    for (int floor : allCalls(state)) {
        if (!assigned.insert(floor).second) continue;
        decisions.push_back({zoneOwner(floor, state.floors, elevators), {floor}});
    }
    return decisions;
}

// ============== Idle To Lobby Implementation ==============

std::vector<AlgorithmDecision> IdleLobbyScheduler::decide(const AlgorithmState& state) {
    std::vector<AlgorithmDecision> decisions;
    const int lobby = 0;

    bool pending = !state.calls.up.empty() || !state.calls.down.empty();
    for (const auto& elev : state.elevators) {
        if (!elev.ownedUp.empty() || !elev.ownedDown.empty()) {
            pending = true;
        }
    }

    if (!pending) {
        for (std::size_t i = 0; i < state.elevators.size(); ++i) {
            const auto& elev = state.elevators[i];
            if (elev.direction == Direction::Idle &&
                elev.position > lobby &&
                !elev.targets.count(lobby)) {
                decisions.push_back({static_cast<int>(i), {lobby}});
            }
        }
    }

    // Active calls fall back to nearest car
    auto nearest = nearest_.decide(state);
    decisions.insert(decisions.end(), nearest.begin(), nearest.end());
    return decisions;
}

// ============== Custom Implementation ==============

CustomScheduler::CustomScheduler(DecisionFunction fn, std::string name, Logger* logger)
    : decide_(std::move(fn)), name_(std::move(name)), logger_(logger) {}

std::vector<AlgorithmDecision> CustomScheduler::decide(const AlgorithmState& state) {
    if (!decide_) {
        return {};
    }

    try {
        return decide_(state);
    } catch (const std::exception& e) {
        warn(name_ + " failed: " + e.what());
    } catch (...) {
        warn(name_ + " failed with a non-standard exception");
    }
    return {};
}

void CustomScheduler::warn(const std::string& message) {
    if (logger_) {
        logger_->log("[WARN] " + message + "; no decisions this tick");
    }
}

// ============== Factory ==============

std::unique_ptr<IScheduler> createScheduler(AlgorithmKind kind, Logger* logger) {
    switch (kind) {
        case AlgorithmKind::Nearest:
            return std::make_unique<NearestCarScheduler>();
        case AlgorithmKind::ExclusiveNearest:
            return std::make_unique<ExclusiveNearestScheduler>();
        case AlgorithmKind::Collective:
            return std::make_unique<CollectiveScheduler>();
        case AlgorithmKind::Zoned:
            return std::make_unique<ZonedScheduler>();
        case AlgorithmKind::IdleLobby:
            return std::make_unique<IdleLobbyScheduler>();
        case AlgorithmKind::Custom:
            return std::make_unique<CustomScheduler>(DecisionFunction{}, "Custom", logger);
    }
    return nullptr;
}
