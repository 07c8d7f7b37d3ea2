#ifndef SCHEDULER_HPP
#define SCHEDULER_HPP

#include "Types.hpp"
#include "Logger.hpp"
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

// ============== Algorithm Snapshot ==============

// Deep copy of one car, handed to schedulers instead of the live Elevator
struct ElevatorSnapshot {
    int id = 0;
    double position = 0.0;
    Direction direction = Direction::Idle;
    double velocity = 0.0;
    int capacity = 0;
    std::vector<Passenger> passengers;
    bool doorsOpen = false;
    std::set<int> targets;
    std::vector<int> ownedUp;     // Hall calls this car already holds
    std::vector<int> ownedDown;
};

struct HallCalls {
    std::vector<int> up;          // Ascending, unclaimed only
    std::vector<int> down;
};

struct AlgorithmState {
    double time = 0.0;
    std::vector<ElevatorSnapshot> elevators;
    int floors = 0;
    HallCalls calls;
};

struct AlgorithmDecision {
    int elevator = 0;
    std::vector<int> addTargets;
};

using DecisionFunction = std::function<std::vector<AlgorithmDecision>(const AlgorithmState&)>;

// ============== Scheduler Interface ==============

class IScheduler {
public:
    virtual ~IScheduler() = default;

    // Propose target additions; must only read the snapshot
    virtual std::vector<AlgorithmDecision> decide(const AlgorithmState& state) = 0;

    // Get scheduler name for logging
    virtual std::string getName() const = 0;
};

// Estimated cost for a car to reach a floor: distance, plus a reversal
// penalty, minus a small bonus for idle cars
double estimateArrival(const ElevatorSnapshot& elev, int floor);

// ============== Nearest Car ==============
// Every uncovered call goes to the globally cheapest car

class NearestCarScheduler : public IScheduler {
public:
    std::vector<AlgorithmDecision> decide(const AlgorithmState& state) override;
    std::string getName() const override { return "Nearest Car"; }
};

// ============== Single Responder ==============
// Nearest car with a per-tick load penalty to spread calls

class ExclusiveNearestScheduler : public IScheduler {
public:
    std::vector<AlgorithmDecision> decide(const AlgorithmState& state) override;
    std::string getName() const override { return "Single Responder (Nearest)"; }
};

// ============== Collective ==============

class CollectiveScheduler : public IScheduler {
public:
    std::vector<AlgorithmDecision> decide(const AlgorithmState& state) override;
    std::string getName() const override { return "Collective (Simple)"; }
};

// ============== Zoned ==============
// Contiguous bands of ceil(floors/elevators) floors, one per car

class ZonedScheduler : public IScheduler {
public:
    std::vector<AlgorithmDecision> decide(const AlgorithmState& state) override;
    std::string getName() const override { return "Zoned (Sectorized)"; }

    static int zoneOwner(int floor, int floors, int elevators);
};

// ============== Idle To Lobby ==============

class IdleLobbyScheduler : public IScheduler {
private:
    NearestCarScheduler nearest_;

public:
    std::vector<AlgorithmDecision> decide(const AlgorithmState& state) override;
    std::string getName() const override { return "Idle To Lobby"; }
};

// ============== Custom ==============
// Wraps an externally supplied decision function. Anything it throws is
// logged and the tick proceeds with no decisions.

class CustomScheduler : public IScheduler {
private:
    DecisionFunction decide_;
    std::string name_;
    Logger* logger_;

public:
    explicit CustomScheduler(DecisionFunction fn,
                             std::string name = "Custom",
                             Logger* logger = nullptr);

    std::vector<AlgorithmDecision> decide(const AlgorithmState& state) override;
    std::string getName() const override { return name_; }

private:
    void warn(const std::string& message);
};

// ============== Factory ==============

std::unique_ptr<IScheduler> createScheduler(AlgorithmKind kind, Logger* logger = nullptr);

#endif // SCHEDULER_HPP
