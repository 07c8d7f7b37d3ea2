#ifndef SIMULATION_HPP
#define SIMULATION_HPP

#include "Types.hpp"
#include "Domain.hpp"
#include "Logger.hpp"
#include "Scheduler.hpp"
#include "Traffic.hpp"
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// ============== Read-only Views ==============

struct ElevatorView {
    int id = 0;
    double position = 0.0;
    Direction direction = Direction::Idle;
    ElevatorPhase phase = ElevatorPhase::Idle;
    double velocity = 0.0;
    bool doorsOpen = false;
    int passengerCount = 0;
    int capacity = 0;
    std::vector<int> targets;     // Ascending
    std::optional<int> nextStop;
};

struct FloorView {
    int floor = 0;
    int waitingUp = 0;
    int waitingDown = 0;
    std::optional<int> upClaim;
    std::optional<int> downClaim;
};

// ============== Simulation Engine ==============
// Single-threaded: each tick() runs spawn, reconcile, dispatch and motion
// to completion before returning.

class SimulationEngine {
private:
    Config config_;
    Building building_;
    Logger logger_;
    PassengerGenerator generator_;
    TripStatistics stats_;
    std::unique_ptr<IScheduler> scheduler_;
    double time_ = 0.0;

public:
    explicit SimulationEngine(const Config& config, std::ostream& logOut = std::cout);
    SimulationEngine(const Config& config, std::unique_ptr<IScheduler> scheduler,
                     std::ostream& logOut = std::cout);

    // Non-copyable
    SimulationEngine(const SimulationEngine&) = delete;
    SimulationEngine& operator=(const SimulationEngine&) = delete;

    // Advance the simulation by dt seconds
    void tick(double dt);

    // Commands (from CLI or external)
    bool requestHallCall(int floor, Direction dir);
    void setCustomAlgorithm(DecisionFunction fn, const std::string& name = "Custom");

    // Status
    void printStatus(std::ostream& out = std::cout) const;
    void printStats(std::ostream& out = std::cout) const;
    double getTime() const;
    SimStats getStats() const;
    int getSpawnedCount() const;
    std::vector<ElevatorView> getElevatorViews() const;
    std::vector<FloorView> getFloorViews() const;
    std::optional<int> getNextStopFor(int elevatorId) const;
    const Config& getConfig() const;
    const Building& getBuilding() const;
    const IScheduler& getScheduler() const;
    Logger& getLogger();

private:
    void admitPassenger(Passenger passenger);
    AlgorithmState buildSnapshot() const;
    void runScheduler();
    void applyDecisions(const std::vector<AlgorithmDecision>& decisions);
    void updateElevators(double dt);
    void serviceFloor(int elevatorId, int floor);
    int boardFrom(Elevator& elev, Floor& floor, Direction dir);
};

// ============== CLI Helper ==============

class CLI {
private:
    SimulationEngine& engine_;
    bool running_ = true;

public:
    explicit CLI(SimulationEngine& engine);

    void run();
    void stop();

private:
    void printHelp();
    void processCommand(const std::string& line);
    bool parseCall(const std::string& args);
    bool parseStep(const std::string& args);
};

#endif // SIMULATION_HPP
