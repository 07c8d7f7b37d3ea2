#include "Simulation.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <random>
#include <sstream>

// ============== Simulation Engine Implementation ==============

SimulationEngine::SimulationEngine(const Config& config, std::ostream& logOut)
    : SimulationEngine(config, nullptr, logOut) {}

SimulationEngine::SimulationEngine(const Config& config,
                                   std::unique_ptr<IScheduler> scheduler,
                                   std::ostream& logOut)
    : config_(config),
      building_(config),
      logger_(logOut),
      generator_(config, config.randomSeed.value_or(std::random_device{}())),
      scheduler_(std::move(scheduler)) {

    logger_.setClockReference(&time_);
    if (!scheduler_) {
        scheduler_ = createScheduler(config_.algorithm, &logger_);
    }

    logger_.log("Simulation initialized with " +
                std::to_string(config.numFloors) + " floors, " +
                std::to_string(config.numElevators) + " elevators");
    logger_.log("Algorithm: " + scheduler_->getName());
}

void SimulationEngine::tick(double dt) {
    if (dt <= 0.0) return;

    time_ += dt;
    stats_.advance(dt);

    for (auto& passenger : generator_.generate(dt, time_)) {
        admitPassenger(std::move(passenger));
    }

    building_.reconcileClaims();
    runScheduler();
    updateElevators(dt);
}

bool SimulationEngine::requestHallCall(int floor, Direction dir) {
    if (!building_.isValidFloor(floor)) {
        logger_.log("[ERROR] Invalid floor: " + std::to_string(floor));
        return false;
    }

    if (dir == Direction::Idle) {
        logger_.log("[ERROR] Hall call must have Up or Down direction");
        return false;
    }

    // Boundary checks
    if (floor == 0 && dir == Direction::Down) {
        logger_.log("[WARN] Cannot go down from floor 0");
        return false;
    }
    if (floor == building_.getNumFloors() - 1 && dir == Direction::Up) {
        logger_.log("[WARN] Cannot go up from top floor");
        return false;
    }

    auto passenger = generator_.directed(floor, dir, time_);
    if (!passenger) {
        return false;
    }
    admitPassenger(std::move(*passenger));
    return true;
}

void SimulationEngine::setCustomAlgorithm(DecisionFunction fn, const std::string& name) {
    scheduler_ = std::make_unique<CustomScheduler>(std::move(fn), name, &logger_);
    config_.algorithm = AlgorithmKind::Custom;
    logger_.log("Algorithm: " + scheduler_->getName());
}

void SimulationEngine::printStatus(std::ostream& out) const {
    out << "\n========== Status at T=" << std::fixed << std::setprecision(2)
        << time_ << "s ==========\n";

    // Fleet
    for (const auto& view : getElevatorViews()) {
        int occupancy = static_cast<int>(
            std::lround(100.0 * view.passengerCount / std::max(1, view.capacity)));
        out << "Elevator " << view.id << ": "
            << "Pos " << std::setprecision(2) << view.position << ", "
            << phaseToString(view.phase) << ", "
            << directionToString(view.direction) << ", "
            << view.passengerCount << "/" << view.capacity
            << " (" << occupancy << "%)";

        if (!view.targets.empty()) {
            out << ", Targets: {";
            bool first = true;
            for (int t : view.targets) {
                if (!first) out << ", ";
                out << t;
                first = false;
            }
            out << "}";
        }
        if (view.nextStop) {
            out << ", Next: " << *view.nextStop;
        }
        out << "\n";
    }

    // Floor calls
    bool header = false;
    for (const auto& view : getFloorViews()) {
        if (view.waitingUp == 0 && view.waitingDown == 0) continue;
        if (!header) {
            out << "Floor Calls:\n";
            header = true;
        }
        out << "  Floor " << view.floor << ": up " << view.waitingUp;
        if (view.upClaim) out << " [E" << *view.upClaim << "]";
        out << ", down " << view.waitingDown;
        if (view.downClaim) out << " [E" << *view.downClaim << "]";
        out << "\n";
    }

    out << "==========================================\n\n";
}

void SimulationEngine::printStats(std::ostream& out) const {
    SimStats stats = getStats();
    out << std::fixed << std::setprecision(1)
        << "Completed:        " << stats.completed << "\n"
        << "Throughput (min): " << stats.throughputPerMin << "\n"
        << "Avg Wait (s):     " << stats.avgWaitSec << "\n"
        << "Max Wait (s):     " << stats.maxWaitSec << "\n";
}

double SimulationEngine::getTime() const {
    return time_;
}

SimStats SimulationEngine::getStats() const {
    return stats_.snapshot();
}

int SimulationEngine::getSpawnedCount() const {
    return generator_.getSpawnedCount();
}

std::vector<ElevatorView> SimulationEngine::getElevatorViews() const {
    std::vector<ElevatorView> views;
    views.reserve(building_.getNumElevators());

    for (int i = 0; i < building_.getNumElevators(); ++i) {
        const Elevator& elev = building_.getElevator(i);
        ElevatorView view;
        view.id = elev.getId();
        view.position = elev.getPosition();
        view.direction = elev.getDirection();
        view.phase = elev.getPhase();
        view.velocity = elev.getVelocity();
        view.doorsOpen = elev.areDoorsOpen();
        view.passengerCount = elev.getPassengerCount();
        view.capacity = elev.getCapacity();
        view.targets.assign(elev.getTargets().begin(), elev.getTargets().end());
        view.nextStop = elev.nextStop();
        views.push_back(std::move(view));
    }

    return views;
}

std::vector<FloorView> SimulationEngine::getFloorViews() const {
    std::vector<FloorView> views;
    views.reserve(building_.getNumFloors());

    for (int f = 0; f < building_.getNumFloors(); ++f) {
        const Floor& floor = building_.getFloor(f);
        FloorView view;
        view.floor = f;
        view.waitingUp = floor.waitingCount(Direction::Up);
        view.waitingDown = floor.waitingCount(Direction::Down);
        view.upClaim = floor.getClaim(Direction::Up);
        view.downClaim = floor.getClaim(Direction::Down);
        views.push_back(view);
    }

    return views;
}

std::optional<int> SimulationEngine::getNextStopFor(int elevatorId) const {
    if (!building_.isValidElevator(elevatorId)) {
        return std::nullopt;
    }
    return building_.getElevator(elevatorId).nextStop();
}

const Config& SimulationEngine::getConfig() const {
    return config_;
}

const Building& SimulationEngine::getBuilding() const {
    return building_;
}

const IScheduler& SimulationEngine::getScheduler() const {
    return *scheduler_;
}

Logger& SimulationEngine::getLogger() {
    return logger_;
}

void SimulationEngine::admitPassenger(Passenger passenger) {
    Direction dir = (passenger.destination > passenger.origin) ? Direction::Up : Direction::Down;
    logger_.logHallCall(passenger.origin, dir);
    building_.enqueuePassenger(std::move(passenger));
}

AlgorithmState SimulationEngine::buildSnapshot() const {
    AlgorithmState state;
    state.time = time_;
    state.floors = building_.getNumFloors();
    state.calls.up = building_.getClaimableCalls(Direction::Up);
    state.calls.down = building_.getClaimableCalls(Direction::Down);

    state.elevators.reserve(building_.getNumElevators());
    for (int i = 0; i < building_.getNumElevators(); ++i) {
        const Elevator& elev = building_.getElevator(i);
        ElevatorSnapshot snap;
        snap.id = elev.getId();
        snap.position = elev.getPosition();
        snap.direction = elev.getDirection();
        snap.velocity = elev.getVelocity();
        snap.capacity = elev.getCapacity();
        snap.passengers = elev.getPassengers();
        snap.doorsOpen = elev.areDoorsOpen();
        snap.targets = elev.getTargets();
        snap.ownedUp = building_.getOwnedCalls(i, Direction::Up);
        snap.ownedDown = building_.getOwnedCalls(i, Direction::Down);
        state.elevators.push_back(std::move(snap));
    }

    return state;
}

void SimulationEngine::runScheduler() {
    const AlgorithmState state = buildSnapshot();
    applyDecisions(scheduler_->decide(state));
}

void SimulationEngine::applyDecisions(const std::vector<AlgorithmDecision>& decisions) {
    for (const auto& decision : decisions) {
        // Unknown cars and floors are dropped
        if (!building_.isValidElevator(decision.elevator)) continue;

        for (int floor : decision.addTargets) {
            if (!building_.isValidFloor(floor)) continue;

            Grant grant = building_.grantTarget(decision.elevator, floor);
            if (grant.claimed) {
                logger_.logAssignment(decision.elevator, floor, *grant.claimed);
            }
        }
    }
}

void SimulationEngine::updateElevators(double dt) {
    const MotionLimits limits{config_.speedFloorsPerSec, config_.acceleration()};
    const int topFloor = building_.getNumFloors() - 1;

    for (int i = 0; i < building_.getNumElevators(); ++i) {
        Elevator& elev = building_.getElevator(i);
        if (auto floor = elev.advance(dt, limits, topFloor)) {
            serviceFloor(i, *floor);
        }
    }
}

void SimulationEngine::serviceFloor(int elevatorId, int floorNumber) {
    Elevator& elev = building_.getElevator(elevatorId);
    Floor& floor = building_.getFloor(floorNumber);
    const Direction arriving = elev.getDirection();

    logger_.logArrival(elevatorId, floorNumber);
    elev.openDoors(config_.stopDurationSec);

    for (const auto& passenger : elev.unloadAt(floorNumber, time_)) {
        stats_.recordTrip(passenger);
        logger_.logTrip(elevatorId, passenger);
    }
    elev.removeTarget(floorNumber);

    // Arrival direction first; an idle car starts with the call it claimed here
    Direction first = arriving;
    if (first == Direction::Idle) {
        first = (floor.getClaim(Direction::Down) == elevatorId) ? Direction::Down : Direction::Up;
    }
    boardFrom(elev, floor, first);
    if (elev.canBoard()) {
        boardFrom(elev, floor, opposite(first));
    }

    if (arriving == Direction::Idle) {
        elev.setDirection(elev.loadDirection(floorNumber));
    }

    building_.releaseClaimsAt(elevatorId, floorNumber);
    logger_.logElevatorState(elev);
}

int SimulationEngine::boardFrom(Elevator& elev, Floor& floor, Direction dir) {
    int boarded = 0;
    while (elev.canBoard()) {
        auto passenger = floor.popWaiting(dir);
        if (!passenger) break;
        elev.board(std::move(*passenger), time_);
        ++boarded;
    }
    return boarded;
}

// ============== CLI Implementation ==============

CLI::CLI(SimulationEngine& engine) : engine_(engine) {}

void CLI::run() {
    printHelp();

    std::string line;
    while (running_ && std::getline(std::cin, line)) {
        if (line.empty()) continue;
        processCommand(line);
    }
}

void CLI::stop() {
    running_ = false;
}

void CLI::printHelp() {
    std::cout << "\n=== Elevator Fleet Simulator ===\n"
              << "Commands:\n"
              << "  call <floor> <u|d>  - Manual call (e.g., 'call 5 u')\n"
              << "  step [seconds]      - Advance time (default: one tick)\n"
              << "  status              - Print fleet and floor calls\n"
              << "  stats               - Print trip statistics\n"
              << "  algo                - Show the active algorithm\n"
              << "  help                - Show this help\n"
              << "  quit                - Exit simulation\n"
              << "\n";
}

void CLI::processCommand(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;

    if (cmd == "call") {
        std::string args;
        std::getline(iss, args);
        if (!parseCall(args)) {
            std::cout << "Usage: call <floor> <u|d>\n";
        }
    }
    else if (cmd == "step") {
        std::string args;
        std::getline(iss, args);
        if (!parseStep(args)) {
            std::cout << "Usage: step [seconds]\n";
        }
    }
    else if (cmd == "status") {
        engine_.printStatus();
    }
    else if (cmd == "stats") {
        engine_.printStats();
    }
    else if (cmd == "algo") {
        std::cout << "Algorithm: " << engine_.getScheduler().getName() << "\n";
    }
    else if (cmd == "help") {
        printHelp();
    }
    else if (cmd == "quit" || cmd == "exit" || cmd == "q") {
        stop();
    }
    else {
        std::cout << "Unknown command: " << cmd << ". Type 'help' for usage.\n";
    }
}

bool CLI::parseCall(const std::string& args) {
    std::istringstream iss(args);
    int floor;
    char dirChar;

    if (!(iss >> floor >> dirChar)) {
        return false;
    }

    Direction dir;
    if (dirChar == 'u' || dirChar == 'U') {
        dir = Direction::Up;
    } else if (dirChar == 'd' || dirChar == 'D') {
        dir = Direction::Down;
    } else {
        return false;
    }

    engine_.requestHallCall(floor, dir);
    return true;
}

bool CLI::parseStep(const std::string& args) {
    const double tickSec = engine_.getConfig().tickDurationMs / 1000.0;

    std::istringstream iss(args);
    double seconds = tickSec;
    if (!(iss >> seconds)) {
        if (!iss.eof()) return false;
        seconds = tickSec;
    }
    if (seconds <= 0.0) {
        return false;
    }

    long ticks = std::max(1L, std::lround(seconds / tickSec));
    for (long i = 0; i < ticks; ++i) {
        engine_.tick(tickSec);
    }
    return true;
}
