#include "Logger.hpp"
#include "Domain.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

// ============== Logger Implementation ==============

Logger::Logger(std::ostream& out, bool enabled)
    : out_(out), enabled_(enabled) {}

void Logger::setClockReference(const double* simTime) {
    clockRef_ = simTime;
}

void Logger::log(const std::string& message) {
    if (!enabled_) return;
    out_ << getTimestamp() << " " << message << "\n";
}

void Logger::logElevatorState(const Elevator& elev) {
    if (!enabled_) return;

    std::ostringstream oss;
    oss << "[ELEVATOR " << elev.getId() << "] "
        << "pos=" << std::fixed << std::setprecision(2) << elev.getPosition() << " "
        << "state=" << phaseToString(elev.getPhase()) << " "
        << "dir=" << directionToString(elev.getDirection()) << " "
        << "passengers=" << elev.getPassengerCount() << "/" << elev.getCapacity();

    const auto& targets = elev.getTargets();
    if (!targets.empty()) {
        oss << " targets={";
        bool first = true;
        for (int t : targets) {
            if (!first) oss << ",";
            oss << t;
            first = false;
        }
        oss << "}";
    }

    log(oss.str());
}

void Logger::logHallCall(int floor, Direction dir) {
    log("[HALL CALL] floor=" + std::to_string(floor) +
        " dir=" + directionToString(dir));
}

void Logger::logAssignment(int elevatorId, int floor, Direction dir) {
    log("[ASSIGNMENT] elevator=" + std::to_string(elevatorId) +
        " -> floor=" + std::to_string(floor) +
        " dir=" + directionToString(dir));
}

void Logger::logArrival(int elevatorId, int floor) {
    log("[ARRIVAL] elevator=" + std::to_string(elevatorId) +
        " floor=" + std::to_string(floor));
}

void Logger::logTrip(int elevatorId, const Passenger& passenger) {
    if (!enabled_) return;

    std::ostringstream oss;
    oss << "[TRIP] elevator=" << elevatorId
        << " passenger=" << passenger.id
        << " " << passenger.origin << "->" << passenger.destination
        << " wait=" << std::fixed << std::setprecision(2)
        << passenger.boardTime.value_or(passenger.spawnTime) - passenger.spawnTime << "s";
    log(oss.str());
}

void Logger::enable() { enabled_ = true; }
void Logger::disable() { enabled_ = false; }

std::string Logger::getTimestamp() const {
    std::ostringstream oss;
    oss << "[";
    if (clockRef_) {
        oss << "T" << std::fixed << std::setprecision(2) << std::setw(8) << *clockRef_;
    } else {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        oss << std::put_time(std::localtime(&time), "%H:%M:%S");
    }
    oss << "]";
    return oss.str();
}
