#ifndef LOGGER_HPP
#define LOGGER_HPP

#include "Types.hpp"
#include <iostream>
#include <string>

class Elevator;

// ============== Logger ==============

class Logger {
private:
    std::ostream& out_;
    bool enabled_;
    const double* clockRef_ = nullptr;  // Simulated seconds, owned by the engine

public:
    explicit Logger(std::ostream& out = std::cout, bool enabled = true);

    void setClockReference(const double* simTime);

    void log(const std::string& message);
    void logElevatorState(const Elevator& elev);
    void logHallCall(int floor, Direction dir);
    void logAssignment(int elevatorId, int floor, Direction dir);
    void logArrival(int elevatorId, int floor);
    void logTrip(int elevatorId, const Passenger& passenger);

    void enable();
    void disable();

private:
    std::string getTimestamp() const;
};

#endif // LOGGER_HPP
