#ifndef DOMAIN_HPP
#define DOMAIN_HPP

#include "Types.hpp"
#include <deque>
#include <memory>
#include <optional>
#include <set>
#include <vector>

// Positions within this distance of an integer floor count as "at" that floor.
constexpr double kArrivalEpsilon = 0.02;

// ============== Floor ==============
// Waiting queues plus the per-direction claim fields for one floor.

class Floor {
private:
    int floorNumber_;
    std::deque<Passenger> upQueue_;
    std::deque<Passenger> downQueue_;
    std::optional<int> upClaim_;
    std::optional<int> downClaim_;

public:
    explicit Floor(int number);

    // Queue operations
    void enqueue(Passenger passenger);
    std::optional<Passenger> popWaiting(Direction dir);

    // Claim operations
    void setClaim(Direction dir, int elevatorId);
    void clearClaim(Direction dir);
    std::optional<int> getClaim(Direction dir) const;

    // Queries
    bool hasCall(Direction dir) const;
    int waitingCount(Direction dir) const;
    int getNumber() const;
};

// ============== Elevator ==============

struct MotionLimits {
    double topSpeed;        // floors/s
    double acceleration;    // floors/s^2
};

class Elevator {
private:
    int id_;
    double position_;
    double velocity_ = 0.0;                 // Signed, floors/s
    Direction direction_ = Direction::Idle;
    int capacity_;
    std::vector<Passenger> passengers_;     // Boarding order
    bool doorsOpen_ = false;
    std::optional<double> doorTimer_;       // Remaining dwell while doors are open
    std::set<int> targets_;

public:
    Elevator(int id, int capacity, double startPosition = 0.0);

    // Getters
    int getId() const;
    double getPosition() const;
    int getCurrentFloor() const;
    double getVelocity() const;
    Direction getDirection() const;
    ElevatorPhase getPhase() const;
    int getCapacity() const;
    int getPassengerCount() const;
    const std::vector<Passenger>& getPassengers() const;
    bool areDoorsOpen() const;
    std::optional<double> getDoorTimer() const;
    const std::set<int>& getTargets() const;

    // Target management
    void addTarget(int floor);
    void removeTarget(int floor);
    bool hasTarget(int floor) const;
    bool hasAnyTargets() const;

    // Query helpers
    bool hasDestination(int floor) const;
    bool hasNeedsInDirection(Direction dir) const;
    std::optional<int> nearestTarget() const;
    std::optional<int> nextStop() const;
    Direction loadDirection(int floor) const;

    // Passenger management
    bool canBoard() const;
    void board(Passenger passenger, double now);
    std::vector<Passenger> unloadAt(int floor, double now);

    // State transitions
    void setDirection(Direction dir);
    void openDoors(double dwellSec);

    // Advance the motion/door state machine by dt seconds. Returns the floor
    // the car has just reached and must service, if any.
    std::optional<int> advance(double dt, const MotionLimits& limits, int topFloor);

private:
    std::optional<int> nextTargetAhead(double dt, const MotionLimits& limits) const;
    std::optional<int> move(double dt, const MotionLimits& limits, int topFloor);
    void integrate(double dt, int topFloor);
    void commitDirectionAfterDwell();
};

// ============== Building ==============
// Owns floors and elevators and arbitrates hall-call claims between cars.

struct Grant {
    bool granted = false;
    std::optional<Direction> claimed;  // Set when this grant took a new claim
};

class Building {
private:
    std::vector<Floor> floors_;
    std::vector<std::unique_ptr<Elevator>> elevators_;
    Config config_;

public:
    explicit Building(const Config& config);

    // Accessors
    int getNumFloors() const;
    int getNumElevators() const;
    const Config& getConfig() const;

    // Elevator access
    Elevator& getElevator(int id);
    const Elevator& getElevator(int id) const;

    // Floor access
    Floor& getFloor(int number);
    const Floor& getFloor(int number) const;

    // Hall call management
    void enqueuePassenger(Passenger passenger);
    bool hasHallCall(int floor, Direction dir) const;
    std::vector<std::pair<int, Direction>> getAllHallCalls() const;

    // Claim arbitration
    void reconcileClaims();
    std::vector<int> getClaimableCalls(Direction dir) const;
    std::vector<int> getOwnedCalls(int elevatorId, Direction dir) const;
    Grant grantTarget(int elevatorId, int floor);
    void releaseClaimsAt(int elevatorId, int floor);

    // Population counts
    int getWaitingCount() const;
    int getOnboardCount() const;

    // Validation
    bool isValidFloor(int floor) const;
    bool isValidElevator(int id) const;

private:
    bool elevatorNeedsFloor(int elevatorId, int floor) const;
    void dropClaim(int floor, Direction dir);
    std::optional<Direction> preferredClaimDirection(const Elevator& elev, const Floor& floor) const;
};

#endif // DOMAIN_HPP
