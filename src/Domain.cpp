#include "Domain.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

// ============== Floor Implementation ==============

Floor::Floor(int number) : floorNumber_(number) {}

void Floor::enqueue(Passenger passenger) {
    if (passenger.destination > floorNumber_) {
        upQueue_.push_back(std::move(passenger));
    } else {
        downQueue_.push_back(std::move(passenger));
    }
}

std::optional<Passenger> Floor::popWaiting(Direction dir) {
    if (dir == Direction::Idle) return std::nullopt;

    auto& queue = (dir == Direction::Up) ? upQueue_ : downQueue_;
    if (queue.empty()) return std::nullopt;

    Passenger passenger = std::move(queue.front());
    queue.pop_front();
    return passenger;
}

void Floor::setClaim(Direction dir, int elevatorId) {
    if (dir == Direction::Up) {
        upClaim_ = elevatorId;
    } else if (dir == Direction::Down) {
        downClaim_ = elevatorId;
    }
}

void Floor::clearClaim(Direction dir) {
    if (dir == Direction::Up) {
        upClaim_.reset();
    } else if (dir == Direction::Down) {
        downClaim_.reset();
    }
}

std::optional<int> Floor::getClaim(Direction dir) const {
    if (dir == Direction::Up) return upClaim_;
    if (dir == Direction::Down) return downClaim_;
    return std::nullopt;
}

bool Floor::hasCall(Direction dir) const {
    return waitingCount(dir) > 0;
}

int Floor::waitingCount(Direction dir) const {
    if (dir == Direction::Up) return static_cast<int>(upQueue_.size());
    if (dir == Direction::Down) return static_cast<int>(downQueue_.size());
    return 0;
}

int Floor::getNumber() const { return floorNumber_; }

// ============== Elevator Implementation ==============

namespace {

// Fastest speed for this tick from which shedding acceleration*dt per tick
// still stops the car within the remaining distance: s(s + a*dt) <= 2*a*remaining
double brakingSpeed(double remaining, double dt, const MotionLimits& limits) {
    const double quantum = limits.acceleration * dt;
    return 0.5 * (std::sqrt(quantum * quantum + 8.0 * limits.acceleration * remaining) - quantum);
}

} // namespace

Elevator::Elevator(int id, int capacity, double startPosition)
    : id_(id), position_(startPosition), capacity_(capacity) {}

int Elevator::getId() const { return id_; }
double Elevator::getPosition() const { return position_; }

int Elevator::getCurrentFloor() const {
    return static_cast<int>(std::lround(position_));
}

double Elevator::getVelocity() const { return velocity_; }
Direction Elevator::getDirection() const { return direction_; }

ElevatorPhase Elevator::getPhase() const {
    if (doorsOpen_) return ElevatorPhase::DoorsOpen;
    if (direction_ == Direction::Idle) return ElevatorPhase::Idle;
    return ElevatorPhase::Moving;
}

int Elevator::getCapacity() const { return capacity_; }

int Elevator::getPassengerCount() const {
    return static_cast<int>(passengers_.size());
}

const std::vector<Passenger>& Elevator::getPassengers() const { return passengers_; }
bool Elevator::areDoorsOpen() const { return doorsOpen_; }
std::optional<double> Elevator::getDoorTimer() const { return doorTimer_; }
const std::set<int>& Elevator::getTargets() const { return targets_; }

void Elevator::addTarget(int floor) { targets_.insert(floor); }
void Elevator::removeTarget(int floor) { targets_.erase(floor); }
bool Elevator::hasTarget(int floor) const { return targets_.count(floor) > 0; }
bool Elevator::hasAnyTargets() const { return !targets_.empty(); }

bool Elevator::hasDestination(int floor) const {
    return std::any_of(passengers_.begin(), passengers_.end(),
        [floor](const Passenger& p) { return p.destination == floor; });
}

bool Elevator::hasNeedsInDirection(Direction dir) const {
    const int sign = directionSign(dir);
    if (sign == 0) {
        return !targets_.empty() || !passengers_.empty();
    }

    auto lies = [this, sign](int floor) {
        return (floor - position_) * sign > kArrivalEpsilon;
    };
    if (std::any_of(targets_.begin(), targets_.end(), lies)) {
        return true;
    }
    // In-cab destinations count too
    return std::any_of(passengers_.begin(), passengers_.end(),
        [&lies](const Passenger& p) { return lies(p.destination); });
}

std::optional<int> Elevator::nearestTarget() const {
    if (targets_.empty()) return std::nullopt;

    // Ties go to the upper floor: iterate from the top with a strict comparison
    std::optional<int> best;
    double bestDistance = 0.0;
    for (auto it = targets_.rbegin(); it != targets_.rend(); ++it) {
        double distance = std::abs(*it - position_);
        if (!best || distance < bestDistance) {
            best = *it;
            bestDistance = distance;
        }
    }
    return best;
}

std::optional<int> Elevator::nextStop() const {
    if (targets_.empty()) return std::nullopt;

    // Nearest above first, then nearest below
    auto above = std::find_if(targets_.begin(), targets_.end(),
        [this](int f) { return f > position_; });
    if (above != targets_.end()) return *above;

    auto below = std::find_if(targets_.rbegin(), targets_.rend(),
        [this](int f) { return f < position_; });
    if (below != targets_.rend()) return *below;

    return getCurrentFloor();
}

Direction Elevator::loadDirection(int floor) const {
    int up = 0;
    int down = 0;
    for (const auto& p : passengers_) {
        if (p.destination > floor) ++up;
        else if (p.destination < floor) ++down;
    }
    if (up > down) return Direction::Up;
    if (down > up) return Direction::Down;
    return direction_;
}

bool Elevator::canBoard() const {
    return static_cast<int>(passengers_.size()) < capacity_;
}

void Elevator::board(Passenger passenger, double now) {
    passenger.boardTime = now;
    targets_.insert(passenger.destination);
    passengers_.push_back(std::move(passenger));
}

std::vector<Passenger> Elevator::unloadAt(int floor, double now) {
    std::vector<Passenger> alighted;
    std::vector<Passenger> remaining;
    remaining.reserve(passengers_.size());

    for (auto& p : passengers_) {
        if (p.destination == floor) {
            p.alightTime = now;
            alighted.push_back(std::move(p));
        } else {
            remaining.push_back(std::move(p));
        }
    }
    passengers_ = std::move(remaining);
    return alighted;
}

void Elevator::setDirection(Direction dir) { direction_ = dir; }

void Elevator::openDoors(double dwellSec) {
    doorsOpen_ = true;
    doorTimer_ = dwellSec;
    velocity_ = 0.0;
}

std::optional<int> Elevator::advance(double dt, const MotionLimits& limits, int topFloor) {
    if (doorsOpen_) {
        *doorTimer_ -= dt;
        if (*doorTimer_ > 0.0) {
            return std::nullopt;
        }
        doorsOpen_ = false;
        doorTimer_.reset();

        // Re-targeted while the doors were open: serve it again right away
        int here = getCurrentFloor();
        if (targets_.count(here)) {
            return here;
        }
        commitDirectionAfterDwell();
        return std::nullopt;
    }

    if (direction_ == Direction::Idle) {
        velocity_ = 0.0;
        auto target = nearestTarget();
        if (!target) {
            return std::nullopt;
        }
        if (std::abs(*target - position_) < kArrivalEpsilon) {
            position_ = *target;
            return *target;
        }
        // Start toward the nearest target above, else the nearest below
        direction_ = (*nextStop() > position_) ? Direction::Up : Direction::Down;
    }

    return move(dt, limits, topFloor);
}

std::optional<int> Elevator::nextTargetAhead(double dt, const MotionLimits& limits) const {
    const int sign = directionSign(direction_);
    // Slowest speed reachable this tick; targets that need less are passed
    const double minSpeed = std::abs(velocity_) - limits.acceleration * dt;
    std::optional<int> best;
    double bestDistance = 0.0;
    for (int floor : targets_) {
        double ahead = (floor - position_) * sign;
        if (ahead <= -kArrivalEpsilon) continue;
        if (brakingSpeed(std::max(0.0, ahead), dt, limits) < minSpeed - 1e-9) continue;
        if (!best || ahead < bestDistance) {
            best = floor;
            bestDistance = ahead;
        }
    }
    return best;
}

std::optional<int> Elevator::move(double dt, const MotionLimits& limits, int topFloor) {
    const int sign = directionSign(direction_);
    double speed = std::abs(velocity_);

    // Still travelling against the committed direction: brake before reversing
    if (velocity_ * sign < 0.0) {
        speed = std::max(0.0, speed - limits.acceleration * dt);
        velocity_ = (velocity_ > 0.0 ? 1.0 : -1.0) * speed;
        integrate(dt, topFloor);
        return std::nullopt;
    }

    if (auto target = nextTargetAhead(dt, limits)) {
        double remaining = std::max(0.0, (*target - position_) * sign);
        double stepDown = std::max(0.0, speed - limits.acceleration * dt);
        speed = std::min({speed + limits.acceleration * dt, limits.topSpeed,
                          brakingSpeed(remaining, dt, limits)});
        speed = std::max(speed, stepDown);

        if (speed * dt >= remaining) {
            position_ = *target;
            velocity_ = 0.0;
            return *target;
        }
        velocity_ = sign * speed;
        integrate(dt, topFloor);
        return std::nullopt;
    }

    // Nothing ahead: bleed off speed rather than sail past
    speed = std::max(0.0, speed - limits.acceleration * dt);
    velocity_ = sign * speed;
    integrate(dt, topFloor);

    if (velocity_ == 0.0) {
        Direction back = opposite(direction_);
        direction_ = hasNeedsInDirection(back) ? back : Direction::Idle;
    }
    return std::nullopt;
}

void Elevator::integrate(double dt, int topFloor) {
    position_ += velocity_ * dt;
    if (position_ < 0.0) {
        position_ = 0.0;
        velocity_ = 0.0;
    } else if (position_ > topFloor) {
        position_ = topFloor;
        velocity_ = 0.0;
    }
}

void Elevator::commitDirectionAfterDwell() {
    if (direction_ != Direction::Idle && hasNeedsInDirection(direction_)) {
        return;
    }

    if (direction_ != Direction::Idle) {
        Direction back = opposite(direction_);
        direction_ = hasNeedsInDirection(back) ? back : Direction::Idle;
        return;
    }

    if (hasNeedsInDirection(Direction::Up)) {
        direction_ = Direction::Up;
    } else if (hasNeedsInDirection(Direction::Down)) {
        direction_ = Direction::Down;
    }
}

// ============== Building Implementation ==============

Building::Building(const Config& config) : config_(config) {
    // Floors are 0-indexed, floor 0 is the lobby
    floors_.reserve(config.numFloors);
    for (int i = 0; i < config.numFloors; ++i) {
        floors_.emplace_back(i);
    }

    elevators_.reserve(config.numElevators);
    for (int i = 0; i < config.numElevators; ++i) {
        elevators_.push_back(
            std::make_unique<Elevator>(i, config.carCapacity, 0.0)
        );
    }
}

int Building::getNumFloors() const { return config_.numFloors; }
int Building::getNumElevators() const { return config_.numElevators; }
const Config& Building::getConfig() const { return config_; }

Elevator& Building::getElevator(int id) {
    if (!isValidElevator(id)) {
        throw std::out_of_range("Invalid elevator ID: " + std::to_string(id));
    }
    return *elevators_[id];
}

const Elevator& Building::getElevator(int id) const {
    if (!isValidElevator(id)) {
        throw std::out_of_range("Invalid elevator ID: " + std::to_string(id));
    }
    return *elevators_[id];
}

Floor& Building::getFloor(int number) {
    if (!isValidFloor(number)) {
        throw std::out_of_range("Invalid floor number: " + std::to_string(number));
    }
    return floors_[number];
}

const Floor& Building::getFloor(int number) const {
    if (!isValidFloor(number)) {
        throw std::out_of_range("Invalid floor number: " + std::to_string(number));
    }
    return floors_[number];
}

void Building::enqueuePassenger(Passenger passenger) {
    if (!isValidFloor(passenger.origin)) return;
    floors_[passenger.origin].enqueue(std::move(passenger));
}

bool Building::hasHallCall(int floor, Direction dir) const {
    if (!isValidFloor(floor)) return false;
    return floors_[floor].hasCall(dir);
}

std::vector<std::pair<int, Direction>> Building::getAllHallCalls() const {
    std::vector<std::pair<int, Direction>> calls;

    for (const auto& floor : floors_) {
        if (floor.hasCall(Direction::Up)) {
            calls.emplace_back(floor.getNumber(), Direction::Up);
        }
        if (floor.hasCall(Direction::Down)) {
            calls.emplace_back(floor.getNumber(), Direction::Down);
        }
    }

    return calls;
}

void Building::reconcileClaims() {
    for (auto& floor : floors_) {
        for (Direction dir : {Direction::Up, Direction::Down}) {
            auto owner = floor.getClaim(dir);
            if (!owner) continue;

            if (!floor.hasCall(dir)) {
                dropClaim(floor.getNumber(), dir);
            } else if (!elevators_[*owner]->hasTarget(floor.getNumber())) {
                // Assignment abandoned
                floor.clearClaim(dir);
            }
        }
    }
}

std::vector<int> Building::getClaimableCalls(Direction dir) const {
    std::vector<int> calls;
    for (const auto& floor : floors_) {
        if (floor.hasCall(dir) && !floor.getClaim(dir)) {
            calls.push_back(floor.getNumber());
        }
    }
    return calls;
}

std::vector<int> Building::getOwnedCalls(int elevatorId, Direction dir) const {
    std::vector<int> calls;
    for (const auto& floor : floors_) {
        if (floor.hasCall(dir) && floor.getClaim(dir) == elevatorId) {
            calls.push_back(floor.getNumber());
        }
    }
    return calls;
}

Grant Building::grantTarget(int elevatorId, int floor) {
    Grant grant;
    if (!isValidElevator(elevatorId) || !isValidFloor(floor)) {
        return grant;
    }

    Elevator& elev = *elevators_[elevatorId];
    Floor& f = floors_[floor];

    // No one waiting: destination or repositioning target
    if (!f.hasCall(Direction::Up) && !f.hasCall(Direction::Down)) {
        elev.addTarget(floor);
        grant.granted = true;
        return grant;
    }

    if (f.getClaim(Direction::Up) == elevatorId || f.getClaim(Direction::Down) == elevatorId) {
        elev.addTarget(floor);
        grant.granted = true;
        return grant;
    }

    // A full car could not board anyone there
    if (!elev.canBoard()) {
        grant.granted = elev.hasTarget(floor);
        return grant;
    }

    auto dir = preferredClaimDirection(elev, f);
    if (!dir) {
        return grant;
    }

    f.setClaim(*dir, elevatorId);
    elev.addTarget(floor);
    grant.granted = true;
    grant.claimed = dir;
    return grant;
}

void Building::releaseClaimsAt(int elevatorId, int floor) {
    if (!isValidFloor(floor)) return;

    Floor& f = floors_[floor];
    for (Direction dir : {Direction::Up, Direction::Down}) {
        if (f.getClaim(dir) == elevatorId) {
            f.clearClaim(dir);
        }
    }
    // Another car may hold a claim on a queue this stop just emptied
    for (Direction dir : {Direction::Up, Direction::Down}) {
        if (!f.hasCall(dir) && f.getClaim(dir)) {
            dropClaim(floor, dir);
        }
    }
}

int Building::getWaitingCount() const {
    int count = 0;
    for (const auto& floor : floors_) {
        count += floor.waitingCount(Direction::Up) + floor.waitingCount(Direction::Down);
    }
    return count;
}

int Building::getOnboardCount() const {
    int count = 0;
    for (const auto& elev : elevators_) {
        count += elev->getPassengerCount();
    }
    return count;
}

bool Building::isValidFloor(int floor) const {
    return floor >= 0 && floor < config_.numFloors;
}

bool Building::isValidElevator(int id) const {
    return id >= 0 && id < config_.numElevators;
}

bool Building::elevatorNeedsFloor(int elevatorId, int floor) const {
    const Floor& f = floors_[floor];
    return elevators_[elevatorId]->hasDestination(floor) ||
           f.getClaim(Direction::Up) == elevatorId ||
           f.getClaim(Direction::Down) == elevatorId;
}

void Building::dropClaim(int floor, Direction dir) {
    Floor& f = floors_[floor];
    auto owner = f.getClaim(dir);
    f.clearClaim(dir);
    if (owner && !elevatorNeedsFloor(*owner, floor)) {
        elevators_[*owner]->removeTarget(floor);
    }
}

std::optional<Direction> Building::preferredClaimDirection(const Elevator& elev,
                                                           const Floor& floor) const {
    auto available = [&floor](Direction dir) {
        return floor.hasCall(dir) && !floor.getClaim(dir);
    };

    // Approach direction, then travel direction, then up before down
    std::vector<Direction> order;
    double approach = floor.getNumber() - elev.getPosition();
    if (approach > kArrivalEpsilon) {
        order.push_back(Direction::Up);
    } else if (approach < -kArrivalEpsilon) {
        order.push_back(Direction::Down);
    }
    if (elev.getDirection() != Direction::Idle) {
        order.push_back(elev.getDirection());
    }
    order.push_back(Direction::Up);
    order.push_back(Direction::Down);

    for (Direction dir : order) {
        if (available(dir)) return dir;
    }
    return std::nullopt;
}
