#include "Traffic.hpp"
#include <algorithm>
#include <limits>

// ============== Passenger Generator Implementation ==============

PassengerGenerator::PassengerGenerator(const Config& config, std::uint32_t seed)
    : numFloors_(config.numFloors),
      spawnRatePerMin_(config.spawnRatePerMin),
      groundBias_(config.groundBias),
      toLobbyPct_(config.toLobbyPct),
      rng_(seed) {}

double PassengerGenerator::getSpawnInterval() const {
    if (spawnRatePerMin_ <= 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    return 60.0 / spawnRatePerMin_;
}

int PassengerGenerator::getSpawnedCount() const {
    return nextId_ - 1;
}

std::vector<Passenger> PassengerGenerator::generate(double dt, double now) {
    std::vector<Passenger> spawned;

    accumulator_ += dt;
    const double interval = getSpawnInterval();
    while (accumulator_ >= interval) {
        accumulator_ -= interval;
        if (numFloors_ < 2) continue;
        spawned.push_back(spawnRandom(now));
    }

    return spawned;
}

std::optional<Passenger> PassengerGenerator::directed(int origin, Direction dir, double now) {
    if (origin < 0 || origin >= numFloors_) {
        return std::nullopt;
    }

    int destination;
    if (dir == Direction::Up) {
        if (origin >= numFloors_ - 1) return std::nullopt;
        destination = uniformFloor(origin + 1, numFloors_ - 1);
    } else if (dir == Direction::Down) {
        if (origin <= 0) return std::nullopt;
        destination = uniformFloor(0, origin - 1);
    } else {
        return std::nullopt;
    }

    Passenger passenger;
    passenger.id = nextId_++;
    passenger.origin = origin;
    passenger.destination = destination;
    passenger.spawnTime = now;
    return passenger;
}

Passenger PassengerGenerator::spawnRandom(double now) {
    // Lobby carries groundBias weight, every other floor weight 1
    std::vector<double> weights(numFloors_, 1.0);
    weights[0] = std::max(1.0, groundBias_);
    std::discrete_distribution<int> originDist(weights.begin(), weights.end());
    int origin = originDist(rng_);

    int destination;
    if (origin > 0) {
        std::bernoulli_distribution toLobby(toLobbyPct_ / 100.0);
        if (toLobby(rng_)) {
            destination = 0;
        } else {
            // Resample until it differs from the origin
            do {
                destination = uniformFloor(1, numFloors_ - 1);
            } while (destination == origin && numFloors_ > 2);
            if (destination == origin) destination = 0;
        }
    } else {
        destination = uniformFloor(1, numFloors_ - 1);
    }

    Passenger passenger;
    passenger.id = nextId_++;
    passenger.origin = origin;
    passenger.destination = destination;
    passenger.spawnTime = now;
    return passenger;
}

int PassengerGenerator::uniformFloor(int lo, int hi) {
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(rng_);
}

// ============== Trip Statistics Implementation ==============

void TripStatistics::advance(double dt) {
    elapsedSec_ += dt;
}

void TripStatistics::recordTrip(const Passenger& passenger) {
    double wait = passenger.boardTime.value_or(passenger.spawnTime) - passenger.spawnTime;
    totalWaitSec_ += wait;
    maxWaitSec_ = std::max(maxWaitSec_, wait);
    ++completed_;
}

SimStats TripStatistics::snapshot() const {
    SimStats stats;
    stats.elapsedSec = std::max(1e-6, elapsedSec_);
    stats.completed = completed_;
    stats.throughputPerMin = completed_ / stats.elapsedSec * 60.0;
    stats.avgWaitSec = completed_ > 0 ? totalWaitSec_ / completed_ : 0.0;
    stats.maxWaitSec = maxWaitSec_;
    return stats;
}
