#ifndef TRAFFIC_HPP
#define TRAFFIC_HPP

#include "Types.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

// ============== Passenger Generator ==============
// Arrival process: one spawn per 60/spawnRatePerMin seconds of accumulated time,
// origin biased toward the lobby, destination biased back to it.

class PassengerGenerator {
private:
    int numFloors_;
    double spawnRatePerMin_;
    double groundBias_;
    double toLobbyPct_;

    std::mt19937 rng_;
    double accumulator_ = 0.0;
    int nextId_ = 1;

public:
    PassengerGenerator(const Config& config, std::uint32_t seed);

    // Advance the arrival clock and return everyone who showed up
    std::vector<Passenger> generate(double dt, double now);

    // Manual call: a passenger at origin heading the given way.
    // Empty when no floor exists in that direction.
    std::optional<Passenger> directed(int origin, Direction dir, double now);

    double getSpawnInterval() const;
    int getSpawnedCount() const;

private:
    Passenger spawnRandom(double now);
    int uniformFloor(int lo, int hi);
};

// ============== Trip Statistics ==============

class TripStatistics {
private:
    double elapsedSec_ = 0.0;
    int completed_ = 0;
    double totalWaitSec_ = 0.0;
    double maxWaitSec_ = 0.0;

public:
    void advance(double dt);
    void recordTrip(const Passenger& passenger);

    SimStats snapshot() const;
};

#endif // TRAFFIC_HPP
