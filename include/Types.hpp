#ifndef TYPES_HPP
#define TYPES_HPP

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>

// ============== Enums =============

enum class Direction {
    Up,
    Down,
    Idle
};

enum class ElevatorPhase {
    Idle,           // Stationary, no targets
    Moving,         // Committed to a direction, possibly still accelerating
    DoorsOpen       // Serving a floor, dwell countdown running
};

enum class AlgorithmKind {
    Nearest,
    ExclusiveNearest,
    Collective,
    Zoned,
    IdleLobby,
    Custom
};

// ============== Passenger ==============

struct Passenger {
    int id = 0;
    int origin = 0;
    int destination = 0;
    double spawnTime = 0.0;
    std::optional<double> boardTime;
    std::optional<double> alightTime;
};

// ============== Configuration ==============

struct Config {
    int numFloors = 10;
    int numElevators = 3;
    int carCapacity = 8;
    double speedFloorsPerSec = 1.5;
    std::optional<double> accelerationFloorsPerSec2;  // Defaults to speed
    double stopDurationSec = 1.0;
    double spawnRatePerMin = 40.0;
    double groundBias = 3.0;      // Spawn weight of floor 0
    double toLobbyPct = 70.0;     // Chance an upper-floor passenger heads to 0
    AlgorithmKind algorithm = AlgorithmKind::Nearest;
    std::optional<std::uint32_t> randomSeed;
    int tickDurationMs = 50;      // Console step size

    double acceleration() const {
        return accelerationFloorsPerSec2.value_or(speedFloorsPerSec);
    }
};

// ============== Statistics ==============

struct SimStats {
    double elapsedSec = 0.0;
    int completed = 0;
    double throughputPerMin = 0.0;
    double avgWaitSec = 0.0;
    double maxWaitSec = 0.0;
};

// ============== Utility Functions ==============

inline int directionSign(Direction dir) {
    switch (dir) {
        case Direction::Up: return 1;
        case Direction::Down: return -1;
        case Direction::Idle: return 0;
    }
    return 0;
}

inline Direction opposite(Direction dir) {
    if (dir == Direction::Up) return Direction::Down;
    if (dir == Direction::Down) return Direction::Up;
    return Direction::Idle;
}

inline std::string directionToString(Direction dir) {
    switch (dir) {
        case Direction::Up: return "Up";
        case Direction::Down: return "Down";
        case Direction::Idle: return "Idle";
    }
    return "Unknown";
}

inline std::string phaseToString(ElevatorPhase phase) {
    switch (phase) {
        case ElevatorPhase::Idle: return "Idle";
        case ElevatorPhase::Moving: return "Moving";
        case ElevatorPhase::DoorsOpen: return "DoorsOpen";
    }
    return "Unknown";
}

inline std::string algorithmKindToString(AlgorithmKind kind) {
    switch (kind) {
        case AlgorithmKind::Nearest: return "nearest";
        case AlgorithmKind::ExclusiveNearest: return "exclusiveNearest";
        case AlgorithmKind::Collective: return "collective";
        case AlgorithmKind::Zoned: return "zoned";
        case AlgorithmKind::IdleLobby: return "idleLobby";
        case AlgorithmKind::Custom: return "custom";
    }
    return "unknown";
}

inline std::optional<AlgorithmKind> parseAlgorithmKind(const std::string& name) {
    for (AlgorithmKind kind : {AlgorithmKind::Nearest, AlgorithmKind::ExclusiveNearest,
                               AlgorithmKind::Collective, AlgorithmKind::Zoned,
                               AlgorithmKind::IdleLobby, AlgorithmKind::Custom}) {
        if (algorithmKindToString(kind) == name) {
            return kind;
        }
    }
    return std::nullopt;
}

// Clamp user-supplied settings to the ranges the engine is built for.
// The engine itself assumes a clamped config.
inline Config clampConfig(Config config) {
    config.numFloors = std::clamp(config.numFloors, 2, 50);
    config.numElevators = std::clamp(config.numElevators, 1, 16);
    config.carCapacity = std::clamp(config.carCapacity, 1, 50);
    config.speedFloorsPerSec = std::clamp(config.speedFloorsPerSec, 0.1, 10.0);
    if (config.accelerationFloorsPerSec2) {
        config.accelerationFloorsPerSec2 =
            std::clamp(*config.accelerationFloorsPerSec2, 0.1, 20.0);
    }
    config.stopDurationSec = std::clamp(config.stopDurationSec, 0.0, 30.0);
    config.spawnRatePerMin = std::clamp(config.spawnRatePerMin, 0.0, 500.0);
    config.groundBias = std::clamp(config.groundBias, 1.0, 6.0);
    config.toLobbyPct = std::clamp(config.toLobbyPct, 0.0, 100.0);
    config.tickDurationMs = std::clamp(config.tickDurationMs, 10, 1000);
    return config;
}

#endif // TYPES_HPP
