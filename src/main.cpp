#include "Simulation.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

struct RunOptions {
    double durationSec = 0.0;   // > 0 runs headless
    bool verbose = false;
};

void printUsage(const char* progName) {
    std::cout << "Usage: " << progName << " [options]\n"
              << "\nOptions:\n"
              << "  -f, --floors <n>      Number of floors (2-50, default: 10)\n"
              << "  -e, --elevators <n>   Number of elevators (1-16, default: 3)\n"
              << "  -c, --capacity <n>    Car capacity (1-50, default: 8)\n"
              << "  -s, --speed <x>       Top speed in floors/s (0.1-10, default: 1.5)\n"
              << "  -a, --accel <x>       Acceleration in floors/s^2 (0.1-20, default: speed)\n"
              << "  -d, --dwell <sec>     Door dwell time (0-30, default: 1.0)\n"
              << "  -r, --rate <n>        Spawn rate in people/min (0-500, default: 40)\n"
              << "  -b, --bias <x>        Ground floor bias (1-6, default: 3.0)\n"
              << "  -l, --lobby <pct>     To-lobby preference (0-100, default: 70)\n"
              << "  -m, --algorithm <k>   nearest|exclusiveNearest|collective|zoned|idleLobby\n"
              << "  -t, --tick <ms>       Tick duration in ms (10-1000, default: 50)\n"
              << "      --seed <n>        Seed for passenger generation\n"
              << "      --duration <sec>  Run headless for the given simulated time\n"
              << "  -v, --verbose         Log events in headless mode\n"
              << "  -h, --help            Show this help\n"
              << "\nExample:\n"
              << "  " << progName << " -f 20 -e 4 -m zoned --duration 600\n";
}

bool inRange(double value, double lo, double hi) {
    return value >= lo && value <= hi;
}

bool parseArgs(int argc, char* argv[], Config& config, RunOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;

        try {
            if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return false;
            }
            else if ((arg == "-f" || arg == "--floors") && hasValue) {
                config.numFloors = std::stoi(argv[++i]);
                if (!inRange(config.numFloors, 2, 50)) {
                    std::cerr << "Error: floors must be 2-50\n";
                    return false;
                }
            }
            else if ((arg == "-e" || arg == "--elevators") && hasValue) {
                config.numElevators = std::stoi(argv[++i]);
                if (!inRange(config.numElevators, 1, 16)) {
                    std::cerr << "Error: elevators must be 1-16\n";
                    return false;
                }
            }
            else if ((arg == "-c" || arg == "--capacity") && hasValue) {
                config.carCapacity = std::stoi(argv[++i]);
                if (!inRange(config.carCapacity, 1, 50)) {
                    std::cerr << "Error: capacity must be 1-50\n";
                    return false;
                }
            }
            else if ((arg == "-s" || arg == "--speed") && hasValue) {
                config.speedFloorsPerSec = std::stod(argv[++i]);
                if (!inRange(config.speedFloorsPerSec, 0.1, 10.0)) {
                    std::cerr << "Error: speed must be 0.1-10\n";
                    return false;
                }
            }
            else if ((arg == "-a" || arg == "--accel") && hasValue) {
                config.accelerationFloorsPerSec2 = std::stod(argv[++i]);
                if (!inRange(*config.accelerationFloorsPerSec2, 0.1, 20.0)) {
                    std::cerr << "Error: acceleration must be 0.1-20\n";
                    return false;
                }
            }
            else if ((arg == "-d" || arg == "--dwell") && hasValue) {
                config.stopDurationSec = std::stod(argv[++i]);
                if (!inRange(config.stopDurationSec, 0.0, 30.0)) {
                    std::cerr << "Error: dwell must be 0-30 seconds\n";
                    return false;
                }
            }
            else if ((arg == "-r" || arg == "--rate") && hasValue) {
                config.spawnRatePerMin = std::stod(argv[++i]);
                if (!inRange(config.spawnRatePerMin, 0.0, 500.0)) {
                    std::cerr << "Error: rate must be 0-500\n";
                    return false;
                }
            }
            else if ((arg == "-b" || arg == "--bias") && hasValue) {
                config.groundBias = std::stod(argv[++i]);
                if (!inRange(config.groundBias, 1.0, 6.0)) {
                    std::cerr << "Error: bias must be 1-6\n";
                    return false;
                }
            }
            else if ((arg == "-l" || arg == "--lobby") && hasValue) {
                config.toLobbyPct = std::stod(argv[++i]);
                if (!inRange(config.toLobbyPct, 0.0, 100.0)) {
                    std::cerr << "Error: lobby preference must be 0-100\n";
                    return false;
                }
            }
            else if ((arg == "-m" || arg == "--algorithm") && hasValue) {
                auto kind = parseAlgorithmKind(argv[++i]);
                // Custom needs a decision function from the embedding application
                if (!kind || *kind == AlgorithmKind::Custom) {
                    std::cerr << "Error: algorithm must be one of "
                              << "nearest|exclusiveNearest|collective|zoned|idleLobby\n";
                    return false;
                }
                config.algorithm = *kind;
            }
            else if ((arg == "-t" || arg == "--tick") && hasValue) {
                config.tickDurationMs = std::stoi(argv[++i]);
                if (!inRange(config.tickDurationMs, 10, 1000)) {
                    std::cerr << "Error: tick must be 10-1000 ms\n";
                    return false;
                }
            }
            else if (arg == "--seed" && hasValue) {
                config.randomSeed = static_cast<std::uint32_t>(std::stoul(argv[++i]));
            }
            else if (arg == "--duration" && hasValue) {
                options.durationSec = std::stod(argv[++i]);
                if (options.durationSec <= 0.0) {
                    std::cerr << "Error: duration must be positive\n";
                    return false;
                }
            }
            else if (arg == "-v" || arg == "--verbose") {
                options.verbose = true;
            }
            else {
                std::cerr << "Unknown option: " << arg << "\n";
                printUsage(argv[0]);
                return false;
            }
        } catch (const std::invalid_argument&) {
            std::cerr << "Error: invalid value for " << arg << "\n";
            return false;
        } catch (const std::out_of_range&) {
            std::cerr << "Error: value out of range for " << arg << "\n";
            return false;
        }
    }
    return true;
}

int main(int argc, char* argv[]) {
    Config config;
    RunOptions options;

    if (!parseArgs(argc, argv, config, options)) {
        return 1;
    }
    config = clampConfig(config);

    std::cout << "========================================\n"
              << "        Elevator Fleet Simulator        \n"
              << "========================================\n"
              << "Configuration:\n"
              << "  Floors:     " << config.numFloors << "\n"
              << "  Elevators:  " << config.numElevators << "\n"
              << "  Capacity:   " << config.carCapacity << "\n"
              << "  Speed:      " << config.speedFloorsPerSec << " floors/s\n"
              << "  Accel:      " << config.acceleration() << " floors/s^2\n"
              << "  Spawn rate: " << config.spawnRatePerMin << " ppl/min\n"
              << "  Algorithm:  " << algorithmKindToString(config.algorithm) << "\n"
              << "  Tick:       " << config.tickDurationMs << " ms\n"
              << "========================================\n";

    try {
        SimulationEngine engine(config);

        if (options.durationSec > 0.0) {
            if (!options.verbose) {
                engine.getLogger().disable();
            }
            const double tickSec = config.tickDurationMs / 1000.0;
            while (engine.getTime() < options.durationSec) {
                engine.tick(tickSec);
            }
            engine.printStatus();
            engine.printStats();
        } else {
            CLI cli(engine);
            cli.run();
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Simulation ended.\n";
    return 0;
}
