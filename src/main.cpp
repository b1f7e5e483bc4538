#include "Simulation.hpp"
#include <iostream>
#include <iomanip>

struct Options {
    Config config;
    bool demo = false;
    bool quiet = false;
};

void printUsage(const char* progName) {
    std::cout << "Usage: " << progName << " [options]\n"
              << "\nOptions:\n"
              << "  -l, --levels <n>       Number of levels (1-9, default: 2)\n"
              << "  -c, --cars <n>         Car spots per level (0-100, default: 10)\n"
              << "  -b, --buses <n>        Bus spots per level (0-100, default: 2)\n"
              << "  -m, --motorcycles <n>  Motorcycle spots per level (0-100, default: 5)\n"
              << "  -d, --demo             Run the scripted demo and exit\n"
              << "  -q, --quiet            Disable the event log\n"
              << "  -h, --help             Show this help\n"
              << "\nExample:\n"
              << "  " << progName << " -l 3 -c 20 -b 0\n";
}

bool setSpotCount(Config& config, VehicleClass cls, int count) {
    if (count < 0 || count > 100) {
        std::cerr << "Error: " << classToString(cls) << " spots must be 0-100\n";
        return false;
    }
    for (auto& entry : config.spotsPerLevel) {
        if (entry.first == cls) {
            entry.second = count;
            return true;
        }
    }
    config.spotsPerLevel.emplace_back(cls, count);
    return true;
}

bool parseArgs(int argc, char* argv[], Options& options) {
    Config& config = options.config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return false;
        }
        else if ((arg == "-l" || arg == "--levels") && i + 1 < argc) {
            config.numLevels = std::stoi(argv[++i]);
            if (config.numLevels < 1 || config.numLevels > 9) {
                std::cerr << "Error: levels must be 1-9\n";
                return false;
            }
        }
        else if ((arg == "-c" || arg == "--cars") && i + 1 < argc) {
            if (!setSpotCount(config, VehicleClass::Car, std::stoi(argv[++i]))) {
                return false;
            }
        }
        else if ((arg == "-b" || arg == "--buses") && i + 1 < argc) {
            if (!setSpotCount(config, VehicleClass::Bus, std::stoi(argv[++i]))) {
                return false;
            }
        }
        else if ((arg == "-m" || arg == "--motorcycles") && i + 1 < argc) {
            if (!setSpotCount(config, VehicleClass::Motorcycle, std::stoi(argv[++i]))) {
                return false;
            }
        }
        else if (arg == "-d" || arg == "--demo") {
            options.demo = true;
        }
        else if (arg == "-q" || arg == "--quiet") {
            options.quiet = true;
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return false;
        }
    }
    return true;
}

int main(int argc, char* argv[]) {
    Options options;

    try {
        if (!parseArgs(argc, argv, options)) {
            return 1;
        }
    } catch (const std::exception& e) {
        // std::stoi on a non-numeric value
        std::cerr << "Error: invalid numeric argument (" << e.what() << ")\n";
        return 1;
    }

    if (options.demo) {
        options.config = demoConfig();
    }

    Logger logger(std::cout, !options.quiet);
    const Config& config = options.config;

    std::cout << "========================================\n"
              << "        Parking Lot Simulation          \n"
              << "========================================\n"
              << "Configuration:\n"
              << "  Levels:     " << config.numLevels << "\n";
    for (const auto& [cls, count] : config.spotsPerLevel) {
        std::cout << "  " << std::left << std::setw(12) << (classToString(cls) + ":")
                  << count << " per level\n";
    }
    std::cout << "========================================\n";

    try {
        Facility facility(config, std::make_shared<SystemClock>(), &logger);

        if (options.demo) {
            runDemo(facility, std::cout);
        } else {
            CLI cli(facility);
            cli.run();
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Simulation ended.\n";
    return 0;
}
