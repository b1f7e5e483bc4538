#include "Simulation.hpp"
#include <iomanip>
#include <sstream>
#include <thread>

// ============== CLI Implementation ==============

CLI::CLI(Facility& facility, std::ostream& out)
    : facility_(facility), out_(out) {}

void CLI::run(std::istream& in) {
    printHelp();

    std::string line;
    while (running_.load() && std::getline(in, line)) {
        if (line.empty()) continue;
        processCommand(line);
    }
}

void CLI::stop() {
    running_.store(false);
}

void CLI::printHelp() {
    out_ << "\n=== Parking Lot CLI ===\n"
         << "Commands:\n"
         << "  park <type> <plate>  - Park a car|bus|motorcycle (e.g., 'park car ABC123')\n"
         << "  exit <ticket>        - Leave and print the receipt\n"
         << "  class <spot>         - Show the vehicle class of a spot (e.g., 'class L1-C2')\n"
         << "  status               - Print free spots per level\n"
         << "  help                 - Show this help\n"
         << "  quit                 - Exit\n"
         << "\n";
}

void CLI::printStatus() const {
    static const VehicleClass classes[] = {
        VehicleClass::Car, VehicleClass::Bus, VehicleClass::Motorcycle
    };

    out_ << "\n========== Status ==========\n";
    for (int n = 1; n <= facility_.getNumLevels(); ++n) {
        const Level& level = facility_.getLevel(n);
        out_ << "Level " << level.getNumber() << ":";
        for (VehicleClass cls : classes) {
            out_ << " " << classToString(cls) << " "
                 << level.countFree(cls) << "/" << level.countSpots(cls);
        }
        out_ << "\n";
    }
    out_ << "Outstanding tickets: " << facility_.outstandingTickets() << "\n"
         << "============================\n\n";
}

void CLI::processCommand(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;

    std::string args;
    std::getline(iss, args);

    if (cmd == "park") {
        if (!parsePark(args)) {
            out_ << "Usage: park <car|bus|motorcycle> <plate>\n";
        }
    }
    else if (cmd == "exit") {
        if (!parseExit(args)) {
            out_ << "Usage: exit <ticket_id>\n";
        }
    }
    else if (cmd == "class") {
        if (!parseClass(args)) {
            out_ << "Usage: class <spot_id>\n";
        }
    }
    else if (cmd == "status") {
        printStatus();
    }
    else if (cmd == "help") {
        printHelp();
    }
    else if (cmd == "quit" || cmd == "q") {
        running_.store(false);
    }
    else {
        out_ << "Unknown command: " << cmd << ". Type 'help' for usage.\n";
    }
}

bool CLI::parsePark(const std::string& args) {
    std::istringstream iss(args);
    std::string type, plate;

    if (!(iss >> type >> plate)) {
        return false;
    }

    auto vehicle = makeVehicle(type, plate);
    if (!vehicle) {
        out_ << "Error: " << vehicle.error().message << "\n";
        return true;
    }

    auto ticket = facility_.park(vehicle.value());
    if (!ticket) {
        out_ << "Error: " << ticket.error().message << "\n";
        return true;
    }

    out_ << "Parked at: " << ticket->spotId << "  Ticket: " << ticket->ticketId << "\n";
    return true;
}

bool CLI::parseExit(const std::string& args) {
    std::istringstream iss(args);
    std::string ticketId;

    if (!(iss >> ticketId)) {
        return false;
    }

    auto receipt = facility_.exit(ticketId);
    if (!receipt) {
        out_ << "Error: " << receipt.error().message << "\n";
        return true;
    }

    out_ << receipt->toString() << "  (exit " << formatTime(receipt->exitTime) << ")\n";
    return true;
}

bool CLI::parseClass(const std::string& args) {
    std::istringstream iss(args);
    std::string spotId;

    if (!(iss >> spotId)) {
        return false;
    }

    auto cls = facility_.lookupSpotClass(spotId);
    if (!cls) {
        out_ << "Error: Unknown spot: " << spotId << "\n";
    } else {
        out_ << spotId << ": " << classToString(*cls) << "\n";
    }
    return true;
}

// ============== Demo ==============

Config demoConfig() {
    Config config;
    config.spotsPerLevel = {
        {VehicleClass::Car, 5},
        {VehicleClass::Bus, 1},
        {VehicleClass::Motorcycle, 3}
    };
    return config;
}

void runDemo(Facility& facility, std::ostream& out, std::chrono::milliseconds stay) {
    auto vehicle = makeVehicle("car", "ABC123");
    if (!vehicle) {
        out << "Error: " << vehicle.error().message << "\n";
        return;
    }

    auto ticket = facility.park(vehicle.value());
    if (!ticket) {
        out << "Error: " << ticket.error().message << "\n";
        return;
    }
    out << "Parked at: " << ticket->spotId << "  Ticket: " << ticket->ticketId << "\n";

    std::this_thread::sleep_for(stay);

    auto receipt = facility.exit(ticket->ticketId);
    if (!receipt) {
        out << "Error: " << receipt.error().message << "\n";
        return;
    }
    out << receipt->toString() << "\n";
}
