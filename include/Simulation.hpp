#ifndef SIMULATION_HPP
#define SIMULATION_HPP

#include "Types.hpp"
#include "Facility.hpp"
#include <atomic>
#include <chrono>
#include <iostream>
#include <string>

// ============== CLI ==============
// Line-oriented console driving one facility

class CLI {
private:
    Facility& facility_;
    std::ostream& out_;
    std::atomic<bool> running_{true};

public:
    explicit CLI(Facility& facility, std::ostream& out = std::cout);

    // Reads commands until "quit" or end of input
    void run(std::istream& in = std::cin);
    void stop();

    void printHelp();
    void printStatus() const;

private:
    void processCommand(const std::string& line);
    bool parsePark(const std::string& args);
    bool parseExit(const std::string& args);
    bool parseClass(const std::string& args);
};

// ============== Demo ==============

// Lot with Car=5, Bus=1, Motorcycle=3 per level
Config demoConfig();

// Park one car, wait, exit and print the receipt
void runDemo(Facility& facility, std::ostream& out,
             std::chrono::milliseconds stay = std::chrono::seconds(1));

#endif // SIMULATION_HPP
