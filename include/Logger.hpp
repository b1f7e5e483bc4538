#ifndef LOGGER_HPP
#define LOGGER_HPP

#include "Domain.hpp"
#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

// ============== Logger ==============

class Logger {
private:
    mutable std::mutex mutex_;
    std::ostream& out_;
    std::atomic<bool> enabled_;

public:
    explicit Logger(std::ostream& out = std::cout, bool enabled = true);

    void log(const std::string& message);
    void logPark(const Ticket& ticket);
    void logExit(const Receipt& receipt, const std::string& spotId);
    void logRejected(const Error& error);

    void enable();
    void disable();
    bool isEnabled() const;

private:
    std::string getTimestamp() const;
};

#endif // LOGGER_HPP
