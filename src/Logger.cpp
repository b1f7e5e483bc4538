#include "Logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

// ============== Logger Implementation ==============

Logger::Logger(std::ostream& out, bool enabled)
    : out_(out), enabled_(enabled) {}

void Logger::log(const std::string& message) {
    if (!enabled_) return;

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << getTimestamp() << " " << message << "\n";
}

void Logger::logPark(const Ticket& ticket) {
    log("[PARK] vehicle=" + ticket.vehicleId +
        " class=" + classToString(ticket.vehicleClass) +
        " spot=" + ticket.spotId +
        " ticket=" + ticket.ticketId);
}

void Logger::logExit(const Receipt& receipt, const std::string& spotId) {
    std::ostringstream oss;
    oss << "[EXIT] ticket=" << receipt.ticketId
        << " spot=" << spotId
        << " amount=" << std::fixed << std::setprecision(2) << receipt.amountDue;
    log(oss.str());
}

void Logger::logRejected(const Error& error) {
    log("[REJECTED] " + errorKindToString(error.kind) + ": " + error.message);
}

void Logger::enable() { enabled_ = true; }
void Logger::disable() { enabled_ = false; }
bool Logger::isEnabled() const { return enabled_; }

std::string Logger::getTimestamp() const {
    auto now = std::chrono::system_clock::now();
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time, &local);

    std::ostringstream oss;
    oss << "[" << std::put_time(&local, "%H:%M:%S") << "]";
    return oss.str();
}
