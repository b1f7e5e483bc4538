#include "Facility.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>

namespace {

void validateConfig(const Config& config) {
    if (config.numLevels < 1) {
        throw std::invalid_argument(
            "Facility needs at least one level, got " + std::to_string(config.numLevels));
    }

    std::set<VehicleClass> seen;
    for (const auto& [cls, count] : config.spotsPerLevel) {
        if (count < 0) {
            throw std::invalid_argument("Negative spot count for " + classToString(cls));
        }
        if (!seen.insert(cls).second) {
            throw std::invalid_argument("Spot class listed twice: " + classToString(cls));
        }
    }
}

} // namespace

double computeFee(std::optional<VehicleClass> cls, double elapsedHours) {
    double rate = cls ? hourlyRate(*cls) : 0.0;
    return std::max(1.0, elapsedHours) * rate;
}

// ============== Facility Implementation ==============

Facility::Facility(const Config& config, std::shared_ptr<IClock> clock, Logger* logger)
    : config_(config), clock_(std::move(clock)), logger_(logger) {

    validateConfig(config_);

    if (!clock_) {
        clock_ = std::make_shared<SystemClock>();
    }

    // Create levels (1-indexed)
    levels_.reserve(config_.numLevels);
    for (int i = 1; i <= config_.numLevels; ++i) {
        levels_.emplace_back(i, config_.spotsPerLevel);
    }

    if (logger_) {
        logger_->log("Facility initialized with " + std::to_string(config_.numLevels) +
                     " levels, per level: " +
                     std::to_string(getLevel(1).getSpots().size()) + " spots");
    }
}

Result<Ticket> Facility::park(const Vehicle& vehicle) {
    VehicleClass needed = requiredClass(vehicle);

    for (auto& level : levels_) {
        Spot* spot = level.findAndClaim(needed);
        if (spot) {
            Ticket ticket = registerTicket(vehicle, *spot);
            if (logger_) logger_->logPark(ticket);
            return ticket;
        }
    }

    Error error{ErrorKind::Capacity, "Lot full for " + classToString(needed)};
    if (logger_) logger_->logRejected(error);
    return error;
}

Ticket Facility::registerTicket(const Vehicle& vehicle, const Spot& spot) {
    Ticket ticket{generateTicketId(), plateOf(vehicle), requiredClass(vehicle),
                  spot.getId(), clock_->now()};

    std::lock_guard<std::mutex> lock(mutex_);
    // Random ids make a collision practically impossible; redraw if it happens
    while (!tickets_.emplace(ticket.ticketId, ticket).second) {
        ticket.ticketId = generateTicketId();
    }
    return ticket;
}

Result<Receipt> Facility::exit(const std::string& ticketId) {
    std::optional<Ticket> ticket;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tickets_.find(ticketId);
        if (it != tickets_.end()) {
            ticket = std::move(it->second);
            tickets_.erase(it);
        }
    }

    if (!ticket) {
        Error error{ErrorKind::InvalidTicket, "Invalid ticket: " + ticketId};
        if (logger_) logger_->logRejected(error);
        return error;
    }

    TimePoint exitTime = clock_->now();
    double hours = std::chrono::duration<double, std::ratio<3600>>(
        exitTime - ticket->entryTime).count();

    Receipt receipt;
    receipt.ticketId = ticket->ticketId;
    receipt.exitTime = exitTime;
    receipt.amountDue = computeFee(lookupSpotClass(ticket->spotId), hours);

    if (Spot* spot = findSpot(ticket->spotId)) {
        spot->release();
    }

    if (logger_) logger_->logExit(receipt, ticket->spotId);
    return receipt;
}

std::optional<VehicleClass> Facility::lookupSpotClass(const std::string& spotId) const {
    for (const auto& level : levels_) {
        if (const Spot* spot = level.findSpot(spotId)) {
            return spot->getClass();
        }
    }
    return std::nullopt;
}

Spot* Facility::findSpot(const std::string& spotId) {
    for (auto& level : levels_) {
        if (Spot* spot = level.findSpot(spotId)) {
            return spot;
        }
    }
    return nullptr;
}

int Facility::getNumLevels() const { return config_.numLevels; }
const Config& Facility::getConfig() const { return config_; }

const Level& Facility::getLevel(int number) const {
    if (number < 1 || number > config_.numLevels) {
        throw std::out_of_range("Invalid level number: " + std::to_string(number));
    }
    return levels_[number - 1];  // Convert 1-indexed to 0-indexed
}

std::optional<Ticket> Facility::findTicket(const std::string& ticketId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tickets_.find(ticketId);
    if (it == tickets_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t Facility::outstandingTickets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tickets_.size();
}

int Facility::freeSpots(VehicleClass cls) const {
    int total = 0;
    for (const auto& level : levels_) {
        total += level.countFree(cls);
    }
    return total;
}

int Facility::totalSpots(VehicleClass cls) const {
    int total = 0;
    for (const auto& level : levels_) {
        total += level.countSpots(cls);
    }
    return total;
}
