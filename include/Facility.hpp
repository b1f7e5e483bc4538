#ifndef FACILITY_HPP
#define FACILITY_HPP

#include "Types.hpp"
#include "Domain.hpp"
#include "Clock.hpp"
#include "Logger.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

// ============== Facility ==============
// Owns the levels and the registry of outstanding tickets.
//
// Every outstanding ticket maps to exactly one occupied spot and every
// occupied spot to exactly one outstanding ticket; park() and exit() are
// the only operations that change either side.

class Facility {
private:
    Config config_;
    std::vector<Level> levels_;  // Scan order for park()
    std::shared_ptr<IClock> clock_;
    Logger* logger_;             // Optional, not owned

    std::map<std::string, Ticket> tickets_;
    mutable std::mutex mutex_;   // Guards tickets_ only

public:
    // Throws std::invalid_argument for an unusable configuration
    explicit Facility(const Config& config,
                      std::shared_ptr<IClock> clock = nullptr,
                      Logger* logger = nullptr);

    // Non-copyable
    Facility(const Facility&) = delete;
    Facility& operator=(const Facility&) = delete;

    // Claim the first free spot of the vehicle's class and issue a ticket.
    // Fails with ErrorKind::Capacity when every matching spot is taken.
    Result<Ticket> park(const Vehicle& vehicle);

    // Consume the ticket, release its spot and bill at least one hour.
    // Fails with ErrorKind::InvalidTicket for unknown or consumed ids.
    Result<Receipt> exit(const std::string& ticketId);

    std::optional<VehicleClass> lookupSpotClass(const std::string& spotId) const;

    // Queries
    int getNumLevels() const;
    const Level& getLevel(int number) const;  // 1-indexed
    const Config& getConfig() const;

    std::optional<Ticket> findTicket(const std::string& ticketId) const;
    size_t outstandingTickets() const;

    int freeSpots(VehicleClass cls) const;
    int totalSpots(VehicleClass cls) const;

private:
    Spot* findSpot(const std::string& spotId);
    Ticket registerTicket(const Vehicle& vehicle, const Spot& spot);
};

// Amount due for a stay of the given length in a spot of the given class
double computeFee(std::optional<VehicleClass> cls, double elapsedHours);

#endif // FACILITY_HPP
