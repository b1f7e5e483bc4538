#ifndef DOMAIN_HPP
#define DOMAIN_HPP

#include "Types.hpp"
#include <vector>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

// ============== Vehicle ==============

VehicleClass requiredClass(const Vehicle& vehicle);
const std::string& plateOf(const Vehicle& vehicle);

// Build a vehicle from a case-insensitive type tag ("car", "bus", "motorcycle")
Result<Vehicle> makeVehicle(const std::string& typeTag, const std::string& plate);

// ============== Spot ==============

class Spot {
private:
    std::string id_;
    VehicleClass class_;
    bool occupied_ = false;

    mutable std::mutex mutex_;

public:
    Spot(std::string id, VehicleClass cls);

    // Non-copyable
    Spot(const Spot&) = delete;
    Spot& operator=(const Spot&) = delete;

    // Occupy if free. Never waits for the spot to become free.
    bool claim();
    // Idempotent
    void release();

    const std::string& getId() const;
    VehicleClass getClass() const;
    bool isOccupied() const;
};

// ============== Level ==============

class Level {
private:
    int levelNumber_;
    std::vector<std::unique_ptr<Spot>> spots_;  // Creation order

public:
    Level(int number, const std::vector<std::pair<VehicleClass, int>>& layout);

    // First free spot of the class in creation order, claimed for the caller
    Spot* findAndClaim(VehicleClass cls);

    Spot* findSpot(const std::string& spotId);
    const Spot* findSpot(const std::string& spotId) const;

    int getNumber() const;
    const std::vector<std::unique_ptr<Spot>>& getSpots() const;

    int countSpots(VehicleClass cls) const;
    int countFree(VehicleClass cls) const;
};

// ============== Ticket / Receipt ==============

struct Ticket {
    std::string ticketId;
    std::string vehicleId;  // Plate
    VehicleClass vehicleClass;
    std::string spotId;
    TimePoint entryTime;
};

struct Receipt {
    std::string ticketId;
    TimePoint exitTime;
    double amountDue = 0.0;

    // "Receipt(<id>): $12.00"
    std::string toString() const;
};

// Random (v4) UUID in lowercase text form
std::string generateTicketId();

std::string spotIdFor(int level, VehicleClass cls, int index);

std::string formatTime(TimePoint time);

#endif // DOMAIN_HPP
