#include "Domain.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <uuid/uuid.h>

// ============== Vehicle Implementation ==============

namespace {

struct RequiredClassVisitor {
    VehicleClass operator()(const Motorcycle&) const { return VehicleClass::Motorcycle; }
    VehicleClass operator()(const Car&) const { return VehicleClass::Car; }
    VehicleClass operator()(const Bus&) const { return VehicleClass::Bus; }
};

} // namespace

VehicleClass requiredClass(const Vehicle& vehicle) {
    return std::visit(RequiredClassVisitor{}, vehicle);
}

const std::string& plateOf(const Vehicle& vehicle) {
    return std::visit([](const auto& v) -> const std::string& { return v.plate; },
                      vehicle);
}

Result<Vehicle> makeVehicle(const std::string& typeTag, const std::string& plate) {
    std::string tag = typeTag;
    std::transform(tag.begin(), tag.end(), tag.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (tag == "car") {
        return Vehicle{Car{plate}};
    }
    if (tag == "bus") {
        return Vehicle{Bus{plate}};
    }
    if (tag == "motorcycle") {
        return Vehicle{Motorcycle{plate}};
    }
    return Error{ErrorKind::UnknownVehicleType, "Unknown vehicle type: " + typeTag};
}

// ============== Spot Implementation ==============

Spot::Spot(std::string id, VehicleClass cls)
    : id_(std::move(id)), class_(cls) {}

bool Spot::claim() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (occupied_) {
        return false;
    }
    occupied_ = true;
    return true;
}

void Spot::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    occupied_ = false;
}

// Immutable, no lock needed
const std::string& Spot::getId() const { return id_; }
VehicleClass Spot::getClass() const { return class_; }

bool Spot::isOccupied() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return occupied_;
}

// ============== Level Implementation ==============

Level::Level(int number, const std::vector<std::pair<VehicleClass, int>>& layout)
    : levelNumber_(number) {
    for (const auto& [cls, count] : layout) {
        if (count < 0) {
            throw std::invalid_argument("Negative spot count for " + classToString(cls));
        }
        for (int i = 1; i <= count; ++i) {
            spots_.push_back(
                std::make_unique<Spot>(spotIdFor(number, cls, i), cls)
            );
        }
    }
}

Spot* Level::findAndClaim(VehicleClass cls) {
    for (auto& spot : spots_) {
        // A lost race moves on to the next candidate
        if (spot->getClass() == cls && spot->claim()) {
            return spot.get();
        }
    }
    return nullptr;
}

Spot* Level::findSpot(const std::string& spotId) {
    for (auto& spot : spots_) {
        if (spot->getId() == spotId) {
            return spot.get();
        }
    }
    return nullptr;
}

const Spot* Level::findSpot(const std::string& spotId) const {
    for (const auto& spot : spots_) {
        if (spot->getId() == spotId) {
            return spot.get();
        }
    }
    return nullptr;
}

int Level::getNumber() const { return levelNumber_; }

const std::vector<std::unique_ptr<Spot>>& Level::getSpots() const {
    return spots_;
}

int Level::countSpots(VehicleClass cls) const {
    return static_cast<int>(std::count_if(spots_.begin(), spots_.end(),
        [cls](const std::unique_ptr<Spot>& s) { return s->getClass() == cls; }));
}

int Level::countFree(VehicleClass cls) const {
    return static_cast<int>(std::count_if(spots_.begin(), spots_.end(),
        [cls](const std::unique_ptr<Spot>& s) {
            return s->getClass() == cls && !s->isOccupied();
        }));
}

// ============== Ticket / Receipt Helpers ==============

std::string Receipt::toString() const {
    std::ostringstream oss;
    oss << "Receipt(" << ticketId << "): $"
        << std::fixed << std::setprecision(2) << amountDue;
    return oss.str();
}

std::string generateTicketId() {
    uuid_t uuid;
    uuid_generate_random(uuid);
    char buf[37];
    uuid_unparse_lower(uuid, buf);
    return std::string(buf);
}

std::string spotIdFor(int level, VehicleClass cls, int index) {
    return "L" + std::to_string(level) + "-" + classCode(cls) + std::to_string(index);
}

std::string formatTime(TimePoint time) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm local{};
    localtime_r(&t, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}
