#ifndef TYPES_HPP
#define TYPES_HPP

#include <chrono>
#include <string>
#include <utility>
#include <variant>
#include <vector>

// ============== Enums =============

enum class VehicleClass {
    Motorcycle,
    Car,
    Bus
};

enum class ErrorKind {
    UnknownVehicleType, // Unrecognized vehicle type tag
    Capacity,           // No free spot of the required class
    InvalidTicket       // Ticket never issued or already consumed
};

using TimePoint = std::chrono::system_clock::time_point;

// ============== Configuration ==============

struct Config {
    int numLevels = 2;
    // Spots are created in this order on every level
    std::vector<std::pair<VehicleClass, int>> spotsPerLevel = {
        {VehicleClass::Car, 10},
        {VehicleClass::Bus, 2},
        {VehicleClass::Motorcycle, 5}
    };
};

// ============== Vehicle ==============

struct Motorcycle {
    std::string plate;
};

struct Car {
    std::string plate;
};

struct Bus {
    std::string plate;
};

using Vehicle = std::variant<Motorcycle, Car, Bus>;

// ============== Result ==============

struct Error {
    ErrorKind kind;
    std::string message;
};

// Either a value or one of the named errors
template<typename T>
class Result {
private:
    std::variant<T, Error> value_;

public:
    Result(T value) : value_(std::move(value)) {}
    Result(Error error) : value_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(value_); }
    explicit operator bool() const { return ok(); }

    // Throws std::bad_variant_access when called on the wrong alternative
    const T& value() const { return std::get<T>(value_); }
    T& value() { return std::get<T>(value_); }
    const Error& error() const { return std::get<Error>(value_); }

    const T* operator->() const { return &value(); }
};

// ============== Utility Functions ==============

inline std::string classToString(VehicleClass cls) {
    switch (cls) {
        case VehicleClass::Motorcycle: return "Motorcycle";
        case VehicleClass::Car: return "Car";
        case VehicleClass::Bus: return "Bus";
    }
    return "Unknown";
}

// Single-letter code used in spot ids
inline char classCode(VehicleClass cls) {
    switch (cls) {
        case VehicleClass::Motorcycle: return 'M';
        case VehicleClass::Car: return 'C';
        case VehicleClass::Bus: return 'B';
    }
    return '?';
}

// Hourly rate charged for a spot of the given class
inline double hourlyRate(VehicleClass cls) {
    switch (cls) {
        case VehicleClass::Motorcycle: return 1.0;
        case VehicleClass::Car: return 2.0;
        case VehicleClass::Bus: return 5.0;
    }
    return 0.0;
}

inline std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnknownVehicleType: return "UnknownVehicleType";
        case ErrorKind::Capacity: return "Capacity";
        case ErrorKind::InvalidTicket: return "InvalidTicket";
    }
    return "Unknown";
}

#endif // TYPES_HPP
