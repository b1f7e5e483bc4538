#ifndef CLOCK_HPP
#define CLOCK_HPP

#include "Types.hpp"
#include <mutex>

// ============== Clock Interface ==============

class IClock {
public:
    virtual ~IClock() = default;

    virtual TimePoint now() const = 0;
};

// ============== System Clock ==============

class SystemClock : public IClock {
public:
    TimePoint now() const override {
        return std::chrono::system_clock::now();
    }
};

// ============== Manual Clock ==============
// Moves only when told to; lets tests simulate hours in no time

class ManualClock : public IClock {
private:
    TimePoint current_;
    mutable std::mutex mutex_;

public:
    explicit ManualClock(TimePoint start = std::chrono::system_clock::now())
        : current_(start) {}

    // Non-copyable
    ManualClock(const ManualClock&) = delete;
    ManualClock& operator=(const ManualClock&) = delete;

    TimePoint now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_;
    }

    template<typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ += std::chrono::duration_cast<TimePoint::duration>(delta);
    }

    void set(TimePoint time) {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = time;
    }
};

#endif // CLOCK_HPP
