#pragma once

#include <chrono>
#include <cstdint>

namespace nrfsim {

class IClock {
public:
    virtual ~IClock() = default;

    // Wall clock, used for payload timestamps and time-of-day
    virtual std::chrono::system_clock::time_point now() const = 0;

    // Monotonic clock, used for interval timers
    virtual std::chrono::steady_clock::time_point monotonic() const = 0;

    // Local hour of day in [0, 24), fractional
    virtual double localHourOfDay() const = 0;

    std::int64_t epochMillis() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            now().time_since_epoch()).count();
    }
};

class SystemClock : public IClock {
public:
    std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::now();
    }

    std::chrono::steady_clock::time_point monotonic() const override {
        return std::chrono::steady_clock::now();
    }

    double localHourOfDay() const override;
};

} // namespace nrfsim
