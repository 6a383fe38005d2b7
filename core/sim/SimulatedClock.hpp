#pragma once

#include "../IClock.hpp"
#include <chrono>
#include <mutex>

namespace nrfsim::sim {

// Manually advanced clock; wall, monotonic and hour of day move together
class SimulatedClock : public IClock {
public:
    explicit SimulatedClock(std::chrono::system_clock::time_point wallStart = std::chrono::system_clock::time_point(
                                std::chrono::milliseconds(1700000000000)),
                            double startHourOfDay = 9.0);
    ~SimulatedClock() override = default;

    // IClock interface
    std::chrono::system_clock::time_point now() const override;
    std::chrono::steady_clock::time_point monotonic() const override;
    double localHourOfDay() const override;

    // Simulation controls
    void advance(std::chrono::milliseconds duration);
    void setHourOfDay(double hour);

private:
    mutable std::mutex mutex_;
    std::chrono::system_clock::time_point wall_;
    std::chrono::steady_clock::time_point monotonic_;
    double hourOfDay_;
};

} // namespace nrfsim::sim
