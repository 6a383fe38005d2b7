#include "SimulatedClock.hpp"
#include <cmath>

namespace nrfsim::sim {

SimulatedClock::SimulatedClock(std::chrono::system_clock::time_point wallStart, double startHourOfDay)
    : wall_(wallStart)
    , monotonic_(std::chrono::steady_clock::time_point(std::chrono::hours(1)))
    , hourOfDay_(startHourOfDay) {
}

std::chrono::system_clock::time_point SimulatedClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return wall_;
}

std::chrono::steady_clock::time_point SimulatedClock::monotonic() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return monotonic_;
}

double SimulatedClock::localHourOfDay() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hourOfDay_;
}

void SimulatedClock::advance(std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    wall_ += duration;
    monotonic_ += duration;
    hourOfDay_ = std::fmod(hourOfDay_ + std::chrono::duration<double, std::ratio<3600>>(duration).count(), 24.0);
}

void SimulatedClock::setHourOfDay(double hour) {
    std::lock_guard<std::mutex> lock(mutex_);
    hourOfDay_ = std::fmod(hour, 24.0);
}

} // namespace nrfsim::sim
