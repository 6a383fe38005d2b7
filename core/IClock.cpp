#include "IClock.hpp"
#include <ctime>

namespace nrfsim {

double SystemClock::localHourOfDay() const {
    auto seconds = std::chrono::system_clock::to_time_t(now());

    std::tm local{};
    if (!localtime_r(&seconds, &local)) {
        return 0.0;
    }
    return local.tm_hour + local.tm_min / 60.0 + local.tm_sec / 3600.0;
}

} // namespace nrfsim
