#pragma once

#include "IRng.hpp"
#include <memory>

namespace nrfsim {

// Diurnal sine around a base value, peak 15:00, trough 03:00
class TemperatureModel {
public:
    static constexpr double kNoiseStdDev = 0.5;
    static constexpr double kNoiseLimit = 1.5;

    TemperatureModel(double baseCelsius, double variationCelsius, std::shared_ptr<IRng> rng);

    double diurnalOffset(double hourOfDay) const;

    // base + diurnal offset + clamped noise, rounded to 0.1
    double sample(double hourOfDay);

    double base() const { return base_; }
    double variation() const { return variation_; }

private:
    double base_;
    double variation_;
    std::shared_ptr<IRng> rng_;
};

} // namespace nrfsim
