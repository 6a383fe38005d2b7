#include "TemperatureModel.hpp"
#include <algorithm>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace nrfsim {

TemperatureModel::TemperatureModel(double baseCelsius, double variationCelsius, std::shared_ptr<IRng> rng)
    : base_(baseCelsius), variation_(variationCelsius), rng_(std::move(rng)) {
}

double TemperatureModel::diurnalOffset(double hourOfDay) const {
    return variation_ * std::sin((hourOfDay - 9.0) * M_PI / 12.0);
}

double TemperatureModel::sample(double hourOfDay) {
    double noise = std::clamp(rng_->normal(0.0, kNoiseStdDev), -kNoiseLimit, kNoiseLimit);
    return std::round((base_ + diurnalOffset(hourOfDay) + noise) * 10.0) / 10.0;
}

} // namespace nrfsim
