#include "RouteInterpolator.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>

namespace nrfsim {

namespace {

constexpr double kMinAccuracyMeters = 1.0;
constexpr double kRadiansPerDegree = 3.14159265358979323846 / 180.0;

} // namespace

RouteInterpolator::RouteInterpolator(double segmentSeconds,
                                     double maxJitterMeters,
                                     std::shared_ptr<IRng> rng,
                                     std::vector<RoutePoint> route)
    : route_(std::move(route))
    , segmentSeconds_(segmentSeconds)
    , maxJitterMeters_(std::max(maxJitterMeters, kMinAccuracyMeters))
    , rng_(std::move(rng)) {
    if (route_.size() < 2) {
        throw ConfigError("Route needs at least two waypoints");
    }
    if (segmentSeconds_ <= 0.0) {
        throw ConfigError("Route segment duration must be positive");
    }
}

std::vector<RoutePoint> RouteInterpolator::tokyoLoop() {
    return {
        {"Tokyo Station",         35.6812, 139.7671},
        {"Imperial Palace",       35.6852, 139.7528},
        {"Kudanshita",            35.6938, 139.7510},
        {"Iidabashi",             35.7020, 139.7450},
        {"Korakuen",              35.7078, 139.7509},
        {"Ochanomizu",            35.6994, 139.7633},
        {"Akihabara",             35.6984, 139.7731},
        {"Ueno Park",             35.7146, 139.7734},
        {"Asakusa",               35.7148, 139.7967},
        {"Skytree",               35.7101, 139.8107},
        {"Ryogoku",               35.6962, 139.7939},
        {"Kiyosumi Garden",       35.6812, 139.7975},
        {"Tsukiji",               35.6654, 139.7707},
        {"Ginza",                 35.6717, 139.7645},
        {"Hibiya Park",           35.6735, 139.7568},
        {"Tokyo Tower",           35.6586, 139.7454},
        {"Roppongi",              35.6627, 139.7312},
        {"Akasaka",               35.6765, 139.7376},
        {"Yotsuya",               35.6860, 139.7301},
        {"Tokyo Station",         35.6812, 139.7671},
    };
}

double RouteInterpolator::loopDuration() const {
    return segmentSeconds_ * static_cast<double>(segmentCount());
}

void RouteInterpolator::setSegmentSeconds(double segmentSeconds) {
    if (segmentSeconds <= 0.0) {
        throw ConfigError("Route segment duration must be positive");
    }
    segmentSeconds_ = segmentSeconds;
}

PositionSample RouteInterpolator::basePosition(double elapsedSeconds) const {
    double loop = loopDuration();
    double t = std::fmod(elapsedSeconds, loop);
    if (t < 0.0) {
        t += loop;
    }

    double position = t / segmentSeconds_;
    auto index = static_cast<std::size_t>(std::floor(position));
    if (index >= segmentCount()) {
        index = segmentCount() - 1;
    }
    double fraction = std::clamp(position - static_cast<double>(index), 0.0, 1.0);

    const RoutePoint& from = route_[index];
    const RoutePoint& to = route_[index + 1];
    GeoPoint point = Geo::interpolate({from.lat, from.lon}, {to.lat, to.lon}, fraction);

    PositionSample sample;
    sample.lat = point.lat;
    sample.lon = point.lon;
    sample.accuracyM = 0.0;
    sample.segmentIndex = index;
    sample.segmentFraction = fraction;
    return sample;
}

PositionSample RouteInterpolator::sample(double elapsedSeconds) {
    PositionSample base = basePosition(elapsedSeconds);

    // sqrt keeps the offset uniform over the disc instead of bunching at the centre
    double bearing = rng_->uniform(0.0, 360.0) * kRadiansPerDegree;
    double radius = maxJitterMeters_ * std::sqrt(rng_->uniform(0.0, 1.0));

    GeoPoint jittered = Geo::offsetMeters({base.lat, base.lon},
                                          radius * std::cos(bearing), radius * std::sin(bearing));
    jittered.lat = Geo::roundTo(jittered.lat, 6);
    jittered.lon = Geo::roundTo(jittered.lon, 6);

    double offset = Geo::distanceMeters(base.lat, base.lon, jittered.lat, jittered.lon);
    double accuracy = std::floor(offset * 10.0) / 10.0;
    accuracy = std::clamp(accuracy, kMinAccuracyMeters, maxJitterMeters_);

    PositionSample result = base;
    result.lat = jittered.lat;
    result.lon = jittered.lon;
    result.accuracyM = accuracy;
    return result;
}

} // namespace nrfsim
