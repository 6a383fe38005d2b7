#pragma once

#include "Geo.hpp"
#include "IRng.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace nrfsim {

struct RoutePoint {
    std::string name;
    double lat = 0.0;
    double lon = 0.0;
};

struct PositionSample {
    double lat = 0.0;
    double lon = 0.0;
    double accuracyM = 0.0;
    std::size_t segmentIndex = 0;   ///< Waypoint the sample is leaving
    double segmentFraction = 0.0;   ///< Progress toward segmentIndex + 1
};

/**
 * @brief Continuous position trace around a closed loop of waypoints
 *
 * Elapsed time modulo the loop duration selects a segment and a fraction
 * along it. The base point is a linear blend of the two bounding waypoints;
 * each sample then gets a fresh jitter offset inside a disc of radius
 * maxJitterMeters, and the offset distance becomes the reported accuracy.
 */
class RouteInterpolator {
public:
    /// Points per segment: the device reports this many fixes between waypoints
    static constexpr int kStepsPerSegment = 4;

    RouteInterpolator(double segmentSeconds,
                      double maxJitterMeters,
                      std::shared_ptr<IRng> rng,
                      std::vector<RoutePoint> route = tokyoLoop());

    PositionSample sample(double elapsedSeconds);

    /// Interpolated point before jitter; pure function of elapsedSeconds
    PositionSample basePosition(double elapsedSeconds) const;

    double loopDuration() const;
    double segmentSeconds() const { return segmentSeconds_; }
    double maxJitterMeters() const { return maxJitterMeters_; }

    /// Segment length follows the location interval, which the cloud may change
    void setSegmentSeconds(double segmentSeconds);

    const std::vector<RoutePoint>& waypoints() const { return route_; }
    std::size_t segmentCount() const { return route_.size() - 1; }

    /// 20 points, Tokyo Station and back
    static std::vector<RoutePoint> tokyoLoop();

private:
    std::vector<RoutePoint> route_;
    double segmentSeconds_;
    double maxJitterMeters_;
    std::shared_ptr<IRng> rng_;
};

} // namespace nrfsim
