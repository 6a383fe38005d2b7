#include <gtest/gtest.h>
#include "../core/Errors.hpp"
#include "../core/Geo.hpp"
#include "../core/RouteInterpolator.hpp"
#include "../core/sim/ScriptedRng.hpp"
#include <algorithm>
#include <memory>
#include <vector>

using namespace nrfsim;

class RouteInterpolatorTest : public ::testing::Test {
protected:
    std::shared_ptr<sim::ScriptedRng> rng_ = std::make_shared<sim::ScriptedRng>();
    RouteInterpolator route_{1200.0, 15.0, rng_};
};

TEST_F(RouteInterpolatorTest, TokyoLoopIsClosed) {
    const auto& points = route_.waypoints();
    ASSERT_EQ(points.size(), 20u);
    EXPECT_EQ(route_.segmentCount(), 19u);
    EXPECT_EQ(points.front().name, points.back().name);
    EXPECT_DOUBLE_EQ(points.front().lat, points.back().lat);
    EXPECT_DOUBLE_EQ(route_.loopDuration(), 1200.0 * 19);
}

TEST_F(RouteInterpolatorTest, StartsAtFirstWaypoint) {
    PositionSample base = route_.basePosition(0.0);
    EXPECT_EQ(base.segmentIndex, 0u);
    EXPECT_DOUBLE_EQ(base.lat, 35.6812);
    EXPECT_DOUBLE_EQ(base.lon, 139.7671);
}

TEST_F(RouteInterpolatorTest, BasePositionLiesOnCurrentSegment) {
    PositionSample base = route_.basePosition(300.0);
    EXPECT_EQ(base.segmentIndex, 0u);
    EXPECT_DOUBLE_EQ(base.segmentFraction, 0.25);

    const auto& from = route_.waypoints()[0];
    const auto& to = route_.waypoints()[1];
    EXPECT_NEAR(base.lat, from.lat + (to.lat - from.lat) * 0.25, 1e-9);
    EXPECT_NEAR(base.lon, from.lon + (to.lon - from.lon) * 0.25, 1e-9);

    PositionSample later = route_.basePosition(1200.0 * 5 + 600.0);
    EXPECT_EQ(later.segmentIndex, 5u);
    EXPECT_NEAR(later.segmentFraction, 0.5, 1e-9);
}

TEST_F(RouteInterpolatorTest, PositionRepeatsEveryLoop) {
    double loop = route_.loopDuration();
    for (double t : {0.0, 450.0, 7000.0, 22000.0}) {
        PositionSample first = route_.basePosition(t);
        PositionSample again = route_.basePosition(t + loop);
        PositionSample twice = route_.basePosition(t + 2 * loop);
        EXPECT_EQ(first.segmentIndex, again.segmentIndex);
        EXPECT_NEAR(first.lat, again.lat, 1e-9);
        EXPECT_NEAR(first.lon, again.lon, 1e-9);
        EXPECT_NEAR(first.lat, twice.lat, 1e-9);
    }
}

TEST_F(RouteInterpolatorTest, LastSegmentHeadsBackToStart) {
    PositionSample base = route_.basePosition(route_.loopDuration() - 1.0);
    EXPECT_EQ(base.segmentIndex, 18u);
    EXPECT_EQ(route_.waypoints()[base.segmentIndex + 1].name, "Tokyo Station");
}

TEST_F(RouteInterpolatorTest, JitterStaysWithinAccuracyBounds) {
    auto rng = std::make_shared<StandardRng>(42);
    RouteInterpolator route(1200.0, 15.0, rng);

    for (int i = 0; i < 200; ++i) {
        double t = i * 97.0;
        PositionSample base = route.basePosition(t);
        PositionSample fix = route.sample(t);

        EXPECT_GE(fix.accuracyM, 1.0);
        EXPECT_LE(fix.accuracyM, 15.0);
        EXPECT_LE(Geo::distanceMeters(base.lat, base.lon, fix.lat, fix.lon), 15.2);
        EXPECT_EQ(fix.segmentIndex, base.segmentIndex);
    }
}

TEST_F(RouteInterpolatorTest, AccuracyReportsJitterDistance) {
    rng_->pushUniform(0.0);    // bearing north
    rng_->pushUniform(0.25);   // radius 15 * sqrt(0.25) = 7.5m

    PositionSample fix = route_.sample(0.0);
    EXPECT_NEAR(fix.accuracyM, 7.5, 0.15);
    EXPECT_GT(fix.lat, 35.6812);
}

TEST_F(RouteInterpolatorTest, TinyJitterStillReportsMinimumAccuracy) {
    RouteInterpolator route(1200.0, 0.2, rng_);
    EXPECT_DOUBLE_EQ(route.maxJitterMeters(), 1.0);

    rng_->pushUniform(0.5);
    rng_->pushUniform(0.0);
    EXPECT_DOUBLE_EQ(route.sample(10.0).accuracyM, 1.0);
}

TEST_F(RouteInterpolatorTest, SegmentLengthFollowsInterval) {
    route_.setSegmentSeconds(240.0);
    EXPECT_DOUBLE_EQ(route_.loopDuration(), 240.0 * 19);
    EXPECT_EQ(route_.basePosition(480.0).segmentIndex, 2u);
}

TEST_F(RouteInterpolatorTest, RejectsInvalidConfiguration) {
    EXPECT_THROW(route_.setSegmentSeconds(0.0), ConfigError);
    EXPECT_THROW(RouteInterpolator(0.0, 15.0, rng_), ConfigError);
    std::vector<RoutePoint> single{{"Only", 35.0, 139.0}};
    EXPECT_THROW(RouteInterpolator(1200.0, 15.0, rng_, single), ConfigError);
}

TEST(GeoTest, OffsetMovesByRequestedDistance) {
    GeoPoint origin{35.6812, 139.7671};

    GeoPoint north = Geo::offsetMeters(origin, 100.0, 0.0);
    EXPECT_GT(north.lat, origin.lat);
    EXPECT_DOUBLE_EQ(north.lon, origin.lon);
    EXPECT_NEAR(Geo::distanceMeters(origin.lat, origin.lon, north.lat, north.lon), 100.0, 0.01);

    GeoPoint southWest = Geo::offsetMeters(origin, -30.0, -40.0);
    EXPECT_LT(southWest.lat, origin.lat);
    EXPECT_LT(southWest.lon, origin.lon);
    EXPECT_NEAR(Geo::distanceMeters(origin.lat, origin.lon, southWest.lat, southWest.lon), 50.0, 0.01);
}

TEST(GeoTest, InterpolateClampsFraction) {
    GeoPoint from{35.0, 139.0};
    GeoPoint to{36.0, 140.0};

    GeoPoint mid = Geo::interpolate(from, to, 0.5);
    EXPECT_DOUBLE_EQ(mid.lat, 35.5);
    EXPECT_DOUBLE_EQ(Geo::interpolate(from, to, 1.5).lon, 140.0);
    EXPECT_DOUBLE_EQ(Geo::interpolate(from, to, -1.0).lat, 35.0);
    EXPECT_NEAR(Geo::roundTo(35.68123456, 6), 35.681235, 1e-9);
}
