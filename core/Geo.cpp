#include "Geo.hpp"
#include <algorithm>
#include <cmath>

namespace nrfsim {

namespace {

constexpr double kRadiansPerDegree = 3.14159265358979323846 / 180.0;

double haversine(double angle) {
    double s = std::sin(angle / 2.0);
    return s * s;
}

} // namespace

double Geo::distanceMeters(double lat1, double lon1, double lat2, double lon2) {
    double phi1 = lat1 * kRadiansPerDegree;
    double phi2 = lat2 * kRadiansPerDegree;
    double h = haversine(phi2 - phi1) +
               std::cos(phi1) * std::cos(phi2) * haversine((lon2 - lon1) * kRadiansPerDegree);
    return 2.0 * kEarthRadiusMeters * std::asin(std::sqrt(std::min(h, 1.0)));
}

GeoPoint Geo::offsetMeters(const GeoPoint& origin, double northMeters, double eastMeters) {
    double metersPerDegreeLat = kEarthRadiusMeters * kRadiansPerDegree;
    double metersPerDegreeLon = metersPerDegreeLat * std::cos(origin.lat * kRadiansPerDegree);

    GeoPoint moved;
    moved.lat = origin.lat + northMeters / metersPerDegreeLat;
    moved.lon = origin.lon + eastMeters / metersPerDegreeLon;
    return moved;
}

GeoPoint Geo::interpolate(const GeoPoint& from, const GeoPoint& to, double fraction) {
    double f = std::clamp(fraction, 0.0, 1.0);
    return GeoPoint{from.lat + (to.lat - from.lat) * f, from.lon + (to.lon - from.lon) * f};
}

double Geo::roundTo(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

} // namespace nrfsim
