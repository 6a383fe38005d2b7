#pragma once

namespace nrfsim {

struct GeoPoint {
    double lat = 0.0;
    double lon = 0.0;
};

// Small-distance geodesy for the route trace
class Geo {
public:
    static constexpr double kEarthRadiusMeters = 6371000.0;

    // Haversine great-circle distance
    static double distanceMeters(double lat1, double lon1, double lat2, double lon2);

    // Local north/east displacement; good to centimetres over a few hundred metres
    static GeoPoint offsetMeters(const GeoPoint& origin, double northMeters, double eastMeters);

    // Linear blend in degrees, fraction clamped to [0, 1]
    static GeoPoint interpolate(const GeoPoint& from, const GeoPoint& to, double fraction);

    static double roundTo(double value, int decimals);
};

} // namespace nrfsim
