///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file geo.cpp
 * @brief Haversine distance and DistanceAccumulator
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "flight/geo.h"

#include <cmath>

namespace FlightBridge {

namespace {

constexpr double PI = 3.14159265358979323846;

double ToRadians(double degrees) {
    return degrees * PI / 180.0;
}

} // namespace

double HaversineDistanceNm(const GeoPosition& a, const GeoPosition& b) {
    const double d_lat = ToRadians(b.latitude - a.latitude);
    const double d_lon = ToRadians(b.longitude - a.longitude);

    const double h = std::sin(d_lat / 2) * std::sin(d_lat / 2) +
                     std::cos(ToRadians(a.latitude)) * std::cos(ToRadians(b.latitude)) *
                     std::sin(d_lon / 2) * std::sin(d_lon / 2);

    const double c = 2 * std::atan2(std::sqrt(h), std::sqrt(1 - h));
    return EARTH_RADIUS_NM * c;
}

double DistanceAccumulator::Advance(const GeoPosition& position) {
    double added = 0.0;
    if (last_.latitude != 0.0 || last_.longitude != 0.0) {
        const double step = HaversineDistanceNm(last_, position);
        if (step < MAX_DISTANCE_STEP_NM) {
            total_nm_ += step;
            added = step;
        }
    }
    last_ = position;
    return added;
}

} // namespace FlightBridge
