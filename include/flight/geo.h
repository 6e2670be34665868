///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file geo.h
 * @brief Great-circle distance and per-flight distance integration
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "telemetry/snapshot.h"

namespace FlightBridge {

constexpr double EARTH_RADIUS_NM = 3440.065;

/// Steps at or above this are treated as slew/teleport and dropped
constexpr double MAX_DISTANCE_STEP_NM = 10.0;

/**
 * @brief Haversine distance between two positions in nautical miles
 */
double HaversineDistanceNm(const GeoPosition& a, const GeoPosition& b);

/**
 * @brief Running distance total over consecutive positions.
 *
 * Advance() adds the step from the previous position only when it is
 * below MAX_DISTANCE_STEP_NM. A previous position of exactly (0, 0) means
 * "no position yet" and contributes nothing. The total never decreases.
 */
class DistanceAccumulator {
public:
    DistanceAccumulator() = default;
    explicit DistanceAccumulator(const GeoPosition& start) : last_(start) {}

    /// @return the distance actually added (0 when the step was rejected)
    double Advance(const GeoPosition& position);

    double TotalNm() const { return total_nm_; }
    const GeoPosition& LastPosition() const { return last_; }

private:
    GeoPosition last_{};
    double total_nm_ = 0.0;
};

} // namespace FlightBridge
