///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file airport_database.h
 * @brief Nearest-airport lookup used when neither GPS nor route hint names an airport
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "flight/coordinate_lookup.h"
#include "telemetry/snapshot.h"

#include <cstddef>
#include <optional>
#include <string>

namespace FlightBridge {

constexpr double NEAREST_AIRPORT_RADIUS_NM = 10.0;

/**
 * @brief Maps a position to the closest known airport identifier
 */
class AirportLocator {
public:
    virtual ~AirportLocator() = default;

    /// @return ICAO of the closest airport within max_distance_nm, or nullopt
    virtual std::optional<std::string> FindNearest(const GeoPosition& position,
                                                   double max_distance_nm = NEAREST_AIRPORT_RADIUS_NM) const = 0;
};

/**
 * @brief Built-in table of major airports.
 *
 * Also serves as an offline CoordinateLookup when no airport API is configured.
 */
class AirportDatabase : public AirportLocator, public CoordinateLookup {
public:
    std::optional<std::string> FindNearest(const GeoPosition& position,
                                           double max_distance_nm = NEAREST_AIRPORT_RADIUS_NM) const override;

    /// Coordinates of a table entry
    std::optional<GeoPosition> Find(const std::string& icao) const;

    std::optional<GeoPosition> Lookup(const std::string& icao) override { return Find(icao); }

    static size_t Size();
};

} // namespace FlightBridge
