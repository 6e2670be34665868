///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file coordinate_lookup.h
 * @brief Airport coordinates by ICAO identifier
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "telemetry/snapshot.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace FlightBridge {

/**
 * @brief Resolves an airport identifier to coordinates.
 *
 * Implementations may block (network); callers run them off the producer and
 * transport threads. Failures of any kind are reported as nullopt.
 */
class CoordinateLookup {
public:
    virtual ~CoordinateLookup() = default;

    virtual std::optional<GeoPosition> Lookup(const std::string& icao) = 0;
};

/// Tries each lookup in order; the first hit wins
class ChainedCoordinateLookup : public CoordinateLookup {
public:
    explicit ChainedCoordinateLookup(std::vector<std::shared_ptr<CoordinateLookup>> lookups);

    std::optional<GeoPosition> Lookup(const std::string& icao) override;

private:
    std::vector<std::shared_ptr<CoordinateLookup>> lookups_;
};

} // namespace FlightBridge
