///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file coordinate_lookup.cpp
 * @brief ChainedCoordinateLookup implementation
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "flight/coordinate_lookup.h"
#include "logging/logger.h"

#include <exception>
#include <utility>

namespace FlightBridge {

ChainedCoordinateLookup::ChainedCoordinateLookup(std::vector<std::shared_ptr<CoordinateLookup>> lookups)
    : lookups_(std::move(lookups)) {}

std::optional<GeoPosition> ChainedCoordinateLookup::Lookup(const std::string& icao) {
    for (const auto& lookup : lookups_) {
        if (!lookup) {
            continue;
        }
        try {
            if (auto coords = lookup->Lookup(icao)) {
                return coords;
            }
        } catch (const std::exception& ex) {
            LOG_WARN("Coordinate lookup for {} failed, trying next source: {}", icao, ex.what());
        }
    }
    return std::nullopt;
}

} // namespace FlightBridge
