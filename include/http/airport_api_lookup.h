///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file airport_api_lookup.h
 * @brief CoordinateLookup backed by a public airport information API
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "flight/coordinate_lookup.h"
#include "http/http_client.h"

#include <memory>
#include <optional>
#include <string>

namespace FlightBridge {

constexpr const char* DEFAULT_AIRPORT_API_URL = "https://airport-data.com/api/ap_info.json?icao={icao}";

/// Fields of the airport info response this bridge uses
struct AirportInfoResponse {
    std::optional<double> latitude;
    std::optional<double> longitude;
};

/**
 * @brief Parse an airport info body.
 *
 * latitude and longitude may be JSON numbers or numeric strings. Anything
 * else (missing, null, malformed) leaves the field empty.
 */
AirportInfoResponse ParseAirportInfo(const std::string& body);

class AirportApiLookup : public CoordinateLookup {
public:
    /// @param url_template  request URL; "{icao}" is replaced by the identifier
    AirportApiLookup(std::shared_ptr<HttpClient> http, std::string url_template = DEFAULT_AIRPORT_API_URL);

    std::optional<GeoPosition> Lookup(const std::string& icao) override;

    /// The identifier is percent-encoded; throws HttpError if encoding fails
    std::string BuildUrl(const std::string& icao) const;

private:
    std::shared_ptr<HttpClient> http_;
    std::string url_template_;
};

} // namespace FlightBridge
