///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file protocol.h
 * @brief Client message protocol: typed inbound messages and outbound builders
 *
 * Inbound:
 * - {"type":"ping"}
 * - {"type":"route","data":{"origin":"EDDF","destination":"EGLL"}}
 * - {"type":"getAirport","data":"EDDF"}
 * - {"type":"auth","data":"<userId>","token":"<token>"}
 *
 * Outbound (besides the snapshot, see telemetry/snapshot_json.h):
 * - {"type":"pong"}
 * - {"type":"route","route":{"origin":...,"destination":...}}
 * - {"type":"airportCoords","icao":...,"coords":{"lat":..,"lon":..}}
 *   or "coords":null,"error":"not_found"
 * - {"type":"landing","landing":{...}}
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "flight/flight_events.h"
#include "telemetry/snapshot.h"

#include <optional>
#include <string>
#include <variant>

namespace FlightBridge {

/// Current route shared by all viewers; identifiers are trimmed and uppercase
struct RouteSpec {
    std::optional<std::string> origin;
    std::optional<std::string> destination;

    bool Empty() const { return !origin && !destination; }
};

struct PingRequest {};

struct RouteUpdate {
    RouteSpec route;
};

/// Raw identifier as sent; the hub validates it
struct AirportRequest {
    std::string icao;
};

/// Empty values mean logout
struct AuthUpdate {
    std::optional<std::string> user_id;
    std::optional<std::string> token;
};

using InboundMessage = std::variant<PingRequest, RouteUpdate, AirportRequest, AuthUpdate>;

/**
 * @brief Decode one client message.
 * @return nullopt for malformed JSON, a missing or unknown "type", or a payload of the wrong shape
 */
std::optional<InboundMessage> ParseInboundMessage(const std::string& text);

/// Route with both identifiers normalized; blank identifiers become absent
RouteSpec NormalizeRoute(const RouteSpec& route);

std::string BuildPongMessage();
std::string BuildRouteMessage(const RouteSpec& route);
std::string BuildAirportCoordsMessage(const std::string& icao, const std::optional<GeoPosition>& coords);
std::string BuildLandingMessage(const LandingEvent& landing);

} // namespace FlightBridge
