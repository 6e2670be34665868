///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file protocol.cpp
 * @brief Client protocol encoding and decoding with nlohmann::json
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "net/protocol.h"
#include "flight/identifiers.h"
#include "util/time_format.h"

#include <nlohmann/json.hpp>

namespace FlightBridge {

using nlohmann::json;

namespace {

std::optional<std::string> OptionalString(const json& doc, const char* key) {
    auto it = doc.find(key);
    if (it == doc.end() || !it->is_string()) {
        return std::nullopt;
    }
    std::string value = it->get<std::string>();
    if (Trim(value).empty()) {
        return std::nullopt;
    }
    return value;
}

void SetIfPresent(json& target, const char* key, const std::optional<std::string>& value) {
    if (value) {
        target[key] = *value;
    }
}

std::string Dump(const json& message) {
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

json RouteToJson(const RouteSpec& route) {
    json out = json::object();
    SetIfPresent(out, "origin", route.origin);
    SetIfPresent(out, "destination", route.destination);
    return out;
}

} // namespace

///////////////////////////////////////////////////////////////////////////////////////////////////
// Inbound
///////////////////////////////////////////////////////////////////////////////////////////////////

std::optional<InboundMessage> ParseInboundMessage(const std::string& text) {
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return std::nullopt;
    }

    auto type_it = doc.find("type");
    if (type_it == doc.end() || !type_it->is_string()) {
        return std::nullopt;
    }
    const std::string type = type_it->get<std::string>();

    if (type == "ping") {
        return InboundMessage{PingRequest{}};
    }

    if (type == "route") {
        auto data = doc.find("data");
        if (data == doc.end() || !data->is_object()) {
            return std::nullopt;
        }
        RouteUpdate update;
        update.route.origin = OptionalString(*data, "origin");
        update.route.destination = OptionalString(*data, "destination");
        return InboundMessage{update};
    }

    if (type == "getAirport") {
        auto data = doc.find("data");
        if (data == doc.end() || !data->is_string()) {
            return std::nullopt;
        }
        return InboundMessage{AirportRequest{data->get<std::string>()}};
    }

    if (type == "auth") {
        AuthUpdate update;
        update.user_id = OptionalString(doc, "data");
        update.token = OptionalString(doc, "token");
        return InboundMessage{update};
    }

    return std::nullopt;
}

RouteSpec NormalizeRoute(const RouteSpec& route) {
    RouteSpec normalized;
    normalized.origin = NormalizeOptional(route.origin);
    normalized.destination = NormalizeOptional(route.destination);
    return normalized;
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// Outbound
///////////////////////////////////////////////////////////////////////////////////////////////////

std::string BuildPongMessage() {
    return Dump(json{{"type", "pong"}});
}

std::string BuildRouteMessage(const RouteSpec& route) {
    json message;
    message["type"] = "route";
    message["route"] = RouteToJson(route);
    return Dump(message);
}

std::string BuildAirportCoordsMessage(const std::string& icao, const std::optional<GeoPosition>& coords) {
    json message;
    message["type"] = "airportCoords";
    message["icao"] = icao;
    if (coords) {
        message["coords"] = {{"lat", coords->latitude}, {"lon", coords->longitude}};
    } else {
        message["coords"] = nullptr;
        message["error"] = "not_found";
    }
    return Dump(message);
}

std::string BuildLandingMessage(const LandingEvent& landing) {
    json body;
    body["timestamp"] = FormatIso8601Utc(landing.timestamp);
    body["verticalSpeed"] = landing.vertical_speed_fpm;
    body["gForce"] = landing.g_force;
    body["groundSpeed"] = landing.ground_speed_kt;
    body["rating"] = landing.rating.name;
    body["ratingScore"] = landing.rating.score;
    SetIfPresent(body, "aircraftTitle", landing.aircraft_title);
    SetIfPresent(body, "airport", landing.airport);
    body["pitch"] = landing.pitch_deg;
    body["bank"] = landing.bank_deg;
    body["angleOfAttack"] = landing.angle_of_attack_deg;
    body["sideslip"] = landing.sideslip_deg;
    body["headingMagnetic"] = landing.heading_magnetic;
    body["lateralG"] = landing.lateral_g;
    body["longitudinalG"] = landing.longitudinal_g;

    if (!landing.approach.empty()) {
        json approach = json::array();
        for (const auto& point : landing.approach) {
            approach.push_back({
                {"secondsBeforeTouchdown", point.seconds_before_touchdown},
                {"altitudeAgl", point.altitude_agl_ft},
                {"distanceToTouchdown", point.distance_to_touchdown_nm},
                {"verticalSpeed", point.vertical_speed_fpm},
                {"groundSpeed", point.ground_speed_kt},
            });
        }
        body["approachData"] = std::move(approach);
    }

    SetIfPresent(body, "origin", landing.summary.origin);
    SetIfPresent(body, "destination", landing.summary.destination);
    body["flightDurationSeconds"] = landing.summary.duration_seconds;
    body["distanceNm"] = landing.summary.distance_nm;

    json message;
    message["type"] = "landing";
    message["landing"] = std::move(body);
    return Dump(message);
}

} // namespace FlightBridge
