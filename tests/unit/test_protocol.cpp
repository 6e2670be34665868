///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file test_protocol.cpp
 * @brief Unit tests for client message parsing and outbound message builders
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include <catch2/catch_all.hpp>
#include "test_helpers.h"

#include "net/protocol.h"

#include <nlohmann/json.hpp>

using namespace FlightBridge;
using namespace TestHelpers;
using nlohmann::json;

TEST_CASE("Inbound message parsing", "[unit][protocol]") {
    SECTION("Ping") {
        auto message = ParseInboundMessage(R"({"type":"ping"})");
        REQUIRE(message.has_value());
        REQUIRE(std::holds_alternative<PingRequest>(*message));
    }

    SECTION("Route with both ends") {
        auto message = ParseInboundMessage(R"({"type":"route","data":{"origin":"eddf","destination":"EGLL"}})");
        REQUIRE(message.has_value());
        const auto& update = std::get<RouteUpdate>(*message);
        REQUIRE(update.route.origin == std::optional<std::string>("eddf"));
        REQUIRE(update.route.destination == std::optional<std::string>("EGLL"));
    }

    SECTION("Route with blank or missing ends") {
        auto message = ParseInboundMessage(R"({"type":"route","data":{"origin":"  ","destination":null}})");
        REQUIRE(message.has_value());
        REQUIRE(std::get<RouteUpdate>(*message).route.Empty());
    }

    SECTION("getAirport carries the raw identifier") {
        auto message = ParseInboundMessage(R"({"type":"getAirport","data":" ksez"})");
        REQUIRE(message.has_value());
        REQUIRE(std::get<AirportRequest>(*message).icao == " ksez");
    }

    SECTION("Auth login and logout") {
        auto login = ParseInboundMessage(R"({"type":"auth","data":"user-42","token":"secret"})");
        REQUIRE(login.has_value());
        REQUIRE(std::get<AuthUpdate>(*login).user_id == std::optional<std::string>("user-42"));
        REQUIRE(std::get<AuthUpdate>(*login).token == std::optional<std::string>("secret"));

        auto logout = ParseInboundMessage(R"({"type":"auth","data":null})");
        REQUIRE(logout.has_value());
        REQUIRE_FALSE(std::get<AuthUpdate>(*logout).user_id.has_value());
        REQUIRE_FALSE(std::get<AuthUpdate>(*logout).token.has_value());
    }

    SECTION("Malformed or unknown messages are ignored") {
        REQUIRE_FALSE(ParseInboundMessage("not json").has_value());
        REQUIRE_FALSE(ParseInboundMessage(R"(["ping"])").has_value());
        REQUIRE_FALSE(ParseInboundMessage(R"({"data":"EDDF"})").has_value());
        REQUIRE_FALSE(ParseInboundMessage(R"({"type":42})").has_value());
        REQUIRE_FALSE(ParseInboundMessage(R"({"type":"teleport"})").has_value());
        REQUIRE_FALSE(ParseInboundMessage(R"({"type":"route","data":"EDDF-EGLL"})").has_value());
        REQUIRE_FALSE(ParseInboundMessage(R"({"type":"getAirport","data":7})").has_value());
    }
}

TEST_CASE("Route normalization", "[unit][protocol]") {
    RouteSpec route;
    route.origin = std::string(" eddf ");
    route.destination = std::string("   ");

    RouteSpec normalized = NormalizeRoute(route);
    REQUIRE(normalized.origin == std::optional<std::string>("EDDF"));
    REQUIRE_FALSE(normalized.destination.has_value());
}

TEST_CASE("Outbound messages", "[unit][protocol]") {
    SECTION("Pong") {
        json doc = json::parse(BuildPongMessage());
        REQUIRE(doc == json{{"type", "pong"}});
    }

    SECTION("Route omits absent ends") {
        RouteSpec route;
        route.destination = std::string("EGLL");
        json doc = json::parse(BuildRouteMessage(route));
        REQUIRE(doc["type"] == "route");
        REQUIRE(doc["route"]["destination"] == "EGLL");
        REQUIRE_FALSE(doc["route"].contains("origin"));
    }

    SECTION("Airport coordinates found") {
        json doc = json::parse(BuildAirportCoordsMessage("EDDF", GeoPosition{50.0379, 8.5622}));
        REQUIRE(doc["type"] == "airportCoords");
        REQUIRE(doc["icao"] == "EDDF");
        REQUIRE(doc["coords"]["lat"].get<double>() == Catch::Approx(50.0379));
        REQUIRE(doc["coords"]["lon"].get<double>() == Catch::Approx(8.5622));
        REQUIRE_FALSE(doc.contains("error"));
    }

    SECTION("Airport coordinates not found") {
        json doc = json::parse(BuildAirportCoordsMessage("ZZZZ", std::nullopt));
        REQUIRE(doc["coords"].is_null());
        REQUIRE(doc["error"] == "not_found");
    }
}

TEST_CASE("Landing message", "[unit][protocol]") {
    LandingEvent landing;
    landing.timestamp = FromUnixMillis(1700000000123LL);
    landing.vertical_speed_fpm = -142.0;
    landing.g_force = 1.18;
    landing.ground_speed_kt = 131.0;
    landing.rating = LandingRating{"Good", 4};
    landing.airport = std::string("EDDF");
    landing.summary.origin = std::string("EGLL");
    landing.summary.destination = std::string("EDDF");
    landing.summary.duration_seconds = 4210;
    landing.summary.distance_nm = 352.9;

    SECTION("Envelope and summary") {
        json doc = json::parse(BuildLandingMessage(landing));
        REQUIRE(doc["type"] == "landing");

        const json& body = doc["landing"];
        REQUIRE(body["timestamp"] == "2023-11-14T22:13:20.123Z");
        REQUIRE(body["verticalSpeed"].get<double>() == Catch::Approx(-142.0));
        REQUIRE(body["rating"] == "Good");
        REQUIRE(body["ratingScore"] == 4);
        REQUIRE(body["airport"] == "EDDF");
        REQUIRE(body["origin"] == "EGLL");
        REQUIRE(body["flightDurationSeconds"] == 4210);
        REQUIRE(body["distanceNm"].get<double>() == Catch::Approx(352.9));
        REQUIRE_FALSE(body.contains("aircraftTitle"));
    }

    SECTION("Approach data only when a trace exists") {
        REQUIRE_FALSE(json::parse(BuildLandingMessage(landing))["landing"].contains("approachData"));

        ApproachPoint point;
        point.seconds_before_touchdown = -4.0;
        point.altitude_agl_ft = 60.0;
        point.distance_to_touchdown_nm = 0.15;
        point.vertical_speed_fpm = -600.0;
        point.ground_speed_kt = 135.0;
        landing.approach.push_back(point);

        json body = json::parse(BuildLandingMessage(landing))["landing"];
        REQUIRE(body["approachData"].size() == 1);
        REQUIRE(body["approachData"][0]["secondsBeforeTouchdown"].get<double>() == Catch::Approx(-4.0));
        REQUIRE(body["approachData"][0]["altitudeAgl"].get<double>() == Catch::Approx(60.0));
        REQUIRE(body["approachData"][0]["distanceToTouchdown"].get<double>() == Catch::Approx(0.15));
    }
}
