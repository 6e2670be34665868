///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file test_flight_store.cpp
 * @brief Unit tests for the flight record body and the REST store
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include <catch2/catch_all.hpp>
#include "test_helpers.h"

#include "persistence/flight_store.h"

#include <nlohmann/json.hpp>

using namespace FlightBridge;
using namespace TestHelpers;
using nlohmann::json;

namespace {

FlightRecord MakeRecord() {
    FlightRecord record;
    record.user_id = std::string("user-1");
    record.origin = std::string("EDDF");
    record.destination = std::string("EGLL");
    record.aircraft_type = std::string("Airbus A320");
    record.departure_time = FromUnixMillis(1700000000000LL);
    record.arrival_time = FromUnixMillis(1700003600500LL);
    record.flight_duration_seconds = 3600;
    record.distance_nm = 352.86;
    record.max_altitude_ft = 36000;
    record.landing_rating = 4;
    record.landing_vs = -150.0;
    record.landing_gforce = 1.2;
    record.session_code = std::string("ABCD-2345");
    record.score = 393;
    return record;
}

} // namespace

TEST_CASE("Flight record body", "[unit][persistence]") {
    SECTION("All fields in snake_case") {
        json doc = json::parse(BuildFlightRecordJSON(MakeRecord()));
        REQUIRE(doc["user_id"] == "user-1");
        REQUIRE(doc["origin"] == "EDDF");
        REQUIRE(doc["destination"] == "EGLL");
        REQUIRE(doc["aircraft_type"] == "Airbus A320");
        REQUIRE(doc["departure_time"] == "2023-11-14T22:13:20.000Z");
        REQUIRE(doc["arrival_time"] == "2023-11-14T23:13:20.500Z");
        REQUIRE(doc["flight_duration_seconds"] == 3600);
        REQUIRE(doc["distance_nm"].get<double>() == Catch::Approx(352.86));
        REQUIRE(doc["max_altitude_ft"] == 36000);
        REQUIRE(doc["landing_rating"] == 4);
        REQUIRE(doc["landing_vs"].get<double>() == Catch::Approx(-150.0));
        REQUIRE(doc["landing_gforce"].get<double>() == Catch::Approx(1.2));
        REQUIRE(doc["session_code"] == "ABCD-2345");
        REQUIRE(doc["score"] == 393);
    }

    SECTION("Absent optionals are omitted") {
        FlightRecord record = MakeRecord();
        record.user_id.reset();
        record.origin.reset();
        record.session_code.reset();

        json doc = json::parse(BuildFlightRecordJSON(record));
        REQUIRE_FALSE(doc.contains("user_id"));
        REQUIRE_FALSE(doc.contains("origin"));
        REQUIRE_FALSE(doc.contains("session_code"));
        REQUIRE(doc.contains("destination"));
    }
}

TEST_CASE("REST flight store", "[unit][persistence]") {
    auto http = std::make_shared<FakeHttpClient>();
    RestFlightStore store(http, "https://example.supabase.co/", "anon-key");

    SECTION("Endpoint") {
        REQUIRE(store.Endpoint() == "https://example.supabase.co/rest/v1/flights");
    }

    SECTION("Saved with the API key when nobody is signed in") {
        http->Respond(201, "[]");
        REQUIRE(store.Save(MakeRecord()));

        auto requests = http->Requests();
        REQUIRE(requests.size() == 1);
        const auto& request = requests.front();
        REQUIRE(request.method == "POST");
        REQUIRE(request.url == "https://example.supabase.co/rest/v1/flights");
        REQUIRE(FakeHttpClient::Header(request, "apikey") == std::optional<std::string>("anon-key"));
        REQUIRE(FakeHttpClient::Header(request, "Authorization") == std::optional<std::string>("Bearer anon-key"));
        REQUIRE(FakeHttpClient::Header(request, "Content-Type") == std::optional<std::string>("application/json"));
        REQUIRE(json::parse(request.body)["origin"] == "EDDF");
    }

    SECTION("User token replaces the key as bearer until logout") {
        store.SetUserToken(std::string("user-jwt"));
        store.Save(MakeRecord());
        store.SetUserToken(std::string(""));
        store.Save(MakeRecord());

        auto requests = http->Requests();
        REQUIRE(requests.size() == 2);
        REQUIRE(FakeHttpClient::Header(requests[0], "Authorization") == std::optional<std::string>("Bearer user-jwt"));
        REQUIRE(FakeHttpClient::Header(requests[0], "apikey") == std::optional<std::string>("anon-key"));
        REQUIRE(FakeHttpClient::Header(requests[1], "Authorization") == std::optional<std::string>("Bearer anon-key"));
    }

    SECTION("Backend refusal and transport failure report false") {
        http->Respond(401, R"({"message":"JWT expired"})");
        REQUIRE_FALSE(store.Save(MakeRecord()));

        http->FailWith("connection refused");
        REQUIRE_FALSE(store.Save(MakeRecord()));
    }
}
