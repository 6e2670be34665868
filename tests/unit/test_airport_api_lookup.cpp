///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file test_airport_api_lookup.cpp
 * @brief Unit tests for the airport information API client
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include <catch2/catch_all.hpp>
#include "test_helpers.h"

#include "http/airport_api_lookup.h"

using namespace FlightBridge;
using namespace TestHelpers;

TEST_CASE("Airport info parsing", "[unit][airport_api]") {
    SECTION("Numeric fields") {
        auto info = ParseAirportInfo(R"({"icao":"KSEZ","latitude":34.8486,"longitude":-111.7884})");
        REQUIRE(*info.latitude == Catch::Approx(34.8486));
        REQUIRE(*info.longitude == Catch::Approx(-111.7884));
    }

    SECTION("Numeric strings") {
        auto info = ParseAirportInfo(R"({"latitude":"50.0379","longitude":"8.5622"})");
        REQUIRE(info.latitude.has_value());
        REQUIRE(*info.latitude == Catch::Approx(50.0379));
        REQUIRE(*info.longitude == Catch::Approx(8.5622));
    }

    SECTION("Unusable values leave the field empty") {
        auto info = ParseAirportInfo(R"({"latitude":"","longitude":"8.5x"})");
        REQUIRE_FALSE(info.latitude.has_value());
        REQUIRE_FALSE(info.longitude.has_value());

        info = ParseAirportInfo(R"({"latitude":null,"longitude":true})");
        REQUIRE_FALSE(info.latitude.has_value());
        REQUIRE_FALSE(info.longitude.has_value());
    }

    SECTION("Malformed body") {
        auto info = ParseAirportInfo("<html>error</html>");
        REQUIRE_FALSE(info.latitude.has_value());
        REQUIRE_FALSE(info.longitude.has_value());
    }
}

TEST_CASE("Airport API lookup", "[unit][airport_api]") {
    auto http = std::make_shared<FakeHttpClient>();
    AirportApiLookup lookup(http, "https://airports.test/info?icao={icao}&again={icao}");

    SECTION("URL template substitution") {
        REQUIRE(lookup.BuildUrl("KSEZ") == "https://airports.test/info?icao=KSEZ&again=KSEZ");
        REQUIRE(AirportApiLookup(http).BuildUrl("EDDF") == "https://airport-data.com/api/ap_info.json?icao=EDDF");
    }

    SECTION("Identifiers are percent-encoded") {
        REQUIRE(lookup.BuildUrl("K/S?") == "https://airports.test/info?icao=K%2FS%3F&again=K%2FS%3F");
        REQUIRE(lookup.BuildUrl("A#B") == "https://airports.test/info?icao=A%23B&again=A%23B");
    }

    SECTION("Successful lookup") {
        http->Respond(200, R"({"latitude":"34.8486","longitude":"-111.7884"})");
        auto coords = lookup.Lookup("KSEZ");
        REQUIRE(coords.has_value());
        REQUIRE(coords->latitude == Catch::Approx(34.8486));

        auto requests = http->Requests();
        REQUIRE(requests.size() == 1);
        REQUIRE(requests.front().method == "GET");
        REQUIRE(requests.front().url == "https://airports.test/info?icao=KSEZ&again=KSEZ");
    }

    SECTION("HTTP error status") {
        http->Respond(404, R"({"latitude":1,"longitude":2})");
        REQUIRE_FALSE(lookup.Lookup("ZZZZ").has_value());
    }

    SECTION("Transport failure") {
        http->FailWith("could not resolve host");
        REQUIRE_FALSE(lookup.Lookup("KSEZ").has_value());
    }

    SECTION("Missing or out-of-range coordinates") {
        http->Respond(200, R"({"latitude":34.8})");
        REQUIRE_FALSE(lookup.Lookup("KSEZ").has_value());

        http->Respond(200, R"({"latitude":134.8,"longitude":10.0})");
        REQUIRE_FALSE(lookup.Lookup("KSEZ").has_value());
    }
}
