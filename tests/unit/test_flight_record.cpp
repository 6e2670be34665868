///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file test_flight_record.cpp
 * @brief Unit tests for flight scoring and record materialization
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include <catch2/catch_all.hpp>
#include "test_helpers.h"

#include "flight/flight_record.h"

#include <algorithm>

using namespace FlightBridge;
using namespace TestHelpers;

namespace {

CompletedFlight MakeCompleted(double duration_s, double distance_nm) {
    CompletedFlight flight;
    flight.origin = std::string("EDDF");
    flight.destination = std::string("EGLL");
    flight.aircraft_type = std::string("Airbus A320");
    flight.departure_time = At(0);
    flight.arrival_time = At(duration_s);
    flight.distance_nm = distance_nm;
    flight.max_altitude_ft = 36012.7;
    flight.landing_rating = 4;
    flight.landing_vs = -150.0;
    flight.landing_gforce = 1.2;
    return flight;
}

bool HasReason(const std::vector<RejectionReason>& reasons, RejectionReason reason) {
    return std::find(reasons.begin(), reasons.end(), reason) != reasons.end();
}

} // namespace

TEST_CASE("Flight score", "[unit][record]") {
    SECTION("A flight at least as long as expected gets the full distance") {
        // 400 NM at 400 kt is one hour
        REQUIRE(ComputeFlightScore(400.0, 3600, 4) == 440);
        REQUIRE(ComputeFlightScore(400.0, 7200, 4) == 440);
    }

    SECTION("A faster-than-possible flight is scaled down") {
        // half the expected time
        REQUIRE(ComputeFlightScore(400.0, 1800, 5) == 250);
    }

    SECTION("Zero distance scores only the landing") {
        REQUIRE(ComputeFlightScore(0.0, 600, 3) == 30);
    }
}

TEST_CASE("Record requirements", "[unit][record]") {
    SECTION("A normal flight materializes") {
        auto record = MaterializeFlightRecord(MakeCompleted(3600.0, 352.866));
        REQUIRE(record.has_value());
        REQUIRE(record->flight_duration_seconds == 3600);
        REQUIRE(record->distance_nm == Catch::Approx(352.87));
        REQUIRE(record->max_altitude_ft == 36012);
        REQUIRE(record->origin == std::optional<std::string>("EDDF"));
        REQUIRE(record->destination == std::optional<std::string>("EGLL"));
        REQUIRE(record->score == 393);
        REQUIRE_FALSE(record->user_id.has_value());
        REQUIRE_FALSE(record->session_code.has_value());
    }

    SECTION("Shorter than 120 s is refused") {
        auto reasons = CheckRecordRequirements(MakeCompleted(119.0, 30.0));
        REQUIRE(reasons.size() == 1);
        REQUIRE(HasReason(reasons, RejectionReason::DurationTooShort));
        REQUIRE_FALSE(MaterializeFlightRecord(MakeCompleted(119.0, 30.0)).has_value());
    }

    SECTION("Exactly 120 s and 5 NM is accepted") {
        REQUIRE(CheckRecordRequirements(MakeCompleted(120.0, 5.0)).empty());
    }

    SECTION("Distance is compared after rounding to 0.01") {
        REQUIRE(CheckRecordRequirements(MakeCompleted(200.0, 4.996)).empty());
        REQUIRE(HasReason(CheckRecordRequirements(MakeCompleted(200.0, 4.9)), RejectionReason::DistanceTooShort));
    }

    SECTION("At least one airport must be known") {
        CompletedFlight flight = MakeCompleted(600.0, 50.0);
        flight.origin.reset();
        REQUIRE(CheckRecordRequirements(flight).empty());

        flight.destination.reset();
        auto reasons = CheckRecordRequirements(flight);
        REQUIRE(reasons.size() == 1);
        REQUIRE(reasons.front() == RejectionReason::NoAirportKnown);
    }
}
