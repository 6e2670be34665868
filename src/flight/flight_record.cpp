///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file flight_record.cpp
 * @brief FlightRecord construction and scoring
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "flight/flight_record.h"

#include <algorithm>
#include <cmath>

namespace FlightBridge {

namespace {

int DurationSeconds(const CompletedFlight& flight) {
    return static_cast<int>(
        std::chrono::duration_cast<std::chrono::seconds>(flight.arrival_time - flight.departure_time).count());
}

double RoundedDistance(const CompletedFlight& flight) {
    return std::round(flight.distance_nm * 100.0) / 100.0;
}

} // namespace

int ComputeFlightScore(double distance_nm, int duration_seconds, int landing_rating) {
    const double expected_duration_s = distance_nm / AVERAGE_CRUISE_SPEED_KT * 3600.0;

    double time_factor = 1.0;
    if (expected_duration_s > 0) {
        time_factor = std::min(1.0, duration_seconds / expected_duration_s);
    }

    return static_cast<int>(std::round(distance_nm * time_factor)) + landing_rating * 10;
}

std::vector<RejectionReason> CheckRecordRequirements(const CompletedFlight& flight) {
    std::vector<RejectionReason> reasons;

    if (DurationSeconds(flight) < RECORD_MIN_DURATION_S) {
        reasons.push_back(RejectionReason::DurationTooShort);
    }
    if (RoundedDistance(flight) < RECORD_MIN_DISTANCE_NM) {
        reasons.push_back(RejectionReason::DistanceTooShort);
    }
    if (!flight.origin && !flight.destination) {
        reasons.push_back(RejectionReason::NoAirportKnown);
    }
    return reasons;
}

std::optional<FlightRecord> MaterializeFlightRecord(const CompletedFlight& flight) {
    if (!CheckRecordRequirements(flight).empty()) {
        return std::nullopt;
    }

    FlightRecord record;
    record.origin = flight.origin;
    record.destination = flight.destination;
    record.aircraft_type = flight.aircraft_type;
    record.departure_time = flight.departure_time;
    record.arrival_time = flight.arrival_time;
    record.flight_duration_seconds = DurationSeconds(flight);
    record.distance_nm = RoundedDistance(flight);
    record.max_altitude_ft = static_cast<int>(flight.max_altitude_ft);
    record.landing_rating = flight.landing_rating;
    record.landing_vs = flight.landing_vs;
    record.landing_gforce = flight.landing_gforce;
    record.score = ComputeFlightScore(record.distance_nm, record.flight_duration_seconds, record.landing_rating);
    return record;
}

} // namespace FlightBridge
