///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file flight_record.h
 * @brief Summary of one completed flight, as handed to the persistence sink
 *
 * Record materialization applies its own minimum bar, independent of landing
 * acceptance: a landing can be shown to viewers while the flight is still
 * unsuitable for the logbook.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "flight/rejection.h"
#include "telemetry/snapshot.h"

#include <optional>
#include <string>
#include <vector>

namespace FlightBridge {

constexpr int RECORD_MIN_DURATION_S = 120;
constexpr double RECORD_MIN_DISTANCE_NM = 5.0;

/// Assumed cruise speed for the expected-duration score factor
constexpr double AVERAGE_CRUISE_SPEED_KT = 400.0;

struct FlightRecord {
    std::optional<std::string> user_id;
    std::optional<std::string> origin;
    std::optional<std::string> destination;
    std::optional<std::string> aircraft_type;
    TimePoint departure_time{};
    TimePoint arrival_time{};
    int flight_duration_seconds = 0;
    double distance_nm = 0.0;
    int max_altitude_ft = 0;
    int landing_rating = 0;
    double landing_vs = 0.0;
    double landing_gforce = 0.0;
    std::optional<std::string> session_code;
    int score = 0;
};

/// Values the state machine collected for a landed flight
struct CompletedFlight {
    std::optional<std::string> origin;
    std::optional<std::string> destination;
    std::optional<std::string> aircraft_type;
    TimePoint departure_time{};
    TimePoint arrival_time{};
    double distance_nm = 0.0;
    double max_altitude_ft = 0.0;
    int landing_rating = 0;
    double landing_vs = 0.0;
    double landing_gforce = 0.0;
};

/**
 * @brief score = round(distance * time_factor) + rating * 10
 *
 * time_factor = min(1, duration / expected) with expected = distance / 400 kt;
 * 1 when the expected duration is zero.
 */
int ComputeFlightScore(double distance_nm, int duration_seconds, int landing_rating);

/// Every record requirement the flight misses; empty when a record can be built
std::vector<RejectionReason> CheckRecordRequirements(const CompletedFlight& flight);

/**
 * @brief Build the persisted summary, or nullopt when CheckRecordRequirements() fails.
 *
 * Duration is whole seconds and distance is rounded to 0.01 NM before the
 * checks and the score are applied. user_id and session_code are left empty
 * for the caller to tag.
 */
std::optional<FlightRecord> MaterializeFlightRecord(const CompletedFlight& flight);

} // namespace FlightBridge
