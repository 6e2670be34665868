///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file flight_events.h
 * @brief Events emitted by the flight state machine
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "flight/approach_recorder.h"
#include "flight/flight_record.h"
#include "flight/landing_rating.h"
#include "flight/rejection.h"
#include "telemetry/snapshot.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace FlightBridge {

struct TakeoffDetected {
    TimePoint timestamp{};
    double liftoff_speed_kt = 0.0;
    bool validated = false;     ///< false while waiting for takeoff speed
    std::optional<std::string> origin;
};

/// A slow (mission) start reached takeoff speed
struct FlightValidated {
    TimePoint timestamp{};
    double ground_speed_kt = 0.0;
    std::optional<std::string> origin;
};

struct FlightSummary {
    std::optional<std::string> origin;
    std::optional<std::string> destination;
    int duration_seconds = 0;
    double distance_nm = 0.0;   ///< rounded to 0.1
};

/**
 * @brief Accepted touchdown.
 *
 * Kinematic and attitude values come from the last tick before touchdown;
 * the touchdown tick itself already shows the aircraft settled on the gear.
 */
struct LandingEvent {
    TimePoint timestamp{};

    double vertical_speed_fpm = 0.0;
    double g_force = 0.0;
    double ground_speed_kt = 0.0;

    LandingRating rating;

    std::optional<std::string> aircraft_title;
    std::optional<std::string> airport;

    double pitch_deg = 0.0;
    double bank_deg = 0.0;
    double angle_of_attack_deg = 0.0;
    double sideslip_deg = 0.0;
    double heading_magnetic = 0.0;
    double lateral_g = 0.0;
    double longitudinal_g = 0.0;

    std::vector<ApproachPoint> approach;   ///< oldest first

    FlightSummary summary;
};

struct FlightRejected {
    RejectionStage stage = RejectionStage::Landing;
    std::vector<RejectionReason> reasons;
    std::string detail;
};

using FlightEvent = std::variant<TakeoffDetected, FlightValidated, LandingEvent, FlightRecord, FlightRejected>;

} // namespace FlightBridge
