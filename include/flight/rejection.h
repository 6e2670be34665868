///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file rejection.h
 * @brief Reasons a takeoff, landing or flight record is refused
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <string>
#include <vector>

namespace FlightBridge {

enum class RejectionStage {
    Takeoff,
    Landing,
    Record
};

enum class RejectionReason {
    InAirSpawn,         ///< liftoff above the plausible takeoff speed
    NotValidated,       ///< never reached takeoff speed while airborne
    DurationTooShort,
    AltitudeTooLow,
    GForceTooLow,       ///< pause/freeze artifact
    DistanceTooShort,
    Bounce,             ///< too soon after the previous accepted landing
    NoAirportKnown      ///< neither origin nor destination resolved
};

const char* ToString(RejectionStage stage);
const char* ToString(RejectionReason reason);

/// Comma-separated reason names for log lines
std::string JoinReasons(const std::vector<RejectionReason>& reasons);

} // namespace FlightBridge
