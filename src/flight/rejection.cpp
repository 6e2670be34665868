///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file rejection.cpp
 * @brief Names for rejection stages and reasons
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "flight/rejection.h"

namespace FlightBridge {

const char* ToString(RejectionStage stage) {
    switch (stage) {
        case RejectionStage::Takeoff: return "takeoff";
        case RejectionStage::Landing: return "landing";
        case RejectionStage::Record:  return "record";
    }
    return "unknown";
}

const char* ToString(RejectionReason reason) {
    switch (reason) {
        case RejectionReason::InAirSpawn:       return "in_air_spawn";
        case RejectionReason::NotValidated:     return "not_validated";
        case RejectionReason::DurationTooShort: return "duration_too_short";
        case RejectionReason::AltitudeTooLow:   return "altitude_too_low";
        case RejectionReason::GForceTooLow:     return "gforce_too_low";
        case RejectionReason::DistanceTooShort: return "distance_too_short";
        case RejectionReason::Bounce:           return "bounce";
        case RejectionReason::NoAirportKnown:   return "no_airport_known";
    }
    return "unknown";
}

std::string JoinReasons(const std::vector<RejectionReason>& reasons) {
    std::string out;
    for (size_t i = 0; i < reasons.size(); ++i) {
        if (i > 0) out += ", ";
        out += ToString(reasons[i]);
    }
    return out;
}

} // namespace FlightBridge
