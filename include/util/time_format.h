///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file time_format.h
 * @brief Timestamp conversions for wire formats
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "telemetry/snapshot.h"

#include <cstdint>
#include <string>

namespace FlightBridge {

/// "2024-05-01T12:34:56.789Z"
std::string FormatIso8601Utc(TimePoint time);

std::int64_t ToUnixMillis(TimePoint time);
TimePoint FromUnixMillis(std::int64_t millis);

} // namespace FlightBridge
