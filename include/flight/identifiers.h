///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file identifiers.h
 * @brief Validation and normalization of airport identifiers and free-text simulator strings
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <optional>
#include <string>

namespace FlightBridge {

/// Strip leading and trailing whitespace
std::string Trim(const std::string& value);

/// Trim and uppercase (ASCII)
std::string NormalizeIdentifier(const std::string& value);

/// True for 3-4 alphabetic characters after trimming
bool IsValidIcao(const std::string& value);

/// Non-empty and printable ASCII only; simulator string fields sometimes carry garbage bytes
bool IsValidString(const std::string& value);

/// Normalized identifier if `value` holds a valid ICAO code, otherwise nullopt
std::optional<std::string> ParseIcao(const std::optional<std::string>& value);

/// Normalized value, or nullopt when absent or blank
std::optional<std::string> NormalizeOptional(const std::optional<std::string>& value);

} // namespace FlightBridge
