///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file errors.h
 * @brief Exception types used as the error channel between FlightBridge components
 *
 * "Not found" results are reported with std::optional, never with these.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <stdexcept>
#include <string>

namespace FlightBridge {

/// Invalid configuration value that cannot fall back to a default
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

/// The telemetry source went away (process exited, connection lost, replay ended)
class TelemetrySourceError : public std::runtime_error {
public:
    explicit TelemetrySourceError(const std::string& message) : std::runtime_error(message) {}
};

/// Delivery to a single client connection failed; only that connection is affected
class SendError : public std::runtime_error {
public:
    explicit SendError(const std::string& message) : std::runtime_error(message) {}
};

/// HTTP request could not be completed (DNS, connect, timeout); HTTP status codes are not errors
class HttpError : public std::runtime_error {
public:
    explicit HttpError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace FlightBridge
