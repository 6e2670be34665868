///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file bridge_config.h
 * @brief Runtime configuration from environment variables and an optional .env file
 *
 * Environment variables:
 * - FLIGHT_BRIDGE_WS_PORT         WebSocket port (default 8500)
 * - FLIGHT_BRIDGE_POLL_MS         telemetry cadence, min 100 (default 1000)
 * - FLIGHT_BRIDGE_RETRY_MS        reconnect interval (default 5000)
 * - FLIGHT_BRIDGE_SEND_BUFFER_KB  per-client outbound buffer (default 1024)
 * - FLIGHT_BRIDGE_REPLAY_FILE     JSON-lines telemetry file to replay
 * - FLIGHT_BRIDGE_AIRPORT_API_URL coordinate API, "{icao}" placeholder
 * - FLIGHT_BRIDGE_SESSION         "auto", an explicit XXXX-XXXX code, or "none"
 * - SUPABASE_URL, SUPABASE_SERVICE_KEY / SUPABASE_ANON_KEY   flight persistence
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace FlightBridge {

constexpr std::uint16_t DEFAULT_WS_PORT = 8500;
constexpr int DEFAULT_POLL_MS = 1000;
constexpr int MIN_POLL_MS = 100;
constexpr int DEFAULT_RETRY_MS = 5000;
constexpr int DEFAULT_SEND_BUFFER_KB = 1024;

struct BridgeConfig {
    std::uint16_t ws_port = DEFAULT_WS_PORT;
    std::chrono::milliseconds poll_interval{DEFAULT_POLL_MS};
    std::chrono::milliseconds retry_interval{DEFAULT_RETRY_MS};
    size_t send_buffer_bytes = static_cast<size_t>(DEFAULT_SEND_BUFFER_KB) * 1024;

    std::optional<std::string> replay_file;
    std::string airport_api_url;

    /// Announced to viewers and attached to saved flights
    std::optional<std::string> session_code;

    std::optional<std::string> supabase_url;
    std::optional<std::string> supabase_key;

    bool PersistenceEnabled() const { return supabase_url.has_value() && supabase_key.has_value(); }

    /**
     * @brief Read every key from the process environment.
     *
     * Malformed numbers fall back to their default with a warning.
     * @throws ConfigError if FLIGHT_BRIDGE_SESSION holds an invalid code
     */
    static BridgeConfig FromEnvironment();
};

/// Non-empty value of an environment variable
std::optional<std::string> GetEnv(const char* name);

/**
 * @brief Load KEY=VALUE lines into the environment.
 *
 * Blank lines and '#' comments are skipped, surrounding quotes are removed.
 * Variables that already have a non-empty value are left alone.
 *
 * @return false if the file could not be opened
 */
bool LoadEnvFile(const std::string& path);

} // namespace FlightBridge
