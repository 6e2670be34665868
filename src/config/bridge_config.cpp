///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file bridge_config.cpp
 * @brief BridgeConfig implementation
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "config/bridge_config.h"
#include "common/errors.h"
#include "flight/identifiers.h"
#include "http/airport_api_lookup.h"
#include "logging/logger.h"
#include "session/session_code.h"

#include <cstdlib>
#include <fstream>
#include <initializer_list>

namespace FlightBridge {

namespace {

/// Integer value in [min, max], or the default with a warning
int ReadInt(const char* name, int default_value, int min_value, int max_value) {
    const auto text = GetEnv(name);
    if (!text) {
        return default_value;
    }

    char* end = nullptr;
    const long value = std::strtol(text->c_str(), &end, 10);
    if (end == text->c_str() || *end != '\0') {
        LOG_WARN("{}='{}' is not a number, using {}", name, *text, default_value);
        return default_value;
    }
    if (value < min_value) {
        LOG_WARN("{}={} is below the minimum, using {}", name, value, min_value);
        return min_value;
    }
    if (value > max_value) {
        LOG_WARN("{}={} is out of range, using {}", name, value, default_value);
        return default_value;
    }
    return static_cast<int>(value);
}

std::optional<std::string> FirstEnv(std::initializer_list<const char*> names) {
    for (const char* name : names) {
        if (auto value = GetEnv(name)) {
            return value;
        }
    }
    return std::nullopt;
}

std::string Unquote(const std::string& value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

} // namespace

std::optional<std::string> GetEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

bool LoadEnvFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    int loaded = 0;
    std::string line;
    while (std::getline(file, line)) {
        const std::string trimmed = Trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }

        const size_t eq = trimmed.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }

        const std::string key = Trim(trimmed.substr(0, eq));
        const std::string value = Unquote(Trim(trimmed.substr(eq + 1)));
        if (key.empty() || GetEnv(key.c_str())) {
            continue;
        }
        if (::setenv(key.c_str(), value.c_str(), 1) == 0) {
            ++loaded;
        }
    }

    LOG_DEBUG("Loaded {} variable(s) from {}", loaded, path);
    return true;
}

BridgeConfig BridgeConfig::FromEnvironment() {
    BridgeConfig config;

    config.ws_port = static_cast<std::uint16_t>(ReadInt("FLIGHT_BRIDGE_WS_PORT", DEFAULT_WS_PORT, 1, 65535));
    config.poll_interval = std::chrono::milliseconds(
        ReadInt("FLIGHT_BRIDGE_POLL_MS", DEFAULT_POLL_MS, MIN_POLL_MS, 60 * 60 * 1000));
    config.retry_interval = std::chrono::milliseconds(
        ReadInt("FLIGHT_BRIDGE_RETRY_MS", DEFAULT_RETRY_MS, MIN_POLL_MS, 60 * 60 * 1000));
    config.send_buffer_bytes = static_cast<size_t>(
        ReadInt("FLIGHT_BRIDGE_SEND_BUFFER_KB", DEFAULT_SEND_BUFFER_KB, 16, 1024 * 1024)) * 1024;

    config.replay_file = GetEnv("FLIGHT_BRIDGE_REPLAY_FILE");
    config.airport_api_url = GetEnv("FLIGHT_BRIDGE_AIRPORT_API_URL").value_or(DEFAULT_AIRPORT_API_URL);

    config.supabase_url = FirstEnv({"SUPABASE_URL", "VITE_SUPABASE_URL"});
    // Service key first: it is not subject to row-level security
    config.supabase_key = FirstEnv({"SUPABASE_SERVICE_KEY", "SUPABASE_ANON_KEY", "VITE_SUPABASE_ANON_KEY"});

    const auto session = GetEnv("FLIGHT_BRIDGE_SESSION");
    if (!session) {
        // Sessions exist for remote viewers of saved flights
        if (config.PersistenceEnabled()) {
            config.session_code = GenerateSessionCode();
        }
    } else if (*session == "auto") {
        config.session_code = GenerateSessionCode();
    } else if (*session == "none") {
        config.session_code.reset();
    } else {
        const std::string code = NormalizeIdentifier(*session);
        if (!IsValidSessionCode(code)) {
            throw ConfigError("FLIGHT_BRIDGE_SESSION='" + *session + "' is not a valid XXXX-XXXX session code");
        }
        config.session_code = code;
    }

    return config;
}

} // namespace FlightBridge
