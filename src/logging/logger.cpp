///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file logger.cpp
 * @brief Logger implementation
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "logging/logger.h"

#include "spdlog/spdlog.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <vector>

namespace FlightBridge {

std::shared_ptr<spdlog::logger> Logger::s_logger = nullptr;
std::atomic<bool> Logger::s_initialized{false};

namespace {

const char* NonEmptyEnv(const char* name) {
    const char* value = std::getenv(name);
    return (value != nullptr && *value != '\0') ? value : nullptr;
}

bool EnvFlag(const char* name, bool default_value) {
    const char* value = NonEmptyEnv(name);
    return value == nullptr ? default_value : std::atoi(value) != 0;
}

std::filesystem::path DefaultLogDirectory() {
    namespace fs = std::filesystem;
    if (const char* state = NonEmptyEnv("XDG_STATE_HOME")) {
        return fs::path(state) / "flight-bridge" / "logs";
    }
    if (const char* home = NonEmptyEnv("HOME")) {
        return fs::path(home) / ".local" / "state" / "flight-bridge" / "logs";
    }
    return {};
}

} // namespace

std::optional<spdlog::level::level_enum> ParseLogLevel(const std::string& name) {
    std::string level(name);
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (level == "trace")    return spdlog::level::trace;
    if (level == "debug")    return spdlog::level::debug;
    if (level == "info")     return spdlog::level::info;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error")    return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    return std::nullopt;
}

LoggerOptions LoggerOptions::FromEnvironment() {
    LoggerOptions options;
    if (const char* value = NonEmptyEnv("FLIGHT_BRIDGE_LOG_LEVEL")) {
        if (auto level = ParseLogLevel(value)) {
            options.level = *level;
        } else {
            std::fprintf(stderr, "Unknown FLIGHT_BRIDGE_LOG_LEVEL '%s', using the default\n", value);
        }
    }
    options.console = EnvFlag("FLIGHT_BRIDGE_LOG_CONSOLE", options.console);
    options.file = EnvFlag("FLIGHT_BRIDGE_LOG_FILE", options.file);
    if (const char* dir = NonEmptyEnv("FLIGHT_BRIDGE_LOG_DIR")) {
        options.directory = dir;
    }
    return options;
}

std::string Logger::LogFilePath(const LoggerOptions& options) {
    namespace fs = std::filesystem;

    fs::path directory = options.directory.empty() ? DefaultLogDirectory() : fs::path(options.directory);
    if (!directory.empty()) {
        std::error_code ec;
        fs::create_directories(directory, ec);
        if (ec) {
            directory.clear();
        }
    }

    // flight_bridge_YYYYMMDD.log
    std::time_t now = std::time(nullptr);
    std::tm time_info{};
    localtime_r(&now, &time_info);

    std::ostringstream filename;
    filename << "flight_bridge_" << std::put_time(&time_info, "%Y%m%d") << ".log";
    return (directory / filename.str()).string();
}

bool Logger::Initialize() {
    return Initialize(LoggerOptions::FromEnvironment());
}

bool Logger::Initialize(const LoggerOptions& options) {
    if (s_initialized) {
        return true;
    }

    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (options.console) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [thread %t] %v");
            sinks.push_back(console_sink);
        }

        std::string file_path;
        if (options.file) {
            file_path = LogFilePath(options);
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                file_path, options.max_file_bytes, options.max_files);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [thread %t] %v");
            sinks.push_back(file_sink);
        }

        s_logger = std::make_shared<spdlog::logger>("flight_bridge", sinks.begin(), sinks.end());
        s_logger->set_level(options.level);

        s_logger->flush_on(spdlog::level::warn);
        spdlog::flush_every(std::chrono::seconds(3));

        spdlog::set_default_logger(s_logger);
        s_initialized = true;

        LOG_DEBUG("Logging at level {}{}", spdlog::level::to_string_view(options.level),
                  file_path.empty() ? std::string() : ", file " + file_path);
        return true;
    }
    catch (const std::exception& ex) {
        std::fprintf(stderr, "Failed to initialize logging: %s\n", ex.what());
        s_logger = nullptr;
        return false;
    }
}

void Logger::Shutdown() {
    if (!s_initialized.exchange(false)) {
        return;
    }
    if (s_logger) {
        s_logger->flush();
    }
    spdlog::shutdown();
    s_logger = nullptr;
}

std::shared_ptr<spdlog::logger> Logger::GetLogger() {
    return s_logger;
}

void Logger::Flush() {
    if (s_initialized && s_logger) {
        s_logger->flush();
    }
}

bool Logger::IsInitialized() {
    return s_initialized;
}

} // namespace FlightBridge
