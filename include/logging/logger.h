///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file logger.h
 * @brief Process-wide spdlog logger and the LOG_* macros
 *
 * Every thread of the bridge logs (telemetry loop, dispatcher, WebSocket
 * loop, task queues), so all sinks are the thread-safe `_mt` variants.
 *
 * Environment Variables:
 * - FLIGHT_BRIDGE_LOG_LEVEL   : trace|debug|info|warn|error|critical (default: debug, info in release)
 * - FLIGHT_BRIDGE_LOG_CONSOLE : colored stdout sink (0|1, default: 1)
 * - FLIGHT_BRIDGE_LOG_FILE    : rotating file sink (0|1, default: 1)
 * - FLIGHT_BRIDGE_LOG_DIR     : directory for flight_bridge_YYYYMMDD.log
 *                               (default: $XDG_STATE_HOME/flight-bridge/logs,
 *                               then ~/.local/state/flight-bridge/logs)
 *
 * Usage:
 * @code
 *   FlightBridge::Logger::Initialize();
 *   LOG_INFO("WebSocket server listening on port {}", port);
 *   FlightBridge::Logger::Shutdown();
 * @endcode
 *
 * The macros are no-ops until Initialize() succeeds, so library code may log
 * unconditionally.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

// The macros below call into spdlog::logger directly, so the full type is needed here
#include <spdlog/logger.h>

namespace FlightBridge {

/// Case-insensitive level name; nullopt for anything unknown
std::optional<spdlog::level::level_enum> ParseLogLevel(const std::string& name);

struct LoggerOptions {
#if defined(NDEBUG)
    spdlog::level::level_enum level = spdlog::level::info;
#else
    spdlog::level::level_enum level = spdlog::level::debug;
#endif
    bool console = true;
    bool file = true;

    /// Empty means the platform default state directory
    std::string directory;

    size_t max_file_bytes = 5 * 1024 * 1024;
    size_t max_files = 3;

    /// Unknown level names keep the default
    static LoggerOptions FromEnvironment();
};

class Logger {
public:
    /// Initialize(LoggerOptions::FromEnvironment())
    static bool Initialize();

    /**
     * @brief Create the sinks and install the logger as spdlog's default.
     *
     * A second call while initialized is a no-op. If the log directory
     * cannot be created the file goes to the working directory.
     *
     * @return false if spdlog refused to create a sink
     */
    static bool Initialize(const LoggerOptions& options);

    /// Flush and release every sink; LOG_* become no-ops again
    static void Shutdown();

    static std::shared_ptr<spdlog::logger> GetLogger();

    static void Flush();

    static bool IsInitialized();

    /// File the rotating sink writes to for `options`, dated today
    static std::string LogFilePath(const LoggerOptions& options);

private:
    static std::shared_ptr<spdlog::logger> s_logger;
    static std::atomic<bool> s_initialized;
};

} // namespace FlightBridge

///////////////////////////////////////////////////////////////////////////////////////////////////
// Convenience Macros for Logging
///////////////////////////////////////////////////////////////////////////////////////////////////

#if defined(NDEBUG)
    // In Release builds, TRACE and DEBUG are disabled
    #define LOG_TRACE(...)    ((void)0)
    #define LOG_DEBUG(...)    ((void)0)
#else
    #define LOG_TRACE(...)    do { if (::FlightBridge::Logger::IsInitialized()) ::FlightBridge::Logger::GetLogger()->trace(__VA_ARGS__); } while (0)
    #define LOG_DEBUG(...)    do { if (::FlightBridge::Logger::IsInitialized()) ::FlightBridge::Logger::GetLogger()->debug(__VA_ARGS__); } while (0)
#endif

#define LOG_INFO(...)         do { if (::FlightBridge::Logger::IsInitialized()) ::FlightBridge::Logger::GetLogger()->info(__VA_ARGS__); } while (0)
#define LOG_WARN(...)         do { if (::FlightBridge::Logger::IsInitialized()) ::FlightBridge::Logger::GetLogger()->warn(__VA_ARGS__); } while (0)
#define LOG_ERROR(...)        do { if (::FlightBridge::Logger::IsInitialized()) ::FlightBridge::Logger::GetLogger()->error(__VA_ARGS__); } while (0)
#define LOG_CRITICAL(...)     do { if (::FlightBridge::Logger::IsInitialized()) ::FlightBridge::Logger::GetLogger()->critical(__VA_ARGS__); } while (0)

#define LOG_FLUSH()           do { if (::FlightBridge::Logger::IsInitialized()) ::FlightBridge::Logger::Flush(); } while (0)
