///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file main.cpp
 * @brief flight_bridge executable
 *
 * Usage: flight_bridge [env-file]
 *
 * Loads the env file (default ".env" in the working directory), starts the
 * bridge and runs until SIGINT or SIGTERM.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "bridge/bridge.h"
#include "common/errors.h"
#include "config/bridge_config.h"
#include "logging/logger.h"

#include <csignal>
#include <cstdio>
#include <cstring>
#include <string>

#include <pthread.h>
#include <signal.h>

using namespace FlightBridge;

namespace {

void PrintUsage(const char* program) {
    std::printf("Usage: %s [env-file]\n\n", program);
    std::printf("Streams flight simulator telemetry to WebSocket viewers.\n");
    std::printf("Configuration is read from the environment; see FLIGHT_BRIDGE_* variables.\n");
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc > 1 && (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0)) {
        PrintUsage(argv[0]);
        return 0;
    }

    // Environment must be complete before the logger reads its settings
    const std::string env_file = argc > 1 ? argv[1] : ".env";
    const bool env_loaded = LoadEnvFile(env_file);

    if (!Logger::Initialize()) {
        std::fprintf(stderr, "Logging could not be initialized, continuing without it\n");
    }
    if (env_loaded) {
        LOG_INFO("Loaded environment from {}", env_file);
    } else if (argc > 1) {
        LOG_ERROR("Cannot read env file {}", env_file);
        Logger::Shutdown();
        return 1;
    }

    // Block termination signals in every thread; main waits for them below
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    int exit_code = 0;
    try {
        const BridgeConfig config = BridgeConfig::FromEnvironment();

        Bridge bridge;
        if (!bridge.Initialize(config)) {
            LOG_CRITICAL("Bridge failed to start");
            exit_code = 1;
        } else {
            LOG_INFO("Running, press Ctrl+C to stop");

            int received = 0;
            if (sigwait(&signals, &received) == 0) {
                LOG_INFO("Received {}, stopping", received == SIGINT ? "SIGINT" : "SIGTERM");
            }
            bridge.Shutdown();
        }
    } catch (const ConfigError& ex) {
        LOG_CRITICAL("Configuration error: {}", ex.what());
        exit_code = 2;
    }

    Logger::Shutdown();
    return exit_code;
}
