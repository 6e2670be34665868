///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file telemetry_loop.h
 * @brief Background producer: polls the source, runs the state machine, emits events
 *
 * Ticks are strictly ordered on one thread. Each tick sends the snapshot and
 * then any flight events it produced to the event channel. When the source
 * fails the machine is reset without a landing and a SourceStatus is sent;
 * Connect() is retried every retry interval.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "bridge/route_hint_board.h"
#include "flight/flight_state_machine.h"
#include "telemetry/snapshot.h"
#include "telemetry/telemetry_source.h"
#include "util/channel.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <variant>

namespace FlightBridge {

class AirportLocator;

/// Source connected or lost
struct SourceStatus {
    bool connected = false;
    std::string detail;
};

using BridgeEvent = std::variant<SnapshotPtr, FlightEvent, SourceStatus>;
using BridgeEventChannel = Channel<BridgeEvent>;

struct TelemetryLoopOptions {
    std::chrono::milliseconds poll_interval{1000};
    std::chrono::milliseconds retry_interval{5000};
};

class TelemetryLoop {
public:
    /**
     * @param source    polled only from the loop thread while running
     * @param events    receives snapshots, flight events and status changes
     * @param hints     route fallback for origin/destination
     * @param airports  nearest-airport fallback; may be null
     */
    TelemetryLoop(std::shared_ptr<TelemetrySource> source,
                  BridgeEventChannel& events,
                  const RouteHintBoard& hints,
                  const AirportLocator* airports,
                  TelemetryLoopOptions options = TelemetryLoopOptions{});
    ~TelemetryLoop();

    TelemetryLoop(const TelemetryLoop&) = delete;
    TelemetryLoop& operator=(const TelemetryLoop&) = delete;

    /// @return false if already running
    bool Start();

    /// Signal and join; no tick runs after this returns. Idempotent.
    void Stop();

    bool IsRunning() const { return running_; }

    /// Snapshots processed since construction
    size_t TicksProcessed() const { return ticks_; }

private:
    void Run();
    bool TryConnect();
    void ReportUnavailable(const std::string& reason);
    void Tick();
    void HandleDisruption(const std::string& reason);

    /// Sleep until `deadline` or Stop(); false if stopping
    bool WaitUntil(std::chrono::steady_clock::time_point deadline);

    std::shared_ptr<TelemetrySource> source_;
    BridgeEventChannel& events_;
    const RouteHintBoard& hints_;
    TelemetryLoopOptions options_;

    FlightStateMachine machine_;
    bool unavailable_reported_ = false;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;

    std::atomic<bool> running_{false};
    std::atomic<size_t> ticks_{0};
    std::thread thread_;
};

} // namespace FlightBridge
