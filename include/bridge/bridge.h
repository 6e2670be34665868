///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file bridge.h
 * @brief Top-level orchestrator wiring source, state machine, transport and sinks
 *
 * Threads while initialized:
 * - telemetry loop      polls the source and runs the state machine
 * - dispatcher          drains the event channel into the hub and the flight store
 * - WebSocket server    client I/O
 * - airport-lookup      coordinate lookups (owned by the hub)
 * - flight-store        persistence calls
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "bridge/route_hint_board.h"
#include "bridge/telemetry_loop.h"
#include "config/bridge_config.h"
#include "flight/airport_database.h"
#include "flight/coordinate_lookup.h"
#include "net/broadcast_hub.h"
#include "net/connection_registry.h"
#include "net/websocket_server.h"
#include "persistence/flight_store.h"
#include "telemetry/telemetry_source.h"
#include "util/task_queue.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace FlightBridge {

/// External collaborators; any may be null
struct BridgeCollaborators {
    std::shared_ptr<TelemetrySource> source;
    std::shared_ptr<CoordinateLookup> coordinates;
    /// Answered inline before `coordinates`; must not block
    std::shared_ptr<CoordinateLookup> local_coordinates;
    std::shared_ptr<FlightStore> store;
    std::shared_ptr<const AirportLocator> airports;
    BroadcastHub::RelaySink relay;
};

class Bridge {
public:
    Bridge() = default;
    ~Bridge();

    Bridge(const Bridge&) = delete;
    Bridge& operator=(const Bridge&) = delete;

    /**
     * @brief Build the default collaborators from `config` and start.
     *
     * Source: replay file when configured. Coordinates: built-in table, then
     * the airport API. Store: REST when Supabase is configured.
     */
    bool Initialize(const BridgeConfig& config);

    /**
     * @brief Start the WebSocket server, dispatcher and telemetry loop.
     *
     * Calling Initialize() on a running bridge shuts it down first.
     * @return false if the WebSocket server cannot start
     */
    bool Initialize(const BridgeConfig& config, BridgeCollaborators collaborators);

    /// Stop everything in reverse start order. Safe to call multiple times.
    void Shutdown();

    bool IsInitialized() const { return initialized_; }

    /// Bound WebSocket port, 0 when not initialized
    std::uint16_t Port() const;

    std::optional<std::string> CurrentUserId() const;

    /// Null when not initialized
    BroadcastHub* Hub() { return hub_.get(); }

    /// Send an event as if the telemetry loop produced it
    bool Publish(BridgeEvent event);

private:
    void DispatchLoop();
    void Dispatch(const BridgeEvent& event);
    void HandleFlightEvent(const FlightEvent& event);
    void PersistRecord(FlightRecord record);
    void OnAuth(const AuthUpdate& update);

    BridgeConfig config_;
    BridgeCollaborators collaborators_;
    bool initialized_ = false;

    BridgeEventChannel events_;
    RouteHintBoard route_hints_;

    mutable std::mutex auth_mutex_;
    std::optional<std::string> user_id_;

    std::unique_ptr<ConnectionRegistry> registry_;
    std::unique_ptr<BroadcastHub> hub_;
    std::unique_ptr<WebSocketServer> server_;
    std::unique_ptr<TaskQueue> store_worker_;
    std::unique_ptr<TelemetryLoop> loop_;
    std::thread dispatcher_;
};

} // namespace FlightBridge
