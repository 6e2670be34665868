///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file broadcast_hub.h
 * @brief Routes client messages and fans telemetry out to every connection
 *
 * The hub owns the shared client-facing state:
 * - the current route (last write wins)
 * - the airport coordinate cache (process lifetime)
 * - the session code announced to late joiners
 *
 * getAirport is answered inline from the local table when it knows the
 * identifier. Other lookups run on the hub's worker pool, so one slow backend
 * call holds up only the clients waiting on that identifier. Concurrent
 * requests for the same identifier wait on a single lookup.
 *
 * Thread safety: every public method may be called from any thread.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "flight/coordinate_lookup.h"
#include "flight/flight_events.h"
#include "net/client_connection.h"
#include "net/connection_registry.h"
#include "net/protocol.h"
#include "telemetry/snapshot.h"
#include "util/task_queue.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace FlightBridge {

class BroadcastHub {
public:
    using RouteListener = std::function<void(const RouteSpec&)>;
    using AuthListener = std::function<void(const AuthUpdate&)>;
    /// Receives every broadcast payload for forwarding to a remote relay channel
    using RelaySink = std::function<void(const std::string&)>;

    static constexpr size_t LOOKUP_WORKERS = 4;

    /**
     * @param registry     connection set shared with the transport; must outlive the hub
     * @param coordinates  getAirport backend, may block; null answers every miss with not_found
     * @param local        non-blocking lookup consulted on the caller's thread first
     */
    BroadcastHub(ConnectionRegistry& registry, std::shared_ptr<CoordinateLookup> coordinates,
                 std::shared_ptr<CoordinateLookup> local = nullptr);
    ~BroadcastHub();

    BroadcastHub(const BroadcastHub&) = delete;
    BroadcastHub& operator=(const BroadcastHub&) = delete;

    void SetRouteListener(RouteListener listener);
    void SetAuthListener(AuthListener listener);
    void SetRelaySink(RelaySink sink);

    void SetSessionCode(std::optional<std::string> session_code);
    std::optional<std::string> SessionCode() const;

    // === TRANSPORT CALLBACKS ===

    /// Register and send the welcome payload (placeholder, current route) to this connection only
    void OnOpen(const ConnectionPtr& connection);

    /// Dispatch one text message; unknown or malformed messages are ignored
    void OnMessage(const ConnectionPtr& connection, const std::string& text);

    void OnClose(ConnectionId id);

    // === OUTBOUND ===

    void BroadcastSnapshot(const Snapshot& snapshot);
    void BroadcastLanding(const LandingEvent& landing);

    /// Tell viewers the simulator is gone
    void BroadcastDisconnected();

    // === STATE ===

    std::optional<RouteSpec> CurrentRoute() const;
    std::optional<GeoPosition> CachedCoordinates(const std::string& icao) const;

    /// Finish queued lookups and stop the workers
    void Shutdown();

private:
    void HandleRoute(const RouteSpec& route);
    void HandleAirportRequest(const ConnectionPtr& connection, const std::string& raw_icao);
    void HandleAuth(const AuthUpdate& update);

    void RunLookup(const std::string& icao);
    void CompleteLookup(const std::string& icao, const std::optional<GeoPosition>& coords);

    void Fanout(const std::string& payload);

    ConnectionRegistry& registry_;
    std::shared_ptr<CoordinateLookup> coordinates_;
    std::shared_ptr<CoordinateLookup> local_;

    mutable std::mutex state_mutex_;
    std::optional<RouteSpec> route_;
    std::optional<std::string> session_code_;
    RouteListener route_listener_;
    AuthListener auth_listener_;
    RelaySink relay_sink_;

    mutable std::mutex cache_mutex_;
    std::unordered_map<std::string, GeoPosition> coordinate_cache_;
    std::unordered_map<std::string, std::vector<ConnectionPtr>> pending_lookups_;

    // Declared last: joined before the state it touches is destroyed
    TaskQueue lookup_workers_;
};

} // namespace FlightBridge
