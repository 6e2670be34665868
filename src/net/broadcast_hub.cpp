///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file broadcast_hub.cpp
 * @brief BroadcastHub implementation
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "net/broadcast_hub.h"
#include "flight/identifiers.h"
#include "logging/logger.h"
#include "telemetry/snapshot_json.h"

#include <algorithm>
#include <cctype>
#include <exception>
#include <utility>

namespace FlightBridge {

BroadcastHub::BroadcastHub(ConnectionRegistry& registry, std::shared_ptr<CoordinateLookup> coordinates,
                           std::shared_ptr<CoordinateLookup> local)
    : registry_(registry),
      coordinates_(std::move(coordinates)),
      local_(std::move(local)),
      lookup_workers_("airport-lookup", LOOKUP_WORKERS) {}

BroadcastHub::~BroadcastHub() {
    Shutdown();
}

void BroadcastHub::SetRouteListener(RouteListener listener) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    route_listener_ = std::move(listener);
}

void BroadcastHub::SetAuthListener(AuthListener listener) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auth_listener_ = std::move(listener);
}

void BroadcastHub::SetRelaySink(RelaySink sink) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    relay_sink_ = std::move(sink);
}

void BroadcastHub::SetSessionCode(std::optional<std::string> session_code) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    session_code_ = std::move(session_code);
}

std::optional<std::string> BroadcastHub::SessionCode() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return session_code_;
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// Transport callbacks
///////////////////////////////////////////////////////////////////////////////////////////////////

void BroadcastHub::OnOpen(const ConnectionPtr& connection) {
    if (!registry_.Add(connection)) {
        LOG_DEBUG("Rejecting client {}: server is shutting down", connection->Id());
        connection->Close();
        return;
    }
    LOG_INFO("Client connected: {} (total: {})", connection->RemoteAddress(), registry_.Count());

    std::optional<std::string> session_code;
    std::optional<RouteSpec> route;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        session_code = session_code_;
        route = route_;
    }

    if (session_code) {
        if (!registry_.SendTo(connection, BuildDisconnectedJSON(session_code))) {
            return;
        }
    }
    if (route) {
        registry_.SendTo(connection, BuildRouteMessage(*route));
    }
}

void BroadcastHub::OnMessage(const ConnectionPtr& connection, const std::string& text) {
    auto message = ParseInboundMessage(text);
    if (!message) {
        LOG_DEBUG("Ignoring message from client {}: {}", connection->Id(), text);
        return;
    }

    if (std::holds_alternative<PingRequest>(*message)) {
        registry_.SendTo(connection, BuildPongMessage());
    } else if (const auto* update = std::get_if<RouteUpdate>(&*message)) {
        LOG_DEBUG("Route message from client {}: {}", connection->Id(), text);
        HandleRoute(update->route);
    } else if (const auto* request = std::get_if<AirportRequest>(&*message)) {
        HandleAirportRequest(connection, request->icao);
    } else if (const auto* auth = std::get_if<AuthUpdate>(&*message)) {
        // Never log the message body: it carries the token
        LOG_DEBUG("Auth message from client {}", connection->Id());
        HandleAuth(*auth);
    }
}

void BroadcastHub::OnClose(ConnectionId id) {
    if (registry_.Remove(id)) {
        LOG_INFO("Client {} disconnected (total: {})", id, registry_.Count());
    }
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// Message handlers
///////////////////////////////////////////////////////////////////////////////////////////////////

void BroadcastHub::HandleRoute(const RouteSpec& route) {
    const RouteSpec normalized = NormalizeRoute(route);

    RouteListener listener;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        route_ = normalized;
        listener = route_listener_;
    }

    LOG_INFO("Route set: {} -> {}", normalized.origin.value_or("?"), normalized.destination.value_or("?"));

    if (listener) {
        listener(normalized);
    }
    registry_.Broadcast(BuildRouteMessage(normalized));
}

void BroadcastHub::HandleAirportRequest(const ConnectionPtr& connection, const std::string& raw_icao) {
    const std::string icao = NormalizeIdentifier(raw_icao);
    const bool alphanumeric = std::all_of(icao.begin(), icao.end(),
                                          [](unsigned char c) { return std::isalnum(c) != 0; });
    if (icao.size() < 3 || icao.size() > 4 || !alphanumeric) {
        LOG_DEBUG("Ignoring getAirport with invalid identifier '{}'", raw_icao);
        return;
    }

    std::optional<GeoPosition> known;
    if (local_) {
        try {
            known = local_->Lookup(icao);
        } catch (const std::exception& ex) {
            LOG_WARN("Local airport lookup for {} failed: {}", icao, ex.what());
        }
    }

    std::optional<GeoPosition> cached;
    bool start_lookup = false;
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = coordinate_cache_.find(icao);
        if (known) {
            coordinate_cache_[icao] = *known;
            cached = known;
        } else if (it != coordinate_cache_.end()) {
            cached = it->second;
        } else {
            auto& waiting = pending_lookups_[icao];
            start_lookup = waiting.empty();
            waiting.push_back(connection);
        }
    }

    if (cached) {
        registry_.SendTo(connection, BuildAirportCoordsMessage(icao, cached));
        return;
    }
    if (!start_lookup) {
        LOG_DEBUG("Lookup for {} already in flight", icao);
        return;
    }

    if (!coordinates_) {
        CompleteLookup(icao, std::nullopt);
        return;
    }

    if (!lookup_workers_.Post([this, icao] { RunLookup(icao); })) {
        CompleteLookup(icao, std::nullopt);
    }
}

void BroadcastHub::HandleAuth(const AuthUpdate& update) {
    AuthListener listener;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        listener = auth_listener_;
    }

    if (update.user_id) {
        LOG_INFO("User authenticated: {}", *update.user_id);
    } else {
        LOG_INFO("User logged out");
    }

    if (listener) {
        listener(update);
    }
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// Coordinate lookups
///////////////////////////////////////////////////////////////////////////////////////////////////

void BroadcastHub::RunLookup(const std::string& icao) {
    std::optional<GeoPosition> coords;
    try {
        coords = coordinates_->Lookup(icao);
    } catch (const std::exception& ex) {
        LOG_WARN("Airport lookup for {} failed: {}", icao, ex.what());
    }

    if (coords) {
        LOG_DEBUG("Airport {} resolved to {:.4f}, {:.4f}", icao, coords->latitude, coords->longitude);
    } else {
        LOG_INFO("Airport {} not found", icao);
    }
    CompleteLookup(icao, coords);
}

void BroadcastHub::CompleteLookup(const std::string& icao, const std::optional<GeoPosition>& coords) {
    std::vector<ConnectionPtr> waiting;
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        if (coords) {
            coordinate_cache_[icao] = *coords;
        }
        auto pending = pending_lookups_.find(icao);
        if (pending != pending_lookups_.end()) {
            waiting.swap(pending->second);
            pending_lookups_.erase(pending);
        }
    }

    const std::string response = BuildAirportCoordsMessage(icao, coords);
    for (const auto& connection : waiting) {
        registry_.SendTo(connection, response);
    }
}

std::optional<GeoPosition> BroadcastHub::CachedCoordinates(const std::string& icao) const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = coordinate_cache_.find(NormalizeIdentifier(icao));
    if (it == coordinate_cache_.end()) {
        return std::nullopt;
    }
    return it->second;
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// Outbound
///////////////////////////////////////////////////////////////////////////////////////////////////

void BroadcastHub::BroadcastSnapshot(const Snapshot& snapshot) {
    Fanout(BuildSnapshotJSON(snapshot, SessionCode()));
}

void BroadcastHub::BroadcastLanding(const LandingEvent& landing) {
    Fanout(BuildLandingMessage(landing));
}

void BroadcastHub::BroadcastDisconnected() {
    Fanout(BuildDisconnectedJSON(SessionCode()));
}

void BroadcastHub::Fanout(const std::string& payload) {
    registry_.Broadcast(payload);

    RelaySink sink;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        sink = relay_sink_;
    }
    if (!sink) {
        return;
    }
    try {
        sink(payload);
    } catch (const std::exception& ex) {
        LOG_WARN("Relay sink failed: {}", ex.what());
    }
}

std::optional<RouteSpec> BroadcastHub::CurrentRoute() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return route_;
}

void BroadcastHub::Shutdown() {
    lookup_workers_.Stop();
}

} // namespace FlightBridge
