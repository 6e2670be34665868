///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file bridge.cpp
 * @brief Bridge implementation
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "bridge/bridge.h"
#include "http/airport_api_lookup.h"
#include "http/http_client.h"
#include "logging/logger.h"
#include "telemetry/replay_telemetry_source.h"

#include <exception>
#include <utility>
#include <vector>

namespace FlightBridge {

Bridge::~Bridge() {
    Shutdown();
}

bool Bridge::Initialize(const BridgeConfig& config) {
    BridgeCollaborators collaborators;

    auto airports = std::make_shared<AirportDatabase>();
    collaborators.airports = airports;

    auto http = std::make_shared<CurlHttpClient>();

    std::vector<std::shared_ptr<CoordinateLookup>> lookups{airports};
    if (!config.airport_api_url.empty()) {
        lookups.push_back(std::make_shared<AirportApiLookup>(http, config.airport_api_url));
    }
    collaborators.coordinates = std::make_shared<ChainedCoordinateLookup>(std::move(lookups));
    collaborators.local_coordinates = airports;

    if (config.replay_file) {
        collaborators.source = std::make_shared<ReplayTelemetrySource>(*config.replay_file);
    }

    if (config.PersistenceEnabled()) {
        collaborators.store = std::make_shared<RestFlightStore>(http, *config.supabase_url, *config.supabase_key);
        LOG_INFO("Flight persistence enabled");
    } else {
        LOG_INFO("Flight persistence not configured (SUPABASE_URL / SUPABASE_SERVICE_KEY)");
    }

    return Initialize(config, std::move(collaborators));
}

bool Bridge::Initialize(const BridgeConfig& config, BridgeCollaborators collaborators) {
    if (initialized_) {
        LOG_WARN("Initialize() called on a running bridge, shutting down first");
        Shutdown();
    }

    config_ = config;
    collaborators_ = std::move(collaborators);
    events_.Reset();
    route_hints_.Clear();
    {
        std::lock_guard<std::mutex> lock(auth_mutex_);
        user_id_.reset();
    }

    registry_ = std::make_unique<ConnectionRegistry>();
    hub_ = std::make_unique<BroadcastHub>(*registry_, collaborators_.coordinates,
                                          collaborators_.local_coordinates);
    hub_->SetSessionCode(config_.session_code);
    hub_->SetRouteListener([this](const RouteSpec& route) { route_hints_.Set(route); });
    hub_->SetAuthListener([this](const AuthUpdate& update) { OnAuth(update); });
    if (collaborators_.relay) {
        hub_->SetRelaySink(collaborators_.relay);
    }

    WebSocketServerOptions options;
    options.port = config_.ws_port;
    options.max_send_buffer = config_.send_buffer_bytes;

    server_ = std::make_unique<WebSocketServer>(options);
    BroadcastHub* hub = hub_.get();
    server_->SetHandlers(
        [hub](const ConnectionPtr& connection) { hub->OnOpen(connection); },
        [hub](const ConnectionPtr& connection, const std::string& text) { hub->OnMessage(connection, text); },
        [hub](ConnectionId id) { hub->OnClose(id); });

    if (!server_->Start()) {
        LOG_ERROR("Bridge initialization failed: WebSocket server did not start on port {}", config_.ws_port);
        server_.reset();
        hub_.reset();
        registry_.reset();
        return false;
    }

    store_worker_ = std::make_unique<TaskQueue>("flight-store");
    dispatcher_ = std::thread(&Bridge::DispatchLoop, this);

    if (collaborators_.source) {
        TelemetryLoopOptions loop_options;
        loop_options.poll_interval = config_.poll_interval;
        loop_options.retry_interval = config_.retry_interval;
        loop_ = std::make_unique<TelemetryLoop>(collaborators_.source, events_, route_hints_,
                                                collaborators_.airports.get(), loop_options);
        loop_->Start();
    } else {
        LOG_WARN("No telemetry source configured (FLIGHT_BRIDGE_REPLAY_FILE); serving clients only");
    }

    if (config_.session_code) {
        LOG_INFO("Session code: {}", *config_.session_code);
    }

    initialized_ = true;
    LOG_INFO("Bridge initialized, WebSocket on port {}", server_->Port());
    return true;
}

void Bridge::Shutdown() {
    if (!initialized_) {
        return;
    }
    LOG_INFO("Bridge shutting down...");

    // Producer first, so nothing new enters the channel
    if (loop_) {
        loop_->Stop();
        loop_.reset();
    }

    // Dispatcher drains what is already queued
    events_.Close();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }

    registry_->CloseAll();
    server_->Stop();
    server_.reset();

    hub_->Shutdown();
    store_worker_->Stop();
    store_worker_.reset();

    hub_.reset();
    registry_.reset();

    initialized_ = false;
    LOG_INFO("Bridge shut down");
    LOG_FLUSH();
}

std::uint16_t Bridge::Port() const {
    return server_ ? server_->Port() : 0;
}

std::optional<std::string> Bridge::CurrentUserId() const {
    std::lock_guard<std::mutex> lock(auth_mutex_);
    return user_id_;
}

bool Bridge::Publish(BridgeEvent event) {
    return events_.Send(std::move(event));
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// Dispatcher
///////////////////////////////////////////////////////////////////////////////////////////////////

void Bridge::DispatchLoop() {
    while (auto event = events_.Receive()) {
        try {
            Dispatch(*event);
        } catch (const std::exception& ex) {
            LOG_ERROR("Dispatching bridge event failed: {}", ex.what());
        }
    }
    LOG_DEBUG("Dispatcher finished");
}

void Bridge::Dispatch(const BridgeEvent& event) {
    if (const auto* snapshot = std::get_if<SnapshotPtr>(&event)) {
        if (*snapshot) {
            hub_->BroadcastSnapshot(**snapshot);
        }
    } else if (const auto* status = std::get_if<SourceStatus>(&event)) {
        if (!status->connected) {
            hub_->BroadcastDisconnected();
        }
    } else if (const auto* flight_event = std::get_if<FlightEvent>(&event)) {
        HandleFlightEvent(*flight_event);
    }
}

void Bridge::HandleFlightEvent(const FlightEvent& event) {
    if (const auto* landing = std::get_if<LandingEvent>(&event)) {
        hub_->BroadcastLanding(*landing);
    } else if (const auto* record = std::get_if<FlightRecord>(&event)) {
        PersistRecord(*record);
    }
}

void Bridge::PersistRecord(FlightRecord record) {
    {
        std::lock_guard<std::mutex> lock(auth_mutex_);
        record.user_id = user_id_;
    }
    record.session_code = config_.session_code;

    std::shared_ptr<FlightStore> store = collaborators_.store;
    if (!store) {
        LOG_INFO("Flight completed ({} -> {}, score {}), not saved: persistence not configured",
                 record.origin.value_or("?"), record.destination.value_or("?"), record.score);
        return;
    }

    const bool posted = store_worker_->Post([store, record] {
        if (!store->Save(record)) {
            LOG_WARN("Flight {} -> {} was not saved", record.origin.value_or("?"), record.destination.value_or("?"));
        }
    });
    if (!posted) {
        LOG_WARN("Flight store is shutting down, record dropped");
    }
}

void Bridge::OnAuth(const AuthUpdate& update) {
    {
        std::lock_guard<std::mutex> lock(auth_mutex_);
        user_id_ = update.user_id;
    }
    if (collaborators_.store) {
        collaborators_.store->SetUserToken(update.token);
    }
}

} // namespace FlightBridge
