///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file telemetry_loop.cpp
 * @brief TelemetryLoop implementation
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "bridge/telemetry_loop.h"
#include "common/errors.h"
#include "logging/logger.h"

#include <exception>
#include <optional>
#include <utility>
#include <vector>

namespace FlightBridge {

TelemetryLoop::TelemetryLoop(std::shared_ptr<TelemetrySource> source,
                             BridgeEventChannel& events,
                             const RouteHintBoard& hints,
                             const AirportLocator* airports,
                             TelemetryLoopOptions options)
    : source_(std::move(source)),
      events_(events),
      hints_(hints),
      options_(options),
      machine_(airports) {}

TelemetryLoop::~TelemetryLoop() {
    Stop();
}

bool TelemetryLoop::Start() {
    if (running_.exchange(true)) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    machine_.Reset();
    unavailable_reported_ = false;

    thread_ = std::thread(&TelemetryLoop::Run, this);
    LOG_INFO("Telemetry loop started ({}, every {} ms)", source_->Describe(), options_.poll_interval.count());
    return true;
}

void TelemetryLoop::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
        LOG_INFO("Telemetry loop stopped after {} tick(s)", ticks_.load());
    }
    running_ = false;
}

bool TelemetryLoop::WaitUntil(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_until(lock, deadline, [this] { return stop_requested_; });
}

void TelemetryLoop::Run() {
    using SteadyClock = std::chrono::steady_clock;

    for (;;) {
        if (!source_->IsConnected() && !TryConnect()) {
            if (!WaitUntil(SteadyClock::now() + options_.retry_interval)) break;
            continue;
        }

        const auto tick_start = SteadyClock::now();
        try {
            Tick();
        } catch (const TelemetrySourceError& ex) {
            HandleDisruption(ex.what());
            if (!WaitUntil(SteadyClock::now() + options_.retry_interval)) break;
            continue;
        } catch (const std::exception& ex) {
            LOG_ERROR("Unexpected error from telemetry source {}: {}", source_->Describe(), ex.what());
            HandleDisruption(ex.what());
            if (!WaitUntil(SteadyClock::now() + options_.retry_interval)) break;
            continue;
        }

        if (!WaitUntil(tick_start + options_.poll_interval)) break;
    }

    if (source_->IsConnected()) {
        source_->Disconnect();
    }
}

bool TelemetryLoop::TryConnect() {
    try {
        source_->Connect();
    } catch (const TelemetrySourceError& ex) {
        ReportUnavailable(ex.what());
        return false;
    } catch (const std::exception& ex) {
        LOG_ERROR("Unexpected error connecting to {}: {}", source_->Describe(), ex.what());
        ReportUnavailable(ex.what());
        return false;
    }

    unavailable_reported_ = false;
    machine_.Reset();
    LOG_INFO("Telemetry source connected: {}", source_->Describe());
    events_.Send(SourceStatus{true, source_->Describe()});
    return true;
}

void TelemetryLoop::ReportUnavailable(const std::string& reason) {
    if (!unavailable_reported_) {
        LOG_WARN("Telemetry source unavailable, retrying every {} ms: {}",
                 options_.retry_interval.count(), reason);
        unavailable_reported_ = true;
    } else {
        LOG_DEBUG("Telemetry source still unavailable: {}", reason);
    }
}

void TelemetryLoop::Tick() {
    std::optional<Snapshot> polled = source_->Poll();
    if (!polled) {
        return;
    }

    auto snapshot = std::make_shared<const Snapshot>(std::move(*polled));
    ++ticks_;

    std::vector<FlightEvent> flight_events = machine_.Process(*snapshot, hints_.Get());

    events_.Send(snapshot);
    for (auto& event : flight_events) {
        events_.Send(std::move(event));
    }
}

void TelemetryLoop::HandleDisruption(const std::string& reason) {
    LOG_WARN("Telemetry source lost: {}", reason);

    source_->Disconnect();
    // An in-progress flight is abandoned, never landed
    machine_.Reset();
    events_.Send(SourceStatus{false, reason});
}

} // namespace FlightBridge
