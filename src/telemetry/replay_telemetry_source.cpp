///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file replay_telemetry_source.cpp
 * @brief ReplayTelemetrySource implementation
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "telemetry/replay_telemetry_source.h"
#include "common/errors.h"
#include "flight/identifiers.h"
#include "logging/logger.h"
#include "telemetry/snapshot_json.h"

#include <utility>

namespace FlightBridge {

ReplayTelemetrySource::ReplayTelemetrySource(std::string path)
    : path_(std::move(path)) {}

std::string ReplayTelemetrySource::Describe() const {
    return "replay:" + path_;
}

void ReplayTelemetrySource::Connect() {
    Disconnect();

    file_.open(path_);
    if (!file_.is_open()) {
        throw TelemetrySourceError("cannot open replay file " + path_);
    }

    connected_ = true;
    lines_read_ = 0;
    connected_at_ = Clock::now();
    time_offset_.reset();
    LOG_INFO("Replaying telemetry from {}", path_);
}

void ReplayTelemetrySource::Disconnect() {
    if (file_.is_open()) {
        file_.close();
    }
    file_.clear();
    connected_ = false;
}

std::optional<Snapshot> ReplayTelemetrySource::Poll() {
    if (!connected_) {
        throw TelemetrySourceError("replay source is not connected");
    }

    std::string line;
    while (std::getline(file_, line)) {
        ++lines_read_;
        if (Trim(line).empty()) {
            continue;
        }

        auto snapshot = ParseSnapshotJSON(line);
        if (!snapshot) {
            LOG_WARN("Skipping malformed replay line {} in {}", lines_read_, path_);
            return std::nullopt;
        }

        if (!time_offset_) {
            time_offset_ = connected_at_ - snapshot->captured_at;
        }
        snapshot->captured_at += *time_offset_;
        return snapshot;
    }

    Disconnect();
    throw TelemetrySourceError("replay of " + path_ + " finished");
}

} // namespace FlightBridge
