///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file replay_telemetry_source.h
 * @brief Telemetry source that plays back a recorded JSON-lines file
 *
 * Each non-empty line is one snapshot in the outbound snapshot format, with
 * an optional "timestamp" in Unix milliseconds. Recorded timestamps are
 * shifted so the first line maps to the moment of Connect(); their spacing
 * is preserved. Reaching the end of the file behaves like the simulator
 * exiting: Poll() throws and the next Connect() starts over.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "telemetry/telemetry_source.h"

#include <cstddef>
#include <fstream>
#include <optional>
#include <string>

namespace FlightBridge {

class ReplayTelemetrySource : public TelemetrySource {
public:
    explicit ReplayTelemetrySource(std::string path);

    void Connect() override;
    void Disconnect() override;
    bool IsConnected() const override { return connected_; }
    std::optional<Snapshot> Poll() override;
    std::string Describe() const override;

    /// Lines consumed since the last Connect()
    size_t LinesRead() const { return lines_read_; }

private:
    std::string path_;
    std::ifstream file_;
    bool connected_ = false;
    size_t lines_read_ = 0;

    TimePoint connected_at_{};
    std::optional<Clock::duration> time_offset_;
};

} // namespace FlightBridge
