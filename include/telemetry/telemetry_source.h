///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file telemetry_source.h
 * @brief Where snapshots come from
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "telemetry/snapshot.h"

#include <optional>
#include <string>

namespace FlightBridge {

/**
 * @brief A simulator connection polled once per tick.
 *
 * Connect() and Poll() throw TelemetrySourceError when the simulator is not
 * reachable or goes away. After a failure the caller disconnects and retries
 * Connect() later.
 */
class TelemetrySource {
public:
    virtual ~TelemetrySource() = default;

    virtual void Connect() = 0;
    virtual void Disconnect() = 0;
    virtual bool IsConnected() const = 0;

    /// Latest sample, or nullopt when nothing new is available this tick
    virtual std::optional<Snapshot> Poll() = 0;

    /// Human-readable name for logs
    virtual std::string Describe() const = 0;
};

} // namespace FlightBridge
