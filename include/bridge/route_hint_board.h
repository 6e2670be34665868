///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file route_hint_board.h
 * @brief Latest client route, handed from the transport thread to the telemetry loop
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "flight/flight_state_machine.h"
#include "net/protocol.h"

#include <mutex>

namespace FlightBridge {

class RouteHintBoard {
public:
    void Set(const RouteSpec& route) {
        std::lock_guard<std::mutex> lock(mutex_);
        hint_.origin = route.origin;
        hint_.destination = route.destination;
    }

    RouteHint Get() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return hint_;
    }

    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        hint_ = RouteHint{};
    }

private:
    mutable std::mutex mutex_;
    RouteHint hint_;
};

} // namespace FlightBridge
