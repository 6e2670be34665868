///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file flight_state_machine.h
 * @brief Takeoff/landing detection and flight validity rules
 *
 * The flight phase is a single variant value:
 *
 *   Idle ──liftoff 40..250 kt──────────────▶ AirborneValidated
 *     │                                          ▲      │
 *     └──liftoff < 40 kt──▶ AirborneUnvalidated ─┘      │ touchdown
 *                           (GS >= 40 kt)               ▼
 *   Idle ◀──────────────────────────────────────── accepted / rejected
 *
 * A liftoff above 250 kt is an in-air spawn and leaves the phase at Idle.
 *
 * Step() is a pure transition: it consumes the previous MachineState by value
 * and returns the next one together with the events of this tick. The
 * FlightStateMachine wrapper owns one MachineState for the ingestion thread.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "flight/approach_recorder.h"
#include "flight/flight_events.h"
#include "flight/geo.h"
#include "telemetry/snapshot.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace FlightBridge {

class AirportLocator;

///////////////////////////////////////////////////////////////////////////////////////////////////
// Validity thresholds
///////////////////////////////////////////////////////////////////////////////////////////////////

constexpr double TAKEOFF_MIN_SPEED_KT = 40.0;
constexpr double TAKEOFF_MAX_SPEED_KT = 250.0;    ///< above: in-air spawn

constexpr int LANDING_MIN_FLIGHT_S = 180;
constexpr double LANDING_MIN_ALTITUDE_AGL_FT = 100.0;
constexpr double LANDING_MIN_GFORCE = 0.5;
constexpr double LANDING_MIN_DISTANCE_NM = 5.0;
constexpr int LANDING_DEBOUNCE_S = 5;

///////////////////////////////////////////////////////////////////////////////////////////////////
// State
///////////////////////////////////////////////////////////////////////////////////////////////////

/// Destination/origin fallback supplied by a client
struct RouteHint {
    std::optional<std::string> origin;
    std::optional<std::string> destination;
};

/// Per-flight accumulator; exists only inside AirborneValidated
struct FlightState {
    TimePoint takeoff_time{};
    std::optional<std::string> origin;
    std::optional<std::string> destination;
    std::optional<std::string> aircraft_title;
    double max_altitude_agl_ft = 0.0;
    double max_altitude_msl_ft = 0.0;
    double max_g = 0.0;
    DistanceAccumulator distance;
};

struct Idle {};

struct AirborneUnvalidated {
    TimePoint takeoff_time{};
    double liftoff_speed_kt = 0.0;
    double max_altitude_agl_ft = 0.0;
    double max_altitude_msl_ft = 0.0;
    double max_g = 0.0;
    std::optional<std::string> origin_candidate;    ///< resolved at liftoff, used on promotion
};

struct AirborneValidated {
    FlightState flight;
};

using FlightPhase = std::variant<Idle, AirborneUnvalidated, AirborneValidated>;

/// Everything the machine remembers between ticks
struct MachineState {
    FlightPhase phase = Idle{};
    bool baseline_established = false;
    bool was_on_ground = true;
    std::optional<Snapshot> previous;
    std::optional<TimePoint> last_landing_time;
    ApproachRecorder approach;
};

/// Read-only inputs of a tick besides the snapshot
struct StepContext {
    RouteHint route_hint;
    const AirportLocator* airports = nullptr;   ///< may be null: no nearest-airport fallback
};

struct StepOutcome {
    MachineState state;
    std::vector<FlightEvent> events;
};

/**
 * @brief Advance the machine by one snapshot.
 *
 * The first snapshot after construction or Reset only establishes the
 * on-ground baseline.
 */
StepOutcome Step(MachineState state, const Snapshot& snapshot, const StepContext& context);

///////////////////////////////////////////////////////////////////////////////////////////////////
// FlightStateMachine
///////////////////////////////////////////////////////////////////////////////////////////////////

/**
 * @brief Owner of the machine state for the single ingestion thread.
 *
 * Not thread-safe; ticks must be strictly ordered.
 */
class FlightStateMachine {
public:
    explicit FlightStateMachine(const AirportLocator* airports = nullptr);

    /// Feed one snapshot; logs and returns the emitted events
    std::vector<FlightEvent> Process(const Snapshot& snapshot, const RouteHint& route_hint = RouteHint{});

    /// Abandon any flight without emitting events; the next snapshot is a new baseline
    void Reset();

    const MachineState& State() const { return state_; }

    bool IsIdle() const { return std::holds_alternative<Idle>(state_.phase); }
    bool IsAirborneUnvalidated() const { return std::holds_alternative<AirborneUnvalidated>(state_.phase); }
    bool IsAirborneValidated() const { return std::holds_alternative<AirborneValidated>(state_.phase); }

    /// Current flight accumulator, or nullptr when no validated flight exists
    const FlightState* CurrentFlight() const;

private:
    const AirportLocator* airports_;
    MachineState state_;
};

} // namespace FlightBridge
