///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file flight_state_machine.cpp
 * @brief Flight phase transitions and landing validation
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "flight/flight_state_machine.h"
#include "flight/airport_database.h"
#include "flight/identifiers.h"
#include "logging/logger.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace FlightBridge {

namespace {

double SecondsBetween(TimePoint from, TimePoint to) {
    return std::chrono::duration<double>(to - from).count();
}

std::optional<std::string> NearestAirport(const Snapshot& snapshot, const StepContext& context) {
    if (context.airports == nullptr) {
        return std::nullopt;
    }
    return context.airports->FindNearest(snapshot.Position(), NEAREST_AIRPORT_RADIUS_NM);
}

/// GPS previous waypoint, then route hint, then nearest airport
std::optional<std::string> ResolveOrigin(const Snapshot& snapshot, const StepContext& context) {
    if (auto gps = ParseIcao(snapshot.gps_wp_prev_id)) {
        return gps;
    }
    if (auto hint = NormalizeOptional(context.route_hint.origin)) {
        return hint;
    }
    return NearestAirport(snapshot, context);
}

/// GPS approach airport, then route hint (current or captured in flight), then nearest airport
std::optional<std::string> ResolveDestination(const Snapshot& snapshot, const FlightState& flight,
                                              const StepContext& context) {
    if (auto gps = ParseIcao(snapshot.gps_approach_airport_id)) {
        return gps;
    }
    if (auto hint = NormalizeOptional(context.route_hint.destination)) {
        return hint;
    }
    if (flight.destination) {
        return flight.destination;
    }
    return NearestAirport(snapshot, context);
}

std::optional<std::string> AircraftTitle(const Snapshot& snapshot) {
    if (snapshot.aircraft_title && IsValidString(*snapshot.aircraft_title)) {
        return snapshot.aircraft_title;
    }
    return std::nullopt;
}

void FillFromRouteHint(FlightState& flight, const StepContext& context) {
    if (!flight.origin) {
        flight.origin = NormalizeOptional(context.route_hint.origin);
    }
    if (!flight.destination) {
        flight.destination = NormalizeOptional(context.route_hint.destination);
    }
}

FlightState StartFlight(const Snapshot& snapshot, TimePoint takeoff_time, std::optional<std::string> origin) {
    FlightState flight;
    flight.takeoff_time = takeoff_time;
    flight.origin = std::move(origin);
    flight.aircraft_title = AircraftTitle(snapshot);
    flight.max_altitude_agl_ft = 0.0;
    flight.max_altitude_msl_ft = snapshot.altitude_ft;
    flight.max_g = snapshot.g_force;
    flight.distance = DistanceAccumulator(snapshot.Position());
    return flight;
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// Transitions
///////////////////////////////////////////////////////////////////////////////////////////////////

void OnLiftoff(MachineState& state, const Snapshot& snapshot, const StepContext& context,
               std::vector<FlightEvent>& events) {
    const double speed = snapshot.ground_speed_kt;
    state.approach.Clear();

    if (speed > TAKEOFF_MAX_SPEED_KT) {
        state.phase = Idle{};

        std::ostringstream detail;
        detail << std::fixed << std::setprecision(0)
               << "liftoff at " << speed << " kt (> " << TAKEOFF_MAX_SPEED_KT << " kt), in-air spawn";
        events.push_back(FlightRejected{RejectionStage::Takeoff, {RejectionReason::InAirSpawn}, detail.str()});
        return;
    }

    auto origin = ResolveOrigin(snapshot, context);

    if (speed >= TAKEOFF_MIN_SPEED_KT) {
        AirborneValidated validated{StartFlight(snapshot, snapshot.captured_at, origin)};
        FillFromRouteHint(validated.flight, context);
        state.phase = std::move(validated);
        events.push_back(TakeoffDetected{snapshot.captured_at, speed, true, origin});
        return;
    }

    AirborneUnvalidated pending;
    pending.takeoff_time = snapshot.captured_at;
    pending.liftoff_speed_kt = speed;
    pending.max_altitude_agl_ft = 0.0;
    pending.max_altitude_msl_ft = snapshot.altitude_ft;
    pending.max_g = snapshot.g_force;
    pending.origin_candidate = origin;
    state.phase = pending;
    events.push_back(TakeoffDetected{snapshot.captured_at, speed, false, origin});
}

void OnAirborne(MachineState& state, const Snapshot& snapshot, const StepContext& context,
                std::vector<FlightEvent>& events) {
    if (auto* pending = std::get_if<AirborneUnvalidated>(&state.phase)) {
        pending->max_altitude_agl_ft = std::max(pending->max_altitude_agl_ft, snapshot.altitude_agl_ft);
        pending->max_altitude_msl_ft = std::max(pending->max_altitude_msl_ft, snapshot.altitude_ft);
        pending->max_g = std::max(pending->max_g, snapshot.g_force);

        if (snapshot.ground_speed_kt < TAKEOFF_MIN_SPEED_KT) {
            return;
        }

        auto origin = pending->origin_candidate ? pending->origin_candidate : ResolveOrigin(snapshot, context);

        FlightState flight = StartFlight(snapshot, pending->takeoff_time, origin);
        flight.max_altitude_agl_ft = pending->max_altitude_agl_ft;
        flight.max_altitude_msl_ft = pending->max_altitude_msl_ft;
        flight.max_g = pending->max_g;

        state.phase = AirborneValidated{std::move(flight)};
        events.push_back(FlightValidated{snapshot.captured_at, snapshot.ground_speed_kt, origin});
        // fall through: the promotion tick is already a validated tick
    }

    auto* validated = std::get_if<AirborneValidated>(&state.phase);
    if (validated == nullptr) {
        return;
    }

    FlightState& flight = validated->flight;
    flight.max_altitude_agl_ft = std::max(flight.max_altitude_agl_ft, snapshot.altitude_agl_ft);
    flight.max_altitude_msl_ft = std::max(flight.max_altitude_msl_ft, snapshot.altitude_ft);
    flight.max_g = std::max(flight.max_g, snapshot.g_force);
    flight.distance.Advance(snapshot.Position());
    if (!flight.aircraft_title) {
        flight.aircraft_title = AircraftTitle(snapshot);
    }
    FillFromRouteHint(flight, context);

    state.approach.Record(snapshot);
}

std::string DescribeLandingRejection(double elapsed_s, double max_agl, double max_g, double distance_nm,
                                     const std::vector<RejectionReason>& reasons) {
    std::ostringstream detail;
    detail << std::fixed;
    bool first = true;
    auto separator = [&]() -> std::ostringstream& {
        if (!first) detail << ", ";
        first = false;
        return detail;
    };

    for (auto reason : reasons) {
        switch (reason) {
            case RejectionReason::NotValidated:
                separator() << "takeoff speed never reached";
                break;
            case RejectionReason::DurationTooShort:
                separator() << std::setprecision(0) << "too short (" << elapsed_s << "s < " << LANDING_MIN_FLIGHT_S << "s)";
                break;
            case RejectionReason::AltitudeTooLow:
                separator() << std::setprecision(0) << "too low (" << max_agl << "ft < " << LANDING_MIN_ALTITUDE_AGL_FT << "ft)";
                break;
            case RejectionReason::GForceTooLow:
                separator() << std::setprecision(2) << "G-force unrealistic (" << max_g << " < " << LANDING_MIN_GFORCE << ")";
                break;
            case RejectionReason::DistanceTooShort:
                separator() << std::setprecision(1) << "too short distance (" << distance_nm << "NM < " << LANDING_MIN_DISTANCE_NM << "NM)";
                break;
            case RejectionReason::Bounce:
                separator() << "bounce within " << LANDING_DEBOUNCE_S << "s of previous landing";
                break;
            default:
                separator() << ToString(reason);
                break;
        }
    }
    return detail.str();
}

void OnTouchdown(MachineState& state, const Snapshot& snapshot, const StepContext& context,
                 std::vector<FlightEvent>& events) {
    if (std::holds_alternative<Idle>(state.phase)) {
        LOG_DEBUG("Touchdown without a tracked flight, ignoring");
        state.approach.Clear();
        return;
    }

    TimePoint takeoff_time{};
    double max_agl = 0.0;
    double max_g = 0.0;
    double distance_nm = 0.0;
    std::vector<RejectionReason> reasons;

    if (const auto* pending = std::get_if<AirborneUnvalidated>(&state.phase)) {
        reasons.push_back(RejectionReason::NotValidated);
        takeoff_time = pending->takeoff_time;
        max_agl = pending->max_altitude_agl_ft;
        max_g = pending->max_g;
    } else {
        const FlightState& flight = std::get<AirborneValidated>(state.phase).flight;
        takeoff_time = flight.takeoff_time;
        max_agl = flight.max_altitude_agl_ft;
        max_g = flight.max_g;
        distance_nm = flight.distance.TotalNm();
    }

    const double elapsed_s = SecondsBetween(takeoff_time, snapshot.captured_at);
    if (elapsed_s < LANDING_MIN_FLIGHT_S) reasons.push_back(RejectionReason::DurationTooShort);
    if (max_agl < LANDING_MIN_ALTITUDE_AGL_FT) reasons.push_back(RejectionReason::AltitudeTooLow);
    if (max_g < LANDING_MIN_GFORCE) reasons.push_back(RejectionReason::GForceTooLow);
    if (distance_nm < LANDING_MIN_DISTANCE_NM) reasons.push_back(RejectionReason::DistanceTooShort);
    if (state.last_landing_time &&
        SecondsBetween(*state.last_landing_time, snapshot.captured_at) < LANDING_DEBOUNCE_S) {
        reasons.push_back(RejectionReason::Bounce);
    }

    if (!reasons.empty()) {
        events.push_back(FlightRejected{RejectionStage::Landing, reasons,
                                        DescribeLandingRejection(elapsed_s, max_agl, max_g, distance_nm, reasons)});
        state.approach.Clear();
        state.phase = Idle{};
        return;
    }

    FlightState flight = std::move(std::get<AirborneValidated>(state.phase).flight);
    state.phase = Idle{};

    // The touchdown tick already shows the aircraft on the gear
    const Snapshot& before = state.previous ? *state.previous : snapshot;

    auto airport = ResolveDestination(snapshot, flight, context);
    if (airport) {
        flight.destination = airport;
    }

    LandingEvent landing;
    landing.timestamp = snapshot.captured_at;
    landing.vertical_speed_fpm = before.vertical_speed_fpm;
    landing.g_force = before.g_force;
    landing.ground_speed_kt = before.ground_speed_kt;
    landing.rating = RateLanding(before.vertical_speed_fpm);
    landing.aircraft_title = flight.aircraft_title ? flight.aircraft_title : AircraftTitle(snapshot);
    landing.airport = airport;
    landing.pitch_deg = before.pitch_deg;
    landing.bank_deg = before.bank_deg;
    landing.angle_of_attack_deg = before.angle_of_attack_deg;
    landing.sideslip_deg = before.sideslip_deg;
    landing.heading_magnetic = before.heading_magnetic;
    landing.lateral_g = before.lateral_g;
    landing.longitudinal_g = before.longitudinal_g;
    landing.approach = state.approach.Drain(snapshot.captured_at, snapshot.Position());
    landing.summary.origin = flight.origin;
    landing.summary.destination = flight.destination;
    landing.summary.duration_seconds = static_cast<int>(elapsed_s);
    landing.summary.distance_nm = std::round(distance_nm * 10.0) / 10.0;

    const int rating_score = landing.rating.score;
    const double landing_vs = landing.vertical_speed_fpm;
    const double landing_g = landing.g_force;

    events.push_back(std::move(landing));
    state.last_landing_time = snapshot.captured_at;

    CompletedFlight completed;
    completed.origin = flight.origin;
    completed.destination = flight.destination;
    completed.aircraft_type = flight.aircraft_title;
    completed.departure_time = flight.takeoff_time;
    completed.arrival_time = snapshot.captured_at;
    completed.distance_nm = distance_nm;
    completed.max_altitude_ft = flight.max_altitude_msl_ft;
    completed.landing_rating = rating_score;
    completed.landing_vs = landing_vs;
    completed.landing_gforce = landing_g;

    auto record_reasons = CheckRecordRequirements(completed);
    if (record_reasons.empty()) {
        if (auto record = MaterializeFlightRecord(completed)) {
            events.push_back(std::move(*record));
        }
    } else {
        events.push_back(FlightRejected{RejectionStage::Record, record_reasons,
                                        "flight not suitable for the logbook: " + JoinReasons(record_reasons)});
    }
}

} // namespace

///////////////////////////////////////////////////////////////////////////////////////////////////
// Step
///////////////////////////////////////////////////////////////////////////////////////////////////

StepOutcome Step(MachineState state, const Snapshot& snapshot, const StepContext& context) {
    std::vector<FlightEvent> events;

    if (!state.baseline_established) {
        state.baseline_established = true;
        state.was_on_ground = snapshot.on_ground;
        state.previous = snapshot;
        return StepOutcome{std::move(state), std::move(events)};
    }

    const bool on_ground = snapshot.on_ground;

    if (state.was_on_ground && !on_ground) {
        OnLiftoff(state, snapshot, context, events);
    } else if (!state.was_on_ground && on_ground) {
        OnTouchdown(state, snapshot, context, events);
    } else if (!on_ground) {
        OnAirborne(state, snapshot, context, events);
    }

    state.was_on_ground = on_ground;
    state.previous = snapshot;
    return StepOutcome{std::move(state), std::move(events)};
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// FlightStateMachine
///////////////////////////////////////////////////////////////////////////////////////////////////

FlightStateMachine::FlightStateMachine(const AirportLocator* airports)
    : airports_(airports) {}

std::vector<FlightEvent> FlightStateMachine::Process(const Snapshot& snapshot, const RouteHint& route_hint) {
    const bool baseline = !state_.baseline_established;

    StepContext context;
    context.route_hint = route_hint;
    context.airports = airports_;

    StepOutcome outcome = Step(std::move(state_), snapshot, context);
    state_ = std::move(outcome.state);

    if (baseline) {
        LOG_DEBUG("Baseline established: {}", snapshot.on_ground ? "on ground" : "airborne");
    }

    for (const auto& event : outcome.events) {
        if (const auto* takeoff = std::get_if<TakeoffDetected>(&event)) {
            if (takeoff->validated) {
                LOG_INFO("Takeoff detected at {:.0f} kt from {}", takeoff->liftoff_speed_kt,
                         takeoff->origin.value_or("unknown"));
            } else {
                LOG_INFO("Possible mission start at {:.0f} kt, waiting for takeoff speed", takeoff->liftoff_speed_kt);
            }
        } else if (const auto* validated = std::get_if<FlightValidated>(&event)) {
            LOG_INFO("Flight validated at {:.0f} kt from {}", validated->ground_speed_kt,
                     validated->origin.value_or("unknown"));
        } else if (const auto* landing = std::get_if<LandingEvent>(&event)) {
            LOG_INFO("Landing at {}: {:.0f} fpm, {:.2f} G, rating {} ({})", landing->airport.value_or("unknown"),
                     landing->vertical_speed_fpm, landing->g_force, landing->rating.name, landing->rating.score);
        } else if (const auto* record = std::get_if<FlightRecord>(&event)) {
            LOG_INFO("Flight completed: {} -> {}, {:.1f} NM, {} min, score {}", record->origin.value_or("?"),
                     record->destination.value_or("?"), record->distance_nm,
                     record->flight_duration_seconds / 60, record->score);
        } else if (const auto* rejected = std::get_if<FlightRejected>(&event)) {
            LOG_INFO("{} rejected: {}", ToString(rejected->stage), rejected->detail);
        }
    }

    return std::move(outcome.events);
}

void FlightStateMachine::Reset() {
    state_ = MachineState{};
    LOG_DEBUG("Flight state machine reset");
}

const FlightState* FlightStateMachine::CurrentFlight() const {
    if (const auto* validated = std::get_if<AirborneValidated>(&state_.phase)) {
        return &validated->flight;
    }
    return nullptr;
}

} // namespace FlightBridge
