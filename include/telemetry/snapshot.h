///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file snapshot.h
 * @brief One telemetry sample as produced by a TelemetrySource
 *
 * A Snapshot is built once per sampling tick and never modified afterwards.
 * Components share it as std::shared_ptr<const Snapshot>.
 *
 * Units:
 * - altitudes in feet (altitude_ft is MSL, altitude_agl_ft above ground)
 * - ground speed in knots, vertical speed in feet per minute
 * - angles in degrees, accelerations in G
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace FlightBridge {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

struct GeoPosition {
    double latitude = 0.0;
    double longitude = 0.0;
};

struct Snapshot {
    TimePoint captured_at{};

    // === POSITION ===
    double latitude = 0.0;
    double longitude = 0.0;
    double altitude_ft = 0.0;
    double altitude_agl_ft = 0.0;

    // === KINEMATICS ===
    double ground_speed_kt = 0.0;
    double vertical_speed_fpm = 0.0;
    double g_force = 1.0;
    double heading_true = 0.0;
    double heading_magnetic = 0.0;
    double lateral_g = 0.0;
    double longitudinal_g = 0.0;

    // === ATTITUDE ===
    double pitch_deg = 0.0;
    double bank_deg = 0.0;
    double angle_of_attack_deg = 0.0;
    double sideslip_deg = 0.0;

    // === DISCRETE STATE ===
    bool on_ground = true;
    bool gear_down = true;
    int flaps_position = 0;
    bool engines_running = false;
    bool parking_brake = false;

    bool light_nav = false;
    bool light_beacon = false;
    bool light_landing = false;
    bool light_taxi = false;
    bool light_strobe = false;
    bool light_recognition = false;
    bool light_wing = false;
    bool light_logo = false;
    bool light_panel = false;

    bool battery1 = false;
    bool battery2 = false;
    bool external_power = false;
    bool avionics_master = false;

    bool apu_master = false;
    bool apu_running = false;
    double apu_pct_rpm = 0.0;

    bool engine_master1 = false;
    bool engine_master2 = false;
    double engine1_n1 = 0.0;
    double engine1_n2 = 0.0;
    double engine2_n1 = 0.0;
    double engine2_n2 = 0.0;
    double throttle1 = 0.0;
    double throttle2 = 0.0;

    bool spoilers_armed = false;
    double spoilers_position = 0.0;
    bool autopilot_master = false;
    bool autothrottle_armed = false;

    bool seatbelt_sign = false;
    bool no_smoking_sign = false;
    int transponder_state = 0;

    bool anti_ice_eng1 = false;
    bool anti_ice_eng2 = false;
    bool anti_ice_structural = false;
    bool pitot_heat = false;

    bool fuel_pump1 = false;
    bool fuel_pump2 = false;
    bool hydraulic_pump1 = false;
    bool hydraulic_pump2 = false;

    // === GPS FLIGHT PLAN ===
    bool gps_is_active_flight_plan = false;
    int gps_flight_plan_wp_count = 0;
    int gps_flight_plan_wp_index = 0;
    double gps_flight_plan_total_distance_nm = 0.0;
    double gps_wp_distance_nm = 0.0;
    double gps_wp_ete_s = 0.0;
    double gps_ete_s = 0.0;
    double gps_eta_s = 0.0;

    // === SIMULATION ===
    double sim_rate = 1.0;
    bool paused = false;

    // === IDENTIFIERS ===
    std::optional<std::string> aircraft_title;
    std::optional<std::string> atc_id;
    std::optional<std::string> atc_airline;
    std::optional<std::string> atc_flight_number;
    std::optional<std::string> gps_wp_next_id;
    std::optional<std::string> gps_wp_prev_id;
    std::optional<std::string> gps_approach_airport_id;

    GeoPosition Position() const { return GeoPosition{latitude, longitude}; }
};

using SnapshotPtr = std::shared_ptr<const Snapshot>;

} // namespace FlightBridge
