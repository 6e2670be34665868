///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file snapshot_json.cpp
 * @brief Snapshot JSON builder and parser
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "telemetry/snapshot_json.h"
#include "util/time_format.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <sstream>

namespace FlightBridge {

///////////////////////////////////////////////////////////////////////////////////////////////////
// FIELD LISTS - JSON key, Snapshot member
///////////////////////////////////////////////////////////////////////////////////////////////////

#define SNAPSHOT_NUMBER_FIELDS(F) \
    F("altitude",                   altitude_ft) \
    F("altitudeAgl",                altitude_agl_ft) \
    F("groundSpeed",                ground_speed_kt) \
    F("heading",                    heading_true) \
    F("headingMagnetic",            heading_magnetic) \
    F("latitude",                   latitude) \
    F("longitude",                  longitude) \
    F("verticalSpeed",              vertical_speed_fpm) \
    F("gForce",                     g_force) \
    F("lateralG",                   lateral_g) \
    F("longitudinalG",              longitudinal_g) \
    F("pitch",                      pitch_deg) \
    F("bank",                       bank_deg) \
    F("angleOfAttack",              angle_of_attack_deg) \
    F("sideslip",                   sideslip_deg) \
    F("apuPctRpm",                  apu_pct_rpm) \
    F("engine1N1",                  engine1_n1) \
    F("engine1N2",                  engine1_n2) \
    F("engine2N1",                  engine2_n1) \
    F("engine2N2",                  engine2_n2) \
    F("throttle1",                  throttle1) \
    F("throttle2",                  throttle2) \
    F("spoilersPosition",           spoilers_position) \
    F("gpsFlightPlanTotalDistance", gps_flight_plan_total_distance_nm) \
    F("gpsWpDistance",              gps_wp_distance_nm) \
    F("gpsWpEte",                   gps_wp_ete_s) \
    F("gpsEte",                     gps_ete_s) \
    F("gpsEta",                     gps_eta_s)

#define SNAPSHOT_INT_FIELDS(F) \
    F("flapsPosition",              flaps_position) \
    F("transponderState",           transponder_state) \
    F("gpsFlightPlanWpCount",       gps_flight_plan_wp_count) \
    F("gpsFlightPlanWpIndex",       gps_flight_plan_wp_index)

#define SNAPSHOT_BOOL_FIELDS(F) \
    F("onGround",                   on_ground) \
    F("enginesRunning",             engines_running) \
    F("gearDown",                   gear_down) \
    F("parkingBrake",               parking_brake) \
    F("lightNav",                   light_nav) \
    F("lightBeacon",                light_beacon) \
    F("lightLanding",               light_landing) \
    F("lightTaxi",                  light_taxi) \
    F("lightStrobe",                light_strobe) \
    F("lightRecognition",           light_recognition) \
    F("lightWing",                  light_wing) \
    F("lightLogo",                  light_logo) \
    F("lightPanel",                 light_panel) \
    F("battery1",                   battery1) \
    F("battery2",                   battery2) \
    F("externalPower",              external_power) \
    F("avionicsMaster",             avionics_master) \
    F("apuMaster",                  apu_master) \
    F("apuRunning",                 apu_running) \
    F("engineMaster1",              engine_master1) \
    F("engineMaster2",              engine_master2) \
    F("spoilersArmed",              spoilers_armed) \
    F("autopilotMaster",            autopilot_master) \
    F("autothrottleArmed",          autothrottle_armed) \
    F("seatbeltSign",               seatbelt_sign) \
    F("noSmokingSign",              no_smoking_sign) \
    F("antiIceEng1",                anti_ice_eng1) \
    F("antiIceEng2",                anti_ice_eng2) \
    F("antiIceStructural",          anti_ice_structural) \
    F("pitotHeat",                  pitot_heat) \
    F("fuelPump1",                  fuel_pump1) \
    F("fuelPump2",                  fuel_pump2) \
    F("hydraulicPump1",             hydraulic_pump1) \
    F("hydraulicPump2",             hydraulic_pump2) \
    F("gpsIsActiveFlightPlan",      gps_is_active_flight_plan)

#define SNAPSHOT_STRING_FIELDS(F) \
    F("aircraftTitle",              aircraft_title) \
    F("atcId",                      atc_id) \
    F("atcAirline",                 atc_airline) \
    F("atcFlightNumber",            atc_flight_number) \
    F("gpsWpNextId",                gps_wp_next_id) \
    F("gpsWpPrevId",                gps_wp_prev_id) \
    F("gpsApproachAirportId",       gps_approach_airport_id)

namespace {

void AppendEscaped(std::ostringstream& json, const std::string& value) {
    json << '"';
    for (char ch : value) {
        const unsigned char c = static_cast<unsigned char>(ch);
        switch (ch) {
            case '"':  json << "\\\""; break;
            case '\\': json << "\\\\"; break;
            case '\n': json << "\\n"; break;
            case '\r': json << "\\r"; break;
            case '\t': json << "\\t"; break;
            default:
                if (c < 0x20) {
                    json << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                         << std::dec << std::setfill(' ');
                } else {
                    json << ch;
                }
        }
    }
    json << '"';
}

void AppendNumber(std::ostringstream& json, double value) {
    // JSON has no NaN/Infinity
    if (std::isfinite(value)) {
        json << value;
    } else {
        json << "null";
    }
}

void ReadNumber(const nlohmann::json& doc, const char* key, double& target) {
    auto it = doc.find(key);
    if (it != doc.end() && it->is_number()) {
        target = it->get<double>();
    }
}

bool InRange(double value, double low, double high) {
    return std::isfinite(value) && value >= low && value <= high;
}

/// @return false if the value is a number that does not fit an int
bool ReadInt(const nlohmann::json& doc, const char* key, int& target) {
    auto it = doc.find(key);
    if (it == doc.end() || !it->is_number()) {
        return true;
    }
    const double value = it->get<double>();
    if (!InRange(value, std::numeric_limits<int>::min(), std::numeric_limits<int>::max())) {
        return false;
    }
    target = static_cast<int>(value);
    return true;
}

void ReadBool(const nlohmann::json& doc, const char* key, bool& target) {
    auto it = doc.find(key);
    if (it != doc.end() && it->is_boolean()) {
        target = it->get<bool>();
    }
}

void ReadString(const nlohmann::json& doc, const char* key, std::optional<std::string>& target) {
    auto it = doc.find(key);
    if (it != doc.end() && it->is_string()) {
        target = it->get<std::string>();
    }
}

} // namespace

///////////////////////////////////////////////////////////////////////////////////////////////////
// Builder
///////////////////////////////////////////////////////////////////////////////////////////////////

std::string BuildSnapshotJSON(const Snapshot& snapshot, const std::optional<std::string>& session_code) {
    std::ostringstream json;
    json.setf(std::ios::fixed);
    json.precision(6);

    json << "{";
    json << "\"simRate\":";
    AppendNumber(json, snapshot.sim_rate);
    json << ",\"paused\":" << (snapshot.paused ? "true" : "false");
    json << ",\"connected\":true";
    if (session_code) {
        json << ",\"sessionCode\":";
        AppendEscaped(json, *session_code);
    }

    #define F(key, member) json << ",\"" key "\":"; AppendNumber(json, snapshot.member);
    SNAPSHOT_NUMBER_FIELDS(F)
    #undef F

    #define F(key, member) json << ",\"" key "\":" << snapshot.member;
    SNAPSHOT_INT_FIELDS(F)
    #undef F

    #define F(key, member) json << ",\"" key "\":" << (snapshot.member ? "true" : "false");
    SNAPSHOT_BOOL_FIELDS(F)
    #undef F

    #define F(key, member) if (snapshot.member) { json << ",\"" key "\":"; AppendEscaped(json, *snapshot.member); }
    SNAPSHOT_STRING_FIELDS(F)
    #undef F

    json << "}";
    return json.str();
}

std::string BuildDisconnectedJSON(const std::optional<std::string>& session_code) {
    std::ostringstream json;
    json << "{\"simRate\":1,\"paused\":false,\"connected\":false";
    if (session_code) {
        json << ",\"sessionCode\":";
        AppendEscaped(json, *session_code);
    }
    json << "}";
    return json.str();
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// Parser
///////////////////////////////////////////////////////////////////////////////////////////////////

std::optional<Snapshot> ParseSnapshotJSON(const std::string& text) {
    nlohmann::json doc = nlohmann::json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return std::nullopt;
    }

    Snapshot snapshot;
    snapshot.captured_at = Clock::now();

    auto timestamp = doc.find("timestamp");
    if (timestamp != doc.end() && timestamp->is_number()) {
        // Clock resolution limits the representable range of Unix milliseconds
        const double limit = static_cast<double>(
            std::chrono::duration_cast<std::chrono::milliseconds>(TimePoint::duration::max()).count());
        const double millis = timestamp->get<double>();
        if (!InRange(millis, -limit, limit)) {
            return std::nullopt;
        }
        snapshot.captured_at = FromUnixMillis(static_cast<std::int64_t>(millis));
    }

    ReadNumber(doc, "simRate", snapshot.sim_rate);
    ReadBool(doc, "paused", snapshot.paused);

    #define F(key, member) ReadNumber(doc, key, snapshot.member);
    SNAPSHOT_NUMBER_FIELDS(F)
    #undef F

    #define F(key, member) if (!ReadInt(doc, key, snapshot.member)) return std::nullopt;
    SNAPSHOT_INT_FIELDS(F)
    #undef F

    #define F(key, member) ReadBool(doc, key, snapshot.member);
    SNAPSHOT_BOOL_FIELDS(F)
    #undef F

    #define F(key, member) ReadString(doc, key, snapshot.member);
    SNAPSHOT_STRING_FIELDS(F)
    #undef F

    return snapshot;
}

} // namespace FlightBridge
