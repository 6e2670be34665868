///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file test_replay_source.cpp
 * @brief Integration tests for playing back recorded telemetry files
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include <catch2/catch_all.hpp>
#include "test_helpers.h"

#include "telemetry/replay_telemetry_source.h"

#include <cstdio>
#include <fstream>

using namespace FlightBridge;
using namespace TestHelpers;

namespace {

/// Writes a replay file and removes it on scope exit
class ReplayFile {
public:
    explicit ReplayFile(const std::string& content)
        : path_("flight_bridge_replay_" + std::to_string(::getpid()) + ".jsonl") {
        std::ofstream out(path_);
        out << content;
    }
    ~ReplayFile() { std::remove(path_.c_str()); }

    const std::string& Path() const { return path_; }

private:
    std::string path_;
};

} // namespace

TEST_CASE("Replay source lifecycle", "[integration][replay]") {
    SECTION("Missing file cannot connect") {
        ReplayTelemetrySource source("/nonexistent/flight.jsonl");
        REQUIRE_THROWS_AS(source.Connect(), TelemetrySourceError);
        REQUIRE_FALSE(source.IsConnected());
    }

    SECTION("Polling before Connect() fails") {
        ReplayTelemetrySource source("/nonexistent/flight.jsonl");
        REQUIRE_THROWS_AS(source.Poll(), TelemetrySourceError);
    }

    SECTION("Describe names the file") {
        ReplayTelemetrySource source("recordings/eddf.jsonl");
        REQUIRE(source.Describe() == "replay:recordings/eddf.jsonl");
    }
}

TEST_CASE("Replay source playback", "[integration][replay]") {
    ReplayFile file(
        R"({"timestamp":1700000000000,"onGround":true,"groundSpeed":0,"aircraftTitle":"Cessna 172"})" "\n"
        "\n"
        "not json\n"
        R"({"timestamp":1700000002500,"onGround":false,"groundSpeed":75.5,"latitude":50.0379})" "\n");

    ReplayTelemetrySource source(file.Path());
    const TimePoint before = Clock::now();
    source.Connect();
    const TimePoint after = Clock::now();
    REQUIRE(source.IsConnected());

    auto first = source.Poll();
    REQUIRE(first.has_value());
    REQUIRE(first->on_ground);
    REQUIRE(first->aircraft_title == std::optional<std::string>("Cessna 172"));
    REQUIRE(first->captured_at >= before);
    REQUIRE(first->captured_at <= after);

    // Blank line skipped, malformed line reported as nothing this tick
    REQUIRE_FALSE(source.Poll().has_value());
    REQUIRE(source.LinesRead() == 3);

    auto second = source.Poll();
    REQUIRE(second.has_value());
    REQUIRE_FALSE(second->on_ground);
    REQUIRE(second->ground_speed_kt == Catch::Approx(75.5));
    REQUIRE(second->latitude == Catch::Approx(50.0379));
    REQUIRE(second->captured_at - first->captured_at == std::chrono::milliseconds(2500));

    SECTION("End of file disconnects") {
        REQUIRE_THROWS_AS(source.Poll(), TelemetrySourceError);
        REQUIRE_FALSE(source.IsConnected());
    }

    SECTION("Reconnecting starts over") {
        source.Connect();
        REQUIRE(source.LinesRead() == 0);
        auto again = source.Poll();
        REQUIRE(again.has_value());
        REQUIRE(again->on_ground);
        REQUIRE(again->captured_at >= after);
    }
}
