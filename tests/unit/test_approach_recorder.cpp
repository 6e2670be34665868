///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file test_approach_recorder.cpp
 * @brief Unit tests for the approach sample window and trace conversion
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include <catch2/catch_all.hpp>
#include "test_helpers.h"

#include "flight/approach_recorder.h"

using namespace FlightBridge;
using namespace TestHelpers;
using Catch::Matchers::WithinAbs;

TEST_CASE("Approach recording window", "[unit][approach]") {
    ApproachRecorder recorder;

    SECTION("Only samples strictly between 0 and 3000 ft AGL are kept") {
        REQUIRE_FALSE(recorder.Record(MakeSnapshot(0, false, 120, 0.0)));
        REQUIRE_FALSE(recorder.Record(MakeSnapshot(1, false, 120, 3000.0)));
        REQUIRE_FALSE(recorder.Record(MakeSnapshot(2, false, 120, 5000.0)));
        REQUIRE(recorder.Record(MakeSnapshot(3, false, 120, 2999.0)));
        REQUIRE(recorder.Record(MakeSnapshot(4, false, 120, 0.5)));
        REQUIRE(recorder.Size() == 2);
    }

    SECTION("The oldest samples are evicted beyond 60") {
        for (int i = 0; i < 75; ++i) {
            recorder.Record(MakeSnapshot(i, false, 120, 1000.0));
        }
        REQUIRE(recorder.Size() == APPROACH_MAX_SAMPLES);

        auto trace = recorder.Drain(At(75), {50.0, 8.5622});
        REQUIRE(trace.size() == 60);
        REQUIRE_THAT(trace.front().seconds_before_touchdown, WithinAbs(-60.0, 1e-9));
        REQUIRE_THAT(trace.back().seconds_before_touchdown, WithinAbs(-1.0, 1e-9));
    }
}

TEST_CASE("Approach trace conversion", "[unit][approach]") {
    ApproachRecorder recorder;

    SECTION("Values are relative to touchdown and rounded") {
        Snapshot s = MakeSnapshot(10.04, false, 131.6, 512.4, 50.0, 8.5622);
        s.vertical_speed_fpm = -702.6;
        recorder.Record(s);

        auto trace = recorder.Drain(At(20.0), {50.01, 8.5622});
        REQUIRE(trace.size() == 1);

        const ApproachPoint& p = trace.front();
        REQUIRE_THAT(p.seconds_before_touchdown, WithinAbs(-10.0, 1e-9));
        REQUIRE(p.altitude_agl_ft == 512.0);
        REQUIRE_THAT(p.distance_to_touchdown_nm, WithinAbs(0.60, 1e-9));
        REQUIRE(p.vertical_speed_fpm == -703.0);
        REQUIRE(p.ground_speed_kt == 132.0);
    }

    SECTION("Trace is ordered ascending even when capture order is not") {
        recorder.Record(MakeSnapshot(15, false, 120, 300.0));
        recorder.Record(MakeSnapshot(5, false, 120, 900.0));
        recorder.Record(MakeSnapshot(10, false, 120, 600.0));

        auto trace = recorder.Drain(At(20), {50.0, 8.5622});
        REQUIRE(trace.size() == 3);
        REQUIRE(trace[0].seconds_before_touchdown < trace[1].seconds_before_touchdown);
        REQUIRE(trace[1].seconds_before_touchdown < trace[2].seconds_before_touchdown);
        REQUIRE(trace[2].seconds_before_touchdown <= 0.0);
    }

    SECTION("Drain empties the buffer") {
        recorder.Record(MakeSnapshot(1, false, 120, 800.0));
        recorder.Drain(At(2), {50.0, 8.5622});
        REQUIRE(recorder.Empty());
        REQUIRE(recorder.Drain(At(3), {50.0, 8.5622}).empty());
    }
}
