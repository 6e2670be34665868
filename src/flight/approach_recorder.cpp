///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file approach_recorder.cpp
 * @brief ApproachRecorder implementation
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "flight/approach_recorder.h"
#include "flight/geo.h"

#include <algorithm>
#include <cmath>

namespace FlightBridge {

namespace {

double RoundTo(double value, double step) {
    return std::round(value / step) * step;
}

} // namespace

bool ApproachRecorder::Record(const Snapshot& snapshot) {
    const double agl = snapshot.altitude_agl_ft;
    if (!(agl > 0.0 && agl < APPROACH_MAX_AGL_FT)) {
        return false;
    }

    ApproachSample sample;
    sample.timestamp = snapshot.captured_at;
    sample.altitude_agl_ft = agl;
    sample.position = snapshot.Position();
    sample.vertical_speed_fpm = snapshot.vertical_speed_fpm;
    sample.ground_speed_kt = snapshot.ground_speed_kt;
    samples_.push_back(sample);

    while (samples_.size() > APPROACH_MAX_SAMPLES) {
        samples_.pop_front();
    }
    return true;
}

std::vector<ApproachPoint> ApproachRecorder::Drain(TimePoint touchdown_time,
                                                   const GeoPosition& touchdown_position) {
    std::vector<ApproachPoint> trace;
    trace.reserve(samples_.size());

    for (const auto& sample : samples_) {
        const std::chrono::duration<double> offset = sample.timestamp - touchdown_time;

        ApproachPoint point;
        point.seconds_before_touchdown = RoundTo(offset.count(), 0.1);
        point.altitude_agl_ft = std::round(sample.altitude_agl_ft);
        point.distance_to_touchdown_nm = RoundTo(HaversineDistanceNm(sample.position, touchdown_position), 0.01);
        point.vertical_speed_fpm = std::round(sample.vertical_speed_fpm);
        point.ground_speed_kt = std::round(sample.ground_speed_kt);
        trace.push_back(point);
    }

    // Capture order is normally chronological already; a clock step backwards must not break ordering
    std::stable_sort(trace.begin(), trace.end(), [](const ApproachPoint& a, const ApproachPoint& b) {
        return a.seconds_before_touchdown < b.seconds_before_touchdown;
    });

    samples_.clear();
    return trace;
}

} // namespace FlightBridge
