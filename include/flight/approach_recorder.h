///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file approach_recorder.h
 * @brief Bounded window of low-altitude samples turned into a glide-path trace on landing
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "telemetry/snapshot.h"

#include <cstddef>
#include <deque>
#include <vector>

namespace FlightBridge {

constexpr size_t APPROACH_MAX_SAMPLES = 60;
constexpr double APPROACH_MAX_AGL_FT = 3000.0;

struct ApproachSample {
    TimePoint timestamp{};
    double altitude_agl_ft = 0.0;
    GeoPosition position{};
    double vertical_speed_fpm = 0.0;
    double ground_speed_kt = 0.0;
};

struct ApproachPoint {
    double seconds_before_touchdown = 0.0;  ///< <= 0 for samples before touchdown
    double altitude_agl_ft = 0.0;
    double distance_to_touchdown_nm = 0.0;
    double vertical_speed_fpm = 0.0;
    double ground_speed_kt = 0.0;
};

class ApproachRecorder {
public:
    /**
     * @brief Append a sample if 0 < AGL < 3000 ft, evicting the oldest beyond 60.
     * @return true if the snapshot was recorded
     */
    bool Record(const Snapshot& snapshot);

    /**
     * @brief Convert the buffer into a trace relative to the touchdown point and clear it.
     *
     * Seconds are rounded to 0.1, distance to 0.01 NM, altitude/VS/GS to whole
     * units. The result is ordered by seconds_before_touchdown ascending.
     */
    std::vector<ApproachPoint> Drain(TimePoint touchdown_time, const GeoPosition& touchdown_position);

    void Clear() { samples_.clear(); }

    size_t Size() const { return samples_.size(); }
    bool Empty() const { return samples_.empty(); }

private:
    std::deque<ApproachSample> samples_;
};

} // namespace FlightBridge
