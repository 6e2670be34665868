///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file time_format.cpp
 * @brief UTC timestamp formatting
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "util/time_format.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace FlightBridge {

std::string FormatIso8601Utc(TimePoint time) {
    const auto millis = ToUnixMillis(time);
    std::int64_t seconds = millis / 1000;
    std::int64_t fraction = millis % 1000;
    if (fraction < 0) {
        fraction += 1000;
        seconds -= 1;
    }

    const std::time_t as_time_t = static_cast<std::time_t>(seconds);
    std::tm utc{};
    gmtime_r(&as_time_t, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << fraction << 'Z';
    return out.str();
}

std::int64_t ToUnixMillis(TimePoint time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

TimePoint FromUnixMillis(std::int64_t millis) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(millis)));
}

} // namespace FlightBridge
