///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file landing_rating.cpp
 * @brief Landing rating thresholds
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "flight/landing_rating.h"

#include <cmath>

namespace FlightBridge {

LandingRating RateLanding(double vertical_speed_fpm) {
    const double abs_vs = std::fabs(vertical_speed_fpm);

    if (abs_vs < 100) return {"Perfect", 5};
    if (abs_vs < 200) return {"Good", 4};
    if (abs_vs < 300) return {"Acceptable", 3};
    if (abs_vs < 500) return {"Hard", 2};
    return {"Very Hard", 1};
}

} // namespace FlightBridge
