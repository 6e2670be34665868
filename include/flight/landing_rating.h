///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file landing_rating.h
 * @brief Five-tier touchdown rating from vertical speed
 *
 * | |VS| ft/min | Rating     | Score |
 * |-------------|------------|-------|
 * | < 100       | Perfect    | 5     |
 * | 100 - 199   | Good       | 4     |
 * | 200 - 299   | Acceptable | 3     |
 * | 300 - 499   | Hard       | 2     |
 * | >= 500      | Very Hard  | 1     |
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <string>

namespace FlightBridge {

struct LandingRating {
    std::string name;
    int score = 0;
};

/// Sign of the input is ignored (descent is negative)
LandingRating RateLanding(double vertical_speed_fpm);

} // namespace FlightBridge
