/// @file angle.cpp
/// @brief Implementation of angle utilities.

#include "astro/angle.hpp"

#include <algorithm>
#include <cmath>

namespace almanac::astro
{

f64 Angle::normalize_two_pi(f64 radians)
{
    radians = std::fmod(radians, astro_constants::kTwoPi);
    if (radians < 0.0)
    {
        radians += astro_constants::kTwoPi;
    }
    return radians;
}

f64 Angle::normalize_360(f64 degrees)
{
    degrees = std::fmod(degrees, 360.0);
    if (degrees < 0.0)
    {
        degrees += 360.0;
    }
    return degrees;
}

f64 Angle::dms_to_degrees(i32 degrees, i32 arcminutes, f64 arcseconds)
{
    const bool negative = degrees < 0 || arcminutes < 0 || arcseconds < 0.0;

    const f64 magnitude = std::abs(static_cast<f64>(degrees))
                        + std::abs(static_cast<f64>(arcminutes)) / 60.0
                        + std::abs(arcseconds) / 3600.0;

    return negative ? -magnitude : magnitude;
}

// -----------------------------------------------------------------
// Haversine separation
//
// hav(d) = hav(Δlat) + cos(lat1) × cos(lat2) × hav(Δlong)
// d      = 2 × asin(√hav(d))
// -----------------------------------------------------------------

f64 Angle::angular_separation(f64 long1, f64 lat1, f64 long2, f64 lat2)
{
    const f64 sin_dlat  = std::sin((lat2 - lat1) * 0.5);
    const f64 sin_dlong = std::sin((long2 - long1) * 0.5);

    const f64 hav = sin_dlat * sin_dlat
                  + std::cos(lat1) * std::cos(lat2) * sin_dlong * sin_dlong;

    return 2.0 * std::asin(std::sqrt(std::clamp(hav, 0.0, 1.0)));
}

} // namespace almanac::astro
