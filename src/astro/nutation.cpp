/// @file nutation.cpp
/// @brief Abbreviated nutation series.

#include "astro/nutation.hpp"

#include "astro/angle.hpp"
#include "astro/time_system.hpp"

#include <cmath>

namespace almanac::astro
{

// -----------------------------------------------------------------
// Meeus (22.A, abbreviated)
//
// Ω  = 125.04452 - 1934.136261 T + 0.0020708 T² + T³/450000
// L  = 280.4665  + 36000.7698 T      (Sun)
// L' = 218.3165  + 481267.8813 T     (Moon)
//
// Δψ = -17.20" sin Ω - 1.32" sin 2L - 0.23" sin 2L' + 0.21" sin 2Ω
// Δε =  +9.20" cos Ω + 0.57" cos 2L + 0.10" cos 2L' - 0.09" cos 2Ω
// -----------------------------------------------------------------

Nutation Nutation::compute(f64 jd)
{
    const f64 t = TimeSystem::julian_centuries(jd);

    const f64 node = Angle::normalize_360(
        125.04452 + t * (-1934.136261 + t * (0.0020708 + t / 450000.0)))
        * astro_constants::kDegToRad;
    const f64 sun_long = Angle::normalize_360(280.4665 + 36000.7698 * t)
        * astro_constants::kDegToRad;
    const f64 moon_long = Angle::normalize_360(218.3165 + 481267.8813 * t)
        * astro_constants::kDegToRad;

    const f64 dpsi = -17.20 * std::sin(node)
                   -  1.32 * std::sin(2.0 * sun_long)
                   -  0.23 * std::sin(2.0 * moon_long)
                   +  0.21 * std::sin(2.0 * node);

    const f64 deps =   9.20 * std::cos(node)
                   +  0.57 * std::cos(2.0 * sun_long)
                   +  0.10 * std::cos(2.0 * moon_long)
                   -  0.09 * std::cos(2.0 * node);

    return Nutation{
        .longitude = dpsi * astro_constants::kArcSecToRad,
        .obliquity = deps * astro_constants::kArcSecToRad,
    };
}

} // namespace almanac::astro
