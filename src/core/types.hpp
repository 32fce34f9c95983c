#pragma once

#include <glm/gtc/constants.hpp>

#include <cstdint>

namespace almanac
{
    // Precision aliases
    using f64 = double;
    using i32 = int32_t;
    using i64 = int64_t;

    // Astronomical constants
    namespace astro_constants
    {
        constexpr f64 kPi          = glm::pi<f64>();
        constexpr f64 kTwoPi       = 2.0 * kPi;
        constexpr f64 kHalfPi      = kPi / 2.0;
        constexpr f64 kDegToRad    = kPi / 180.0;
        constexpr f64 kRadToDeg    = 180.0 / kPi;
        constexpr f64 kHourToRad   = kPi / 12.0;
        constexpr f64 kArcSecToRad = kPi / (180.0 * 3600.0);
        constexpr f64 kJ2000       = 2451545.0;  // Julian Date of J2000.0 epoch
        constexpr f64 kDaysPerJulianCentury = 36525.0;
        constexpr f64 kSecondsPerDay = 86400.0;

        // First Julian day number of the Gregorian calendar (1582-10-15)
        constexpr i64 kGregorianReformJdn = 2299161;
    }
}
