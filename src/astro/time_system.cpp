/// @file time_system.cpp
/// @brief Implementation of astronomical time utilities.

#include "astro/time_system.hpp"

#include "astro/angle.hpp"
#include "astro/ecliptic.hpp"
#include "astro/nutation.hpp"

#include <cmath>

namespace almanac::astro
{

// -----------------------------------------------------------------
// Julian centuries / millennia since J2000.0
// -----------------------------------------------------------------

f64 TimeSystem::julian_centuries(f64 jd)
{
    return (jd - astro_constants::kJ2000) / astro_constants::kDaysPerJulianCentury;
}

f64 TimeSystem::julian_millennia(f64 jd)
{
    return (jd - astro_constants::kJ2000) / (10.0 * astro_constants::kDaysPerJulianCentury);
}

// -----------------------------------------------------------------
// ΔT: Espenak & Meeus polynomial expressions
// (eclipse.gsfc.nasa.gov/SEcat5/deltatpoly.html)
//
// Branch order and thresholds matter: each era is an independent
// empirical fit, evaluated in a locally shifted variable u.
// -----------------------------------------------------------------

f64 TimeSystem::delta_t(i32 year, Month month)
{
    const f64 y = static_cast<f64>(year)
                + (static_cast<f64>(month_ordinal(month)) - 0.5) / 12.0;

    if (y < -500.0)
    {
        const f64 u = (y - 1820.0) / 100.0;
        return 32.0 * u * u - 20.0;
    }
    if (y < 500.0)
    {
        const f64 u = y / 100.0;
        return 10583.6
             - u * (1014.41
             - u * (33.78311
             - u * (5.952053
             + u * (0.1798452
             - u * (0.022174192
             + u * 0.0090316521)))));
    }
    if (y < 1600.0)
    {
        const f64 u = (y - 1000.0) / 100.0;
        return 1574.2
             - u * (556.01
             - u * (71.23472
             + u * (0.319781
             - u * (0.8503463
             + u * (0.005050998
             - u * 0.0083572073)))));
    }
    if (y < 1700.0)
    {
        const f64 u = y - 1600.0;
        return 120.0 - u * (0.9808 + u * (0.01532 - u / 7129.0));
    }
    if (y < 1800.0)
    {
        const f64 u = y - 1700.0;
        return 8.83 + u * (0.1603 - u * (0.0059285 - u * (0.00013336 - u / 1174000.0)));
    }
    if (y < 1860.0)
    {
        const f64 u = y - 1800.0;
        return 13.72
             - u * (0.332447
             - u * (0.0068612
             + u * (0.0041116
             - u * (0.00037436
             - u * (0.0000121272
             - u * (0.0000001699
             - u * 0.000000000875))))));
    }
    if (y < 1900.0)
    {
        const f64 u = y - 1860.0;
        return 7.62
             + u * (0.5737
             - u * (0.251754
             - u * (0.01680668
             - u * (0.0004473624
             - u / 233174.0))));
    }
    if (y < 1920.0)
    {
        const f64 u = y - 1900.0;
        return -2.79 + u * (1.494119 - u * (0.0598939 - u * (0.0061966 - u * 0.000197)));
    }
    if (y < 1941.0)
    {
        const f64 u = y - 1920.0;
        return 21.20 + u * (0.84493 - u * (0.076100 - u * 0.0020936));
    }
    if (y < 1961.0)
    {
        const f64 u = y - 1950.0;
        return 29.07 + u * (0.407 - u * ((1.0 / 233.0) - u / 2547.0));
    }
    if (y < 1986.0)
    {
        const f64 u = y - 1975.0;
        return 45.45 + u * (1.067 - u * ((1.0 / 260.0) + u / 718.0));
    }
    if (y < 2005.0)
    {
        const f64 u = y - 2000.0;
        return 63.86
             + u * (0.3345
             - u * (0.060374
             - u * (0.0017275
             + u * (0.000651814
             + u * 0.00002373599))));
    }
    if (y < 2050.0)
    {
        const f64 u = y - 2000.0;
        return 62.92 + u * (0.32217 + u * 0.005589);
    }
    if (y <= 2150.0)
    {
        const f64 u = (y - 1820.0) / 100.0;
        return 32.0 * u * u - 20.0 - 0.5628 * (2150.0 - y);
    }
    if (y > 2150.0)
    {
        const f64 u = (y - 1820.0) / 100.0;
        return 32.0 * u * u - 20.0;
    }

    // Only reachable for a NaN year fraction
    return 0.0;
}

// -----------------------------------------------------------------
// GMST: IAU 1982 formula
//
// GMST (degrees) = 280.46061837
//                + 360.98564736629 × (JD − 2451545.0)
//                + 0.000387933 × T²
//                − T³ / 38710000
//
// Where T = Julian centuries from J2000.0
// Result normalized to [0, 360°), then converted to radians.
// -----------------------------------------------------------------

f64 TimeSystem::mean_sidereal(f64 jd)
{
    const f64 t = julian_centuries(jd);
    const f64 d = jd - astro_constants::kJ2000;

    const f64 gmst_deg = 280.46061837
                       + 360.98564736629 * d
                       + t * t * (0.000387933 - t / 38710000.0);

    return Angle::normalize_360(gmst_deg) * astro_constants::kDegToRad;
}

// -----------------------------------------------------------------
// GAST = GMST + Δψ × cos(ε)   (equation of the equinoxes)
// -----------------------------------------------------------------

f64 TimeSystem::apparent_sidereal(f64 mean_sidereal,
                                  f64 nutation_in_longitude,
                                  f64 true_obliquity)
{
    return mean_sidereal + nutation_in_longitude * std::cos(true_obliquity);
}

f64 TimeSystem::apparent_sidereal(f64 jd)
{
    const Nutation nutation = Nutation::compute(jd);
    const f64 obliquity = Ecliptic::mean_obliquity_laskar(jd) + nutation.obliquity;

    return apparent_sidereal(mean_sidereal(jd), nutation.longitude, obliquity);
}

} // namespace almanac::astro
