/// @file ecliptic.cpp
/// @brief Obliquity of the ecliptic.

#include "astro/ecliptic.hpp"

#include "astro/nutation.hpp"
#include "astro/time_system.hpp"

#include <array>

namespace almanac::astro
{

namespace
{

// 23° 26' 21.448"
constexpr f64 kObliquityJ2000Arcsec = 84381.448;

// Coefficients of U¹..U¹⁰, arcseconds
constexpr std::array<f64, 10> kLaskarTerms = {
    -4680.93, -1.55, 1999.25, -51.38, -249.67,
    -39.05, 7.12, 27.87, 5.79, 2.45,
};

} // anonymous namespace

f64 Ecliptic::mean_obliquity_laskar(f64 jd)
{
    // U is measured in units of 10000 Julian years
    const f64 u = TimeSystem::julian_centuries(jd) / 100.0;

    // Horner, innermost term first
    f64 sum = 0.0;
    for (auto it = kLaskarTerms.rbegin(); it != kLaskarTerms.rend(); ++it)
    {
        sum = (sum + *it) * u;
    }

    return (kObliquityJ2000Arcsec + sum) * astro_constants::kArcSecToRad;
}

f64 Ecliptic::mean_obliquity_iau(f64 jd)
{
    const f64 t = TimeSystem::julian_centuries(jd);

    const f64 arcsec = kObliquityJ2000Arcsec
                     + t * (-46.8150 + t * (-0.00059 + t * 0.001813));

    return arcsec * astro_constants::kArcSecToRad;
}

f64 Ecliptic::true_obliquity(f64 jd)
{
    return mean_obliquity_laskar(jd) + Nutation::compute(jd).obliquity;
}

} // namespace almanac::astro
