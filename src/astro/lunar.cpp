/// @file lunar.cpp

#include "astro/lunar.hpp"

#include <cmath>

namespace almanac::astro
{

namespace
{

// Earth equatorial radius used by the lunar theory (km), Moon/Earth radius ratio
constexpr f64 kLunarTheoryEarthRadiusKm = 6378.14;
constexpr f64 kMoonEarthRadiusRatio     = 0.272481;

} // anonymous namespace

f64 Lunar::horizontal_parallax(f64 earth_moon_km)
{
    return std::asin(kLunarTheoryEarthRadiusKm / earth_moon_km);
}

f64 Lunar::semidiameter(f64 earth_moon_km)
{
    return std::asin(kMoonEarthRadiusRatio * std::sin(horizontal_parallax(earth_moon_km)));
}

} // namespace almanac::astro
