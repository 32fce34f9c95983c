/// @file earth.cpp
/// @brief Geodesy on the WGS84 ellipsoid.

#include "astro/earth.hpp"

#include "astro/angle.hpp"
#include "astro/time_system.hpp"

#include <cmath>

namespace almanac::astro
{

namespace
{

constexpr f64 kMeanRadiusKm = 6371.0;

f64 square(f64 x)
{
    return x * x;
}

} // anonymous namespace

f64 Earth::eccentricity_of_meridian()
{
    const f64 f = flattening();
    return std::sqrt(f * (2.0 - f));
}

f64 Earth::approximate_geodesic_distance(const GeographicCoord& p1, const GeographicCoord& p2)
{
    return kMeanRadiusKm * p1.angular_separation(p2);
}

// -----------------------------------------------------------------
// Andoyer–Lambert (Meeus 11)
//
// F = (φ1 + φ2)/2, G = (φ1 − φ2)/2, λ = (L1 − L2)/2
// S = sin²G cos²λ + cos²F sin²λ
// C = cos²G cos²λ + sin²F sin²λ
// tan ω = √(S/C), R = √(SC)/ω, D = 2ωa
// s = D (1 + f H1 sin²F cos²G − f H2 cos²F sin²G)
// -----------------------------------------------------------------

f64 Earth::geodesic_distance(const GeographicCoord& p1, const GeographicCoord& p2)
{
    const f64 f_mid  = (p1.latitude + p2.latitude) * 0.5;
    const f64 g_half = (p1.latitude - p2.latitude) * 0.5;
    const f64 lambda = (p1.longitude - p2.longitude) * 0.5;

    const f64 s = square(std::sin(g_half) * std::cos(lambda))
                + square(std::cos(f_mid) * std::sin(lambda));
    const f64 c = square(std::cos(g_half) * std::cos(lambda))
                + square(std::sin(f_mid) * std::sin(lambda));

    // Coincident points
    if (s == 0.0)
    {
        return 0.0;
    }

    const f64 omega = std::atan(std::sqrt(s / c));
    const f64 r     = std::sqrt(s * c) / omega;
    const f64 d     = 2.0 * omega * equatorial_radius();

    const f64 h1 = (3.0 * r - 1.0) / (2.0 * c);
    const f64 h2 = (3.0 * r + 1.0) / (2.0 * s);

    return d * (1.0
              + flattening() * h1 * square(std::sin(f_mid) * std::cos(g_half))
              - flattening() * h2 * square(std::cos(f_mid) * std::sin(g_half)));
}

GeocentricTerms Earth::rho_sin_cos_phi(f64 geographic_lat, f64 height_m)
{
    const f64 axis_ratio = polar_radius() / equatorial_radius();
    const f64 u = std::atan(axis_ratio * std::tan(geographic_lat));
    const f64 h = height_m / (equatorial_radius() * 1000.0);

    return GeocentricTerms{
        .rho_sin_phi = axis_ratio * std::sin(u) + h * std::sin(geographic_lat),
        .rho_cos_phi = std::cos(u) + h * std::cos(geographic_lat),
    };
}

f64 Earth::distance_from_center(f64 geographic_lat)
{
    return 0.9983271
         + 0.0016764 * std::cos(2.0 * geographic_lat)
         - 0.0000035 * std::cos(4.0 * geographic_lat);
}

f64 Earth::radius_of_parallel(f64 geographic_lat)
{
    const f64 e = eccentricity_of_meridian();
    return equatorial_radius() * std::cos(geographic_lat)
         / std::sqrt(1.0 - square(e * std::sin(geographic_lat)));
}

f64 Earth::linear_velocity_at_latitude(f64 geographic_lat)
{
    return rotational_angular_velocity() * radius_of_parallel(geographic_lat);
}

f64 Earth::radius_of_curvature(f64 geographic_lat)
{
    const f64 e = eccentricity_of_meridian();
    return equatorial_radius() * (1.0 - e * e)
         / std::pow(1.0 - square(e * std::sin(geographic_lat)), 1.5);
}

f64 Earth::geographic_geocentric_latitude_difference(f64 geographic_lat)
{
    const f64 arcsec = 692.73 * std::sin(2.0 * geographic_lat)
                     - 1.16 * std::sin(4.0 * geographic_lat);
    return arcsec * astro_constants::kArcSecToRad;
}

// -----------------------------------------------------------------
// E = L0 − 0.0057183° − α + Δψ cos ε   (degrees)
// L0: Sun's mean longitude, polynomial in Julian millennia
// -----------------------------------------------------------------

f64 Earth::equation_of_time(f64 jd, f64 sun_ra, f64 nutation_in_longitude, f64 true_obliquity)
{
    const f64 t = TimeSystem::julian_millennia(jd);

    const f64 mean_long = Angle::normalize_360(
        280.4664567
        + t * (360007.6982779
        + t * (0.03032028
        + t * (1.0 / 49931.0
        - t * (1.0 / 15300.0
        + t / 2000000.0)))));

    f64 e_deg = mean_long
              - 0.0057183
              - sun_ra * astro_constants::kRadToDeg
              + nutation_in_longitude * astro_constants::kRadToDeg * std::cos(true_obliquity);

    e_deg = Angle::normalize_360(e_deg);
    if (e_deg > 180.0)
    {
        e_deg -= 360.0;
    }

    return e_deg * astro_constants::kDegToRad;
}

f64 Earth::angle_between_diurnal_path_and_horizon(f64 dec, f64 observer_lat)
{
    const f64 b = std::tan(dec) * std::tan(observer_lat);
    const f64 c = std::sqrt(1.0 - b * b);

    return std::atan2(c * std::cos(dec), std::tan(observer_lat));
}

} // namespace almanac::astro
