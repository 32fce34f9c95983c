/// @file coordinates.cpp
/// @brief Implementation of astronomical coordinate transformations.

#include "astro/coordinates.hpp"

#include "astro/angle.hpp"

#include <cmath>

namespace almanac::astro
{

namespace
{

// North galactic pole and origin, B1950.0 (degrees)
constexpr f64 kGalacticPoleRaDeg   = 192.25;
constexpr f64 kGalacticPoleDecDeg  = 27.4;
constexpr f64 kGalacticNodeLongDeg = 303.0;
constexpr f64 kGalacticInvLongDeg  = 123.0;   // 303° − 180°
constexpr f64 kGalacticInvRaDeg    = 12.25;   // 192.25° − 180°

} // anonymous namespace

// -----------------------------------------------------------------
// Angular separation wrappers
// -----------------------------------------------------------------

f64 EquatorialCoord::angular_separation(const EquatorialCoord& other) const
{
    return Angle::angular_separation(ra, dec, other.ra, other.dec);
}

f64 EclipticCoord::angular_separation(const EclipticCoord& other) const
{
    return Angle::angular_separation(longitude, latitude, other.longitude, other.latitude);
}

f64 GeographicCoord::angular_separation(const GeographicCoord& other) const
{
    return Angle::angular_separation(longitude, latitude, other.longitude, other.latitude);
}

// -----------------------------------------------------------------
// Equatorial (RA/Dec) → Ecliptic (λ/β)   (Meeus 13.1, 13.2)
//
// tan λ = (sin α cos ε + tan δ sin ε) / cos α
// sin β =  sin δ cos ε − cos δ sin ε sin α
// -----------------------------------------------------------------

EclipticCoord Coordinates::ecliptic_from_equatorial(
    const EquatorialCoord& eq,
    f64 obliquity)
{
    const f64 sin_ra  = std::sin(eq.ra);
    const f64 cos_ra  = std::cos(eq.ra);
    const f64 sin_eps = std::sin(obliquity);
    const f64 cos_eps = std::cos(obliquity);

    const f64 longitude = std::atan2(sin_ra * cos_eps + std::tan(eq.dec) * sin_eps, cos_ra);
    const f64 latitude  = std::asin(std::sin(eq.dec) * cos_eps
                                  - std::cos(eq.dec) * sin_eps * sin_ra);

    return EclipticCoord{
        .longitude = longitude,
        .latitude  = latitude,
    };
}

// -----------------------------------------------------------------
// Ecliptic (λ/β) → Equatorial (RA/Dec)   (Meeus 13.3, 13.4)
//
// tan α = (sin λ cos ε − tan β sin ε) / cos λ
// sin δ =  sin β cos ε + cos β sin ε sin λ
// -----------------------------------------------------------------

EquatorialCoord Coordinates::equatorial_from_ecliptic(
    const EclipticCoord& ecl,
    f64 obliquity)
{
    const f64 sin_long = std::sin(ecl.longitude);
    const f64 sin_eps  = std::sin(obliquity);
    const f64 cos_eps  = std::cos(obliquity);

    const f64 ra  = std::atan2(sin_long * cos_eps - std::tan(ecl.latitude) * sin_eps,
                               std::cos(ecl.longitude));
    const f64 dec = std::asin(std::sin(ecl.latitude) * cos_eps
                            + std::cos(ecl.latitude) * sin_eps * sin_long);

    return EquatorialCoord{
        .ra  = ra,
        .dec = dec,
    };
}

// -----------------------------------------------------------------
// Equatorial (H/Dec) → Horizontal (A/h)   (Meeus 13.5, 13.6)
//
// tan A = sin H / (cos H sin φ − tan δ cos φ)
// sin h = sin φ sin δ + cos φ cos δ cos H
// -----------------------------------------------------------------

HorizontalCoord Coordinates::horizontal_from_equatorial(
    f64 hour_angle,
    f64 dec,
    f64 observer_lat)
{
    const f64 sin_lat = std::sin(observer_lat);
    const f64 cos_lat = std::cos(observer_lat);
    const f64 cos_ha  = std::cos(hour_angle);

    const f64 azimuth  = std::atan2(std::sin(hour_angle),
                                    cos_ha * sin_lat - std::tan(dec) * cos_lat);
    const f64 altitude = std::asin(sin_lat * std::sin(dec)
                                 + cos_lat * std::cos(dec) * cos_ha);

    return HorizontalCoord{
        .azimuth  = azimuth,
        .altitude = altitude,
    };
}

// -----------------------------------------------------------------
// Horizontal (A/h) → Equatorial (H/Dec)
//
// tan H = sin A / (cos A sin φ + tan h cos φ)
// sin δ = sin φ sin h − cos φ cos h cos A
// -----------------------------------------------------------------

HourAngleDeclination Coordinates::equatorial_from_horizontal(
    const HorizontalCoord& hz,
    f64 observer_lat,
    DeclinationFormula formula)
{
    const f64 sin_lat = std::sin(observer_lat);
    const f64 cos_lat = std::cos(observer_lat);
    const f64 cos_az  = std::cos(hz.azimuth);

    const f64 hour_angle = std::atan2(std::sin(hz.azimuth),
                                      cos_az * sin_lat + std::tan(hz.altitude) * cos_lat);

    const f64 second_factor = (formula == DeclinationFormula::Meeus)
                            ? std::cos(hz.altitude) * cos_az
                            : cos_az * cos_az;

    const f64 dec = std::asin(sin_lat * std::sin(hz.altitude) - cos_lat * second_factor);

    return HourAngleDeclination{
        .hour_angle = hour_angle,
        .dec        = dec,
    };
}

// -----------------------------------------------------------------
// Equatorial (B1950.0) → Galactic   (Meeus 13.7, 13.8)
//
// tan x = sin(192.25° − α) / (cos(192.25° − α) sin 27.4° − tan δ cos 27.4°)
// l     = 303° − x
// sin b = sin δ sin 27.4° + cos δ cos 27.4° cos(192.25° − α)
// -----------------------------------------------------------------

GalacticCoord Coordinates::galactic_from_equatorial(const EquatorialCoord& eq_b1950)
{
    const f64 pole_ra   = kGalacticPoleRaDeg * astro_constants::kDegToRad;
    const f64 pole_dec  = kGalacticPoleDecDeg * astro_constants::kDegToRad;
    const f64 node_long = kGalacticNodeLongDeg * astro_constants::kDegToRad;

    const f64 d_ra = pole_ra - eq_b1950.ra;

    const f64 x = std::atan2(std::sin(d_ra),
                             std::cos(d_ra) * std::sin(pole_dec)
                           - std::tan(eq_b1950.dec) * std::cos(pole_dec));

    const f64 latitude = std::asin(std::sin(eq_b1950.dec) * std::sin(pole_dec)
                                 + std::cos(eq_b1950.dec) * std::cos(pole_dec) * std::cos(d_ra));

    return GalacticCoord{
        .longitude = node_long - x,
        .latitude  = latitude,
    };
}

// -----------------------------------------------------------------
// Galactic → Equatorial (B1950.0)
//
// tan y = sin(l − 123°) / (cos(l − 123°) sin 27.4° − tan b cos 27.4°)
// α     = y + 12.25°
// sin δ = sin b sin 27.4° + cos b cos 27.4° cos(l − 123°)
// -----------------------------------------------------------------

EquatorialCoord Coordinates::equatorial_from_galactic(const GalacticCoord& gal)
{
    const f64 pole_dec = kGalacticPoleDecDeg * astro_constants::kDegToRad;
    const f64 inv_long = kGalacticInvLongDeg * astro_constants::kDegToRad;
    const f64 inv_ra   = kGalacticInvRaDeg * astro_constants::kDegToRad;

    const f64 d_long = gal.longitude - inv_long;

    const f64 y = std::atan2(std::sin(d_long),
                             std::cos(d_long) * std::sin(pole_dec)
                           - std::tan(gal.latitude) * std::cos(pole_dec));

    const f64 dec = std::asin(std::sin(gal.latitude) * std::sin(pole_dec)
                            + std::cos(gal.latitude) * std::cos(pole_dec) * std::cos(d_long));

    return EquatorialCoord{
        .ra  = inv_ra + y,
        .dec = dec,
    };
}

// -----------------------------------------------------------------
// Hour angle: H = θ0 − L − α  or  H = θ − α
// -----------------------------------------------------------------

f64 Coordinates::hour_angle_from_longitude(
    f64 greenwich_sidereal,
    f64 observer_long,
    f64 ra)
{
    return greenwich_sidereal - observer_long - ra;
}

f64 Coordinates::hour_angle_from_local_sidereal(f64 local_sidereal, f64 ra)
{
    return local_sidereal - ra;
}

} // namespace almanac::astro
