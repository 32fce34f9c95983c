#pragma once

/// @file earth.hpp
/// @brief Figure and rotation of the Earth (WGS84 ellipsoid).

#include "astro/coordinates.hpp"
#include "core/types.hpp"

namespace almanac::astro
{
    /// @brief ρ sin φ' and ρ cos φ' of an observer, in equatorial radii.
    struct GeocentricTerms
    {
        f64 rho_sin_phi;
        f64 rho_cos_phi;
    };

    /// @brief Static utility class for geodesy on the WGS84 ellipsoid.
    ///
    /// Formulas from Meeus, Ch. 11. Distances in kilometers, angles in radians.
    class Earth
    {
    public:
        Earth() = delete;

        [[nodiscard]] static constexpr f64 flattening() { return 1.0 / 298.257223563; }

        /// @brief Equatorial radius a (km).
        [[nodiscard]] static constexpr f64 equatorial_radius() { return 6378.137; }

        /// @brief Polar radius b = a (1 - f) (km).
        [[nodiscard]] static constexpr f64 polar_radius()
        {
            return equatorial_radius() * (1.0 - flattening());
        }

        /// @brief Rotation rate relative to the stars (rad/s).
        [[nodiscard]] static constexpr f64 rotational_angular_velocity() { return 7.292114992e-5; }

        /// @brief Eccentricity of the meridian ellipse, e = √(2f − f²).
        [[nodiscard]] static f64 eccentricity_of_meridian();

        /// @brief Great-circle distance on a sphere of radius 6371 km.
        [[nodiscard]] static f64 approximate_geodesic_distance(const GeographicCoord& p1,
                                                               const GeographicCoord& p2);

        /// @brief Andoyer–Lambert distance on the ellipsoid, accurate to ~50 m.
        ///
        /// Undefined for coincident or exactly antipodal points.
        [[nodiscard]] static f64 geodesic_distance(const GeographicCoord& p1,
                                                   const GeographicCoord& p2);

        /// @brief Geocentric position terms of an observer.
        /// @param geographic_lat Geographic latitude.
        /// @param height_m Height above sea level in meters.
        [[nodiscard]] static GeocentricTerms rho_sin_cos_phi(f64 geographic_lat, f64 height_m);

        /// @brief Distance to the Earth's center at sea level, in equatorial radii.
        [[nodiscard]] static f64 distance_from_center(f64 geographic_lat);

        /// @brief Radius of the parallel of latitude (km).
        [[nodiscard]] static f64 radius_of_parallel(f64 geographic_lat);

        /// @brief Linear velocity due to rotation (km/s).
        [[nodiscard]] static f64 linear_velocity_at_latitude(f64 geographic_lat);

        /// @brief Radius of curvature of the meridian (km).
        [[nodiscard]] static f64 radius_of_curvature(f64 geographic_lat);

        /// @brief Geographic minus geocentric latitude.
        [[nodiscard]] static f64 geographic_geocentric_latitude_difference(f64 geographic_lat);

        /// @brief Equation of time (apparent minus mean solar time), Meeus 28.3.
        /// @param jd Julian Ephemeris Day.
        /// @param sun_ra Apparent right ascension of the Sun.
        /// @param nutation_in_longitude Δψ.
        /// @param true_obliquity ε.
        /// @return E in radians, reduced to (-π, π].
        [[nodiscard]] static f64 equation_of_time(f64 jd,
                                                  f64 sun_ra,
                                                  f64 nutation_in_longitude,
                                                  f64 true_obliquity);

        /// @brief Angle between a body's diurnal path and the horizon at rising/setting.
        [[nodiscard]] static f64 angle_between_diurnal_path_and_horizon(f64 dec, f64 observer_lat);
    };

} // namespace almanac::astro
