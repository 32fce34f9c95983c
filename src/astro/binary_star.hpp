#pragma once

/// @file binary_star.hpp
/// @brief Apparent orbit of a visual binary star (Meeus, Ch. 57).

#include "core/types.hpp"

namespace almanac::astro
{
    /// @brief Static utility class for visual binary star geometry.
    ///
    /// Times are decimal years (e.g. 1934.008). Angles in radians; the
    /// semimajor axis and separations share whatever unit the caller uses
    /// for the orbit (usually arcseconds).
    class BinaryStar
    {
    public:
        BinaryStar() = delete;

        /// @brief Mean annual motion n = 2π / P.
        /// @param period_years Period of revolution (mean solar years).
        [[nodiscard]] static f64 mean_annual_motion(f64 period_years);

        /// @brief Mean anomaly M = n (t − T), not reduced.
        [[nodiscard]] static f64 mean_anomaly(f64 mean_motion, f64 t, f64 t_periastron);

        /// @brief Radius vector r = a (1 − e cos E).
        [[nodiscard]] static f64 radius_vector(f64 semimajor_axis, f64 e, f64 eccentric_anomaly);

        [[nodiscard]] static f64 true_anomaly(f64 e, f64 eccentric_anomaly);

        /// @brief Position angle of the companion, in [0, 2π).
        /// @param ascending_node Position angle of the ascending node Ω.
        /// @param true_anom True anomaly ν.
        /// @param periastron_long Longitude of periastron ω.
        /// @param inclination Inclination i of the true orbit to the sky plane.
        [[nodiscard]] static f64 apparent_position_angle(f64 ascending_node,
                                                         f64 true_anom,
                                                         f64 periastron_long,
                                                         f64 inclination);

        /// @brief Apparent separation ρ of the pair, in the unit of radius_vector.
        [[nodiscard]] static f64 angular_separation(f64 radius_vec,
                                                    f64 true_anom,
                                                    f64 periastron_long,
                                                    f64 inclination);

        /// @brief Eccentricity of the orbit as projected on the sky.
        [[nodiscard]] static f64 eccentricity_of_apparent_orbit(f64 e,
                                                                f64 periastron_long,
                                                                f64 inclination);
    };

} // namespace almanac::astro
