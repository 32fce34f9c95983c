#pragma once

/// @file angle.hpp
/// @brief Angle utilities: normalization, sexagesimal conversion, angular separation.

#include "core/types.hpp"

namespace almanac::astro
{
    /// @brief Static utility class for plain angle arithmetic.
    ///
    /// Every other astro component builds on these helpers. Results are in
    /// radians unless the function name says degrees.
    class Angle
    {
    public:
        Angle() = delete;

        /// @brief Normalize an angle to the range [0, 2π).
        [[nodiscard]] static f64 normalize_two_pi(f64 radians);

        /// @brief Normalize an angle to the range [0°, 360°).
        [[nodiscard]] static f64 normalize_360(f64 degrees);

        /// @brief Degrees, arcminutes and arcseconds to decimal degrees.
        ///
        /// A negative value in any component makes the whole angle negative,
        /// so -0° 30' 0" can be written as (0, -30, 0.0).
        [[nodiscard]] static f64 dms_to_degrees(i32 degrees, i32 arcminutes, f64 arcseconds);

        /// @brief Great-circle separation of two points on the sphere.
        /// @param long1 Longitude (or RA) of the first point, radians.
        /// @param lat1  Latitude (or Dec) of the first point, radians.
        /// @param long2 Longitude (or RA) of the second point, radians.
        /// @param lat2  Latitude (or Dec) of the second point, radians.
        /// @return Separation in radians, [0, π]. Haversine form.
        [[nodiscard]] static f64 angular_separation(f64 long1, f64 lat1, f64 long2, f64 lat2);
    };

} // namespace almanac::astro
