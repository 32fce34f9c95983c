#pragma once

/// @file nutation.hpp
/// @brief Nutation in longitude and obliquity.

#include "core/types.hpp"

namespace almanac::astro
{
    /// @brief Nutation angles, radians.
    struct Nutation
    {
        f64 longitude;  ///< Δψ, nutation in longitude
        f64 obliquity;  ///< Δε, nutation in obliquity

        /// @brief Nutation for a Julian (Ephemeris) Day.
        ///
        /// Abbreviated IAU 1980 series (Meeus, Ch. 22): four terms in the
        /// Moon's node and the mean longitudes of Sun and Moon. Accurate to
        /// 0.5" in Δψ and 0.1" in Δε.
        [[nodiscard]] static Nutation compute(f64 jd);
    };

} // namespace almanac::astro
