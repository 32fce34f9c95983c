#pragma once

/// @file ecliptic.hpp
/// @brief Obliquity of the ecliptic.

#include "core/types.hpp"

namespace almanac::astro
{
    /// @brief Static utility class for the obliquity of the ecliptic (radians).
    class Ecliptic
    {
    public:
        Ecliptic() = delete;

        /// @brief Mean obliquity, J. Laskar's polynomial (Meeus 22.3).
        /// @param jd Julian (Ephemeris) Day.
        ///
        /// 0.01" over 1000 years either side of J2000.0, a few arcseconds
        /// over 10000 years.
        [[nodiscard]] static f64 mean_obliquity_laskar(f64 jd);

        /// @brief Mean obliquity, IAU 1980 cubic (Meeus 22.2).
        /// @param jd Julian (Ephemeris) Day.
        ///
        /// Error reaches 1" over 2000 years and about 10" over 4000 years.
        [[nodiscard]] static f64 mean_obliquity_iau(f64 jd);

        /// @brief Laskar mean obliquity plus nutation in obliquity.
        [[nodiscard]] static f64 true_obliquity(f64 jd);
    };

} // namespace almanac::astro
