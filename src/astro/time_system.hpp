#pragma once

/// @file time_system.hpp
/// @brief Astronomical time scales: Julian centuries, ΔT, sidereal time.

#include "astro/calendar.hpp"
#include "core/types.hpp"

namespace almanac::astro
{
    /// @brief Static utility class for astronomical time computations.
    ///
    /// Provides J2000.0-based century/millennium scaling, the Espenak–Meeus
    /// ΔT polynomials and Greenwich mean/apparent sidereal time (IAU 1982).
    /// All angular results are in radians unless noted otherwise.
    class TimeSystem
    {
    public:
        TimeSystem() = delete;

        /// @brief Compute Julian centuries elapsed since J2000.0.
        /// @param jd Julian Date.
        /// @return T = (JD - 2451545.0) / 36525.0
        [[nodiscard]] static f64 julian_centuries(f64 jd);

        /// @brief Compute Julian millennia elapsed since J2000.0.
        /// @return (JD - 2451545.0) / 365250.0
        [[nodiscard]] static f64 julian_millennia(f64 jd);

        /// @brief Approximate ΔT = TT - UT in seconds.
        /// @param year  Calendar year (astronomical numbering, 0 = 1 BC).
        /// @param month Month; the middle of the month is used.
        ///
        /// Piecewise polynomials of Espenak & Meeus (NASA Five Millennium
        /// Canon), keyed on y = year + (month - 0.5) / 12. Adjacent fits are
        /// not continuous; small jumps at the era boundaries are expected.
        [[nodiscard]] static f64 delta_t(i32 year, Month month);

        /// @brief Greenwich Mean Sidereal Time (radians).
        /// @param jd Julian Date (UT).
        /// @return GMST in radians, normalized to [0, 2π).
        /// Uses the IAU 1982 formula (accurate to ~0.1 second of time).
        [[nodiscard]] static f64 mean_sidereal(f64 jd);

        /// @brief Greenwich Apparent Sidereal Time (radians).
        /// @param mean_sidereal Mean sidereal time, radians.
        /// @param nutation_in_longitude Δψ, radians.
        /// @param true_obliquity True obliquity of the ecliptic, radians.
        /// @return mean + Δψ cos ε (not re-normalized).
        [[nodiscard]] static f64 apparent_sidereal(f64 mean_sidereal,
                                                   f64 nutation_in_longitude,
                                                   f64 true_obliquity);

        /// @brief Greenwich Apparent Sidereal Time for a Julian Date.
        ///
        /// Combines mean_sidereal() with the abbreviated nutation series and
        /// Laskar's mean obliquity corrected by Δε.
        [[nodiscard]] static f64 apparent_sidereal(f64 jd);
    };

} // namespace almanac::astro
