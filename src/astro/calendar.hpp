#pragma once

/// @file calendar.hpp
/// @brief Civil calendar <-> Julian Day conversion for the Julian and Gregorian calendars.

#include "core/types.hpp"

#include <optional>

namespace almanac::astro
{
    /// @brief Calendar month. Use month_ordinal() for the 1-based number.
    enum class Month : i32
    {
        January = 1,
        February,
        March,
        April,
        May,
        June,
        July,
        August,
        September,
        October,
        November,
        December,
    };

    /// @brief Calendar system a date is expressed in.
    enum class CalendarKind
    {
        Julian,
        Gregorian,
    };

    enum class Weekday : i32
    {
        Sunday = 0,
        Monday,
        Tuesday,
        Wednesday,
        Thursday,
        Friday,
        Saturday,
    };

    /// @brief 1-based month number (January = 1).
    [[nodiscard]] constexpr i32 month_ordinal(Month month)
    {
        return static_cast<i32>(month);
    }

    /// @brief Month from its 1-based number, or std::nullopt outside [1, 12].
    [[nodiscard]] constexpr std::optional<Month> month_from_ordinal(i32 ordinal)
    {
        if (ordinal < 1 || ordinal > 12)
        {
            return std::nullopt;
        }
        return static_cast<Month>(ordinal);
    }

    /// @brief A date with the time of day folded into a decimal day.
    struct CivilDate
    {
        i32 year;
        Month month;
        f64 decimal_day;        ///< Day of month plus fraction of day, [1, 32)
        CalendarKind calendar;  ///< Not inferred from the date; part of the value
    };

    /// @brief Day of month with a clock time and a time-zone offset.
    struct DayOfMonth
    {
        i32 day;
        i32 hour;
        i32 minute;
        f64 second;
        f64 time_zone_hours;  ///< East positive, e.g. -8.0 for Pacific Standard Time
    };

    /// @brief Static utility class for calendar arithmetic.
    ///
    /// Julian Day conversion follows Meeus, Astronomical Algorithms, Ch. 7.
    class Calendar
    {
    public:
        Calendar() = delete;

        /// @brief Convert a civil date to a Julian Day.
        ///
        /// The Gregorian correction term is applied only when
        /// date.calendar is Gregorian. Out-of-range days are not checked
        /// and simply extrapolate.
        [[nodiscard]] static f64 julian_day(const CivilDate& date);

        /// @brief Convert a Julian Day back to a civil date.
        /// @param jd Julian Day, must be >= 0.
        /// @return The date, or std::nullopt for a negative (or NaN) Julian Day.
        ///
        /// Julian calendar arithmetic is used before JD 2299161 (1582-10-15),
        /// Gregorian from then on; the returned calendar field says which.
        /// Aborts if the algorithm produces a month outside [1, 12], which
        /// indicates a defect rather than bad input.
        [[nodiscard]] static std::optional<CivilDate> date_from_julian_day(f64 jd);

        /// @brief Day of the week of a date (time of day and calendar kind ignored).
        [[nodiscard]] static Weekday weekday(const CivilDate& date);

        /// @brief Day of the week on which a Julian Day falls.
        [[nodiscard]] static Weekday weekday_of_julian_day(f64 jd);

        [[nodiscard]] static bool is_leap_year(i32 year, CalendarKind calendar);

        [[nodiscard]] static i32 days_in_year(i32 year, CalendarKind calendar);

        /// @brief Year with the elapsed fraction of the year, e.g. 2024.5.
        [[nodiscard]] static f64 decimal_year(const CivilDate& date);

        /// @brief day + hr/24 + min/1440 + sec/86400 - tz/24.
        [[nodiscard]] static f64 decimal_day(const DayOfMonth& day);

        /// @brief Julian Ephemeris Day from a Julian Day and ΔT in seconds.
        [[nodiscard]] static f64 julian_ephemeris_day(f64 jd, f64 delta_t_seconds);
    };

} // namespace almanac::astro
