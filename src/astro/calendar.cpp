/// @file calendar.cpp
/// @brief Implementation of civil calendar <-> Julian Day conversion.

#include "astro/calendar.hpp"

#include "core/logger.hpp"

#include <array>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace almanac::astro
{

namespace
{

constexpr std::array<i32, 12> kMonthLengths = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

// Above this the reconstructed year no longer fits in i32
constexpr f64 kMaxJulianDay = 1.0e12;

[[noreturn]] void internal_fault(f64 jd, i64 e, i64 month)
{
    ALM_CORE_CRITICAL("Calendar: inconsistent reconstruction of JD {} (E = {}, month = {})",
                      jd, e, month);
    core::Logger::get_core_logger()->flush();
    std::abort();
}

} // anonymous namespace

// -----------------------------------------------------------------
// Civil date → Julian Day (Meeus, Ch. 7)
// -----------------------------------------------------------------

f64 Calendar::julian_day(const CivilDate& date)
{
    f64 y = static_cast<f64>(date.year);
    f64 m = static_cast<f64>(month_ordinal(date.month));

    // Jan and Feb are treated as months 13 and 14 of the previous year
    if (m <= 2.0)
    {
        y -= 1.0;
        m += 12.0;
    }

    // Gregorian calendar correction
    f64 b = 0.0;
    if (date.calendar == CalendarKind::Gregorian)
    {
        const f64 a = std::floor(y / 100.0);
        b = 2.0 - a + std::floor(a / 4.0);
    }

    return std::floor(365.25 * (y + 4716.0))
         + std::floor(30.6001 * (m + 1.0))
         + date.decimal_day
         + b
         - 1524.5;
}

// -----------------------------------------------------------------
// Julian Day → civil date (Meeus, Ch. 7)
// -----------------------------------------------------------------

std::optional<CivilDate> Calendar::date_from_julian_day(f64 jd)
{
    if (!(jd >= 0.0))
    {
        ALM_CORE_WARN("Calendar: cannot convert negative Julian Day {} to a date", jd);
        return std::nullopt;
    }
    if (!std::isfinite(jd) || jd > kMaxJulianDay)
    {
        ALM_CORE_WARN("Calendar: Julian Day {} is beyond the calendar range", jd);
        return std::nullopt;
    }

    // Add 0.5 to shift from noon-based to midnight-based
    const f64 jd_plus = jd + 0.5;
    const i64 z = static_cast<i64>(jd_plus);
    const f64 f = jd_plus - static_cast<f64>(z);

    const bool gregorian = z >= astro_constants::kGregorianReformJdn;

    i64 a = z;
    if (gregorian)
    {
        const i64 alpha = static_cast<i64>(std::floor(
            (static_cast<f64>(z) - 1867216.25) / 36524.25));
        a = z + 1 + alpha - (alpha / 4);
    }

    const i64 b = a + 1524;
    const i64 c = static_cast<i64>(std::floor(
        (static_cast<f64>(b) - 122.1) / 365.25));
    const i64 d = static_cast<i64>(std::floor(
        365.25 * static_cast<f64>(c)));
    const i64 e = static_cast<i64>(std::floor(
        static_cast<f64>(b - d) / 30.6001));

    // Day with the time of day kept as its fraction
    const f64 day = static_cast<f64>(b - d)
                  - std::floor(30.6001 * static_cast<f64>(e))
                  + f;

    const i64 month = (e < 14) ? (e - 1) : (e - 13);
    if (e > 15 || month < 1 || month > 12)
    {
        internal_fault(jd, e, month);
    }

    const i64 year = (month > 2) ? (c - 4716) : (c - 4715);
    if (year > std::numeric_limits<i32>::max())
    {
        ALM_CORE_WARN("Calendar: year {} of Julian Day {} is out of range", year, jd);
        return std::nullopt;
    }

    return CivilDate{
        .year        = static_cast<i32>(year),
        .month       = static_cast<Month>(month),
        .decimal_day = day,
        .calendar    = gregorian ? CalendarKind::Gregorian : CalendarKind::Julian,
    };
}

// -----------------------------------------------------------------
// Weekday: JD of 0h UT, then (JD + 1.5) mod 7 with Sunday = 0
// -----------------------------------------------------------------

Weekday Calendar::weekday(const CivilDate& date)
{
    const CivilDate midnight = {
        .year        = date.year,
        .month       = date.month,
        .decimal_day = std::floor(date.decimal_day),
        .calendar    = CalendarKind::Gregorian,
    };

    return weekday_of_julian_day(julian_day(midnight));
}

Weekday Calendar::weekday_of_julian_day(f64 jd)
{
    i64 index = static_cast<i64>(std::floor(jd + 1.5)) % 7;
    if (index < 0)
    {
        index += 7;
    }
    return static_cast<Weekday>(index);
}

bool Calendar::is_leap_year(i32 year, CalendarKind calendar)
{
    if (calendar == CalendarKind::Julian)
    {
        return year % 4 == 0;
    }

    if (year % 100 == 0)
    {
        return year % 400 == 0;
    }
    return year % 4 == 0;
}

i32 Calendar::days_in_year(i32 year, CalendarKind calendar)
{
    return is_leap_year(year, calendar) ? 366 : 365;
}

f64 Calendar::decimal_year(const CivilDate& date)
{
    const i32 month = month_ordinal(date.month);

    i32 days_before_month = 0;
    for (i32 i = 0; i < month - 1; ++i)
    {
        days_before_month += kMonthLengths[static_cast<std::size_t>(i)];
    }

    const bool leap = is_leap_year(date.year, date.calendar);
    if (leap && month > 2)
    {
        days_before_month += 1;
    }

    return static_cast<f64>(date.year)
         + (static_cast<f64>(days_before_month) + date.decimal_day)
         / static_cast<f64>(leap ? 366 : 365);
}

f64 Calendar::decimal_day(const DayOfMonth& day)
{
    return static_cast<f64>(day.day)
         + static_cast<f64>(day.hour) / 24.0
         + static_cast<f64>(day.minute) / 1440.0
         + day.second / astro_constants::kSecondsPerDay
         - day.time_zone_hours / 24.0;
}

f64 Calendar::julian_ephemeris_day(f64 jd, f64 delta_t_seconds)
{
    return jd + delta_t_seconds / astro_constants::kSecondsPerDay;
}

} // namespace almanac::astro
