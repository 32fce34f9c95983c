// src/main.cpp - Almanac command-line entry point
//
// Usage: almanac [YYYY MM DD.ddd]
//
// For the given civil date (default J2000.0, 2000-01-01.5 TT):
//  1. Julian day, weekday and decimal year
//  2. ΔT and Julian Ephemeris Day
//  3. Nutation, obliquity and sidereal time
//  4. A sample star carried through every coordinate system
//  5. Refraction and lunar quantities for that star / epoch

#include "astro/angle.hpp"
#include "astro/calendar.hpp"
#include "astro/coordinates.hpp"
#include "astro/earth.hpp"
#include "astro/ecliptic.hpp"
#include "astro/lunar.hpp"
#include "astro/nutation.hpp"
#include "astro/time_system.hpp"
#include "core/logger.hpp"
#include "observatory/atmosphere.hpp"

#include <charconv>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string_view>

using namespace almanac;
using namespace almanac::astro;

namespace {

constexpr std::string_view kWeekdayNames[] = {
    "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday",
};

// Pollux (β Gem), apparent place used by Meeus example 13.a
constexpr f64 kSampleRaDeg  = 116.328942;
constexpr f64 kSampleDecDeg = 28.026183;

// Observer: U.S. Naval Observatory, Washington (longitude west positive)
constexpr f64 kObserverLongDeg = 77.0 + 3.0 / 60.0 + 56.0 / 3600.0;
constexpr f64 kObserverLatDeg  = 38.0 + 55.0 / 60.0 + 17.0 / 3600.0;

constexpr f64 kMeanEarthMoonKm = 384400.0;

template <typename T>
std::optional<T> parse_number(std::string_view text) {
    T value{};
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) return std::nullopt;
    return value;
}

std::optional<CivilDate> parse_date(int argc, char** argv) {
    if (argc == 1) {
        return CivilDate{
            .year = 2000,
            .month = Month::January,
            .decimal_day = 1.5,
            .calendar = CalendarKind::Gregorian,
        };
    }
    if (argc != 4) {
        ALM_ERROR("Expected 0 or 3 arguments (YYYY MM DD.ddd), got {}", argc - 1);
        return std::nullopt;
    }

    const auto year  = parse_number<i32>(argv[1]);
    const auto month = parse_number<i32>(argv[2]);
    const auto day   = parse_number<f64>(argv[3]);
    if (!year || !month || !day) {
        ALM_ERROR("Could not parse date '{} {} {}'", argv[1], argv[2], argv[3]);
        return std::nullopt;
    }

    const auto m = month_from_ordinal(*month);
    if (!m) {
        ALM_ERROR("Month {} out of range 1..12", *month);
        return std::nullopt;
    }
    if (*day < 1.0 || *day >= 32.0) {
        ALM_ERROR("Day {} out of range [1, 32)", *day);
        return std::nullopt;
    }

    // Dates before the 1582 reform are read as Julian calendar dates
    const bool gregorian = *year > 1582
                        || (*year == 1582 && (*month > 10 || (*month == 10 && *day >= 15.0)));

    return CivilDate{
        .year = *year,
        .month = *m,
        .decimal_day = *day,
        .calendar = gregorian ? CalendarKind::Gregorian : CalendarKind::Julian,
    };
}

void print_angle(std::string_view label, f64 radians) {
    std::cout << "  " << std::left << std::setw(28) << label << std::right
              << std::setw(14) << std::setprecision(6) << radians * astro_constants::kRadToDeg
              << " deg\n";
}

} // namespace

int main(int argc, char** argv) {
    core::Logger::init();

    const auto date = parse_date(argc, argv);
    if (!date) {
        core::Logger::shutdown();
        return EXIT_FAILURE;
    }

    std::cout << std::fixed;
    std::cout << "================================================================\n"
              << "  ALMANAC - Calendrical & Celestial Coordinate Engine\n"
              << "================================================================\n\n";

    // -----------------------------------------------------------------------
    // 1. Calendar
    // -----------------------------------------------------------------------
    const f64 jd = Calendar::julian_day(*date);
    const Weekday weekday = Calendar::weekday(*date);

    std::cout << "Date: " << date->year << "-" << month_ordinal(date->month) << "-"
              << std::setprecision(4) << date->decimal_day
              << (date->calendar == CalendarKind::Gregorian ? " (Gregorian)\n" : " (Julian)\n")
              << "  Julian day                  " << std::setprecision(5) << jd << "\n"
              << "  Weekday                     "
              << kWeekdayNames[static_cast<std::size_t>(weekday)] << "\n"
              << "  Decimal year                " << std::setprecision(6)
              << Calendar::decimal_year(*date) << "\n";

    const auto back = Calendar::date_from_julian_day(jd);
    if (back) {
        std::cout << "  Date from Julian day        " << back->year << "-"
                  << month_ordinal(back->month) << "-" << std::setprecision(4)
                  << back->decimal_day << "\n";
    } else {
        ALM_WARN("Julian day {} has no calendar date", jd);
    }

    // -----------------------------------------------------------------------
    // 2. Time scales
    // -----------------------------------------------------------------------
    const f64 delta_t = TimeSystem::delta_t(date->year, date->month);
    const f64 jde = Calendar::julian_ephemeris_day(jd, delta_t);

    std::cout << "\nTime scales\n"
              << "  Delta T                     " << std::setprecision(3) << delta_t << " s\n"
              << "  Julian Ephemeris Day        " << std::setprecision(5) << jde << "\n"
              << "  Julian centuries (J2000)    " << std::setprecision(9)
              << TimeSystem::julian_centuries(jde) << "\n";

    // -----------------------------------------------------------------------
    // 3. Earth orientation
    // -----------------------------------------------------------------------
    const Nutation nutation = Nutation::compute(jde);
    const f64 true_obliquity = Ecliptic::true_obliquity(jde);
    const f64 gmst = TimeSystem::mean_sidereal(jd);
    const f64 gast = TimeSystem::apparent_sidereal(gmst, nutation.longitude, true_obliquity);

    std::cout << "\nEarth orientation\n";
    print_angle("Nutation in longitude", nutation.longitude);
    print_angle("Nutation in obliquity", nutation.obliquity);
    print_angle("Mean obliquity (Laskar)", Ecliptic::mean_obliquity_laskar(jde));
    print_angle("Mean obliquity (IAU 1980)", Ecliptic::mean_obliquity_iau(jde));
    print_angle("True obliquity", true_obliquity);
    print_angle("Mean sidereal time", gmst);
    print_angle("Apparent sidereal time", Angle::normalize_two_pi(gast));

    // -----------------------------------------------------------------------
    // 4. Sample star through each frame
    // -----------------------------------------------------------------------
    const EquatorialCoord star{
        .ra = kSampleRaDeg * astro_constants::kDegToRad,
        .dec = kSampleDecDeg * astro_constants::kDegToRad,
    };
    const f64 observer_long = kObserverLongDeg * astro_constants::kDegToRad;
    const f64 observer_lat = kObserverLatDeg * astro_constants::kDegToRad;

    const EclipticCoord ecl = Coordinates::ecliptic_from_equatorial(star, true_obliquity);
    const f64 hour_angle = Coordinates::hour_angle_from_longitude(gast, observer_long, star.ra);
    const HorizontalCoord hz = Coordinates::horizontal_from_equatorial(hour_angle, star.dec, observer_lat);
    const GalacticCoord gal = Coordinates::galactic_from_equatorial(star);

    std::cout << "\nSample star (RA " << std::setprecision(6) << kSampleRaDeg
              << ", Dec " << kSampleDecDeg << ")\n";
    print_angle("Ecliptic longitude", Angle::normalize_two_pi(ecl.longitude));
    print_angle("Ecliptic latitude", ecl.latitude);
    print_angle("Hour angle (USNO)", Angle::normalize_two_pi(hour_angle));
    print_angle("Azimuth (from South)", Angle::normalize_two_pi(hz.azimuth));
    print_angle("Altitude", hz.altitude);
    print_angle("Galactic longitude", Angle::normalize_two_pi(gal.longitude));
    print_angle("Galactic latitude", gal.latitude);

    // -----------------------------------------------------------------------
    // 5. Corrections
    // -----------------------------------------------------------------------
    const AtmosphericModel atmosphere;
    std::cout << "\nCorrections\n";
    if (hz.altitude > 0.0) {
        print_angle("Refraction at altitude", atmosphere.refraction_from_true_altitude(hz.altitude));
    } else {
        std::cout << "  Star is below the horizon\n";
    }
    print_angle("Moon horizontal parallax", Lunar::horizontal_parallax(kMeanEarthMoonKm));
    print_angle("Moon semidiameter", Lunar::semidiameter(kMeanEarthMoonKm));
    std::cout << "  Radius of parallel (USNO)   " << std::setprecision(3)
              << Earth::radius_of_parallel(observer_lat) << " km\n";

    ALM_INFO("Computed almanac for JD {:.5f}", jd);
    core::Logger::shutdown();
    return EXIT_SUCCESS;
}
