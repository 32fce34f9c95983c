/// @file test_time_system.cpp
/// @brief Unit tests for almanac::astro::TimeSystem, Nutation and Ecliptic.
///
/// Verifies ΔT across every era boundary, GMST (IAU 1982), apparent
/// sidereal time and the obliquity of the ecliptic against Meeus.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/angle.hpp"
#include "astro/ecliptic.hpp"
#include "astro/nutation.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <cmath>

using namespace almanac;
using namespace almanac::astro;

// =================================================================
// Tolerance constants
// =================================================================

static constexpr f64 kAngleTolDeg   = 1e-6;   // Degrees
static constexpr f64 kDeltaTTol     = 0.05;   // Seconds
static constexpr f64 kArcSecTol     = 0.01;   // Arcseconds

static f64 to_deg(f64 radians)
{
    return radians * astro_constants::kRadToDeg;
}

static f64 to_arcsec(f64 radians)
{
    return radians / astro_constants::kArcSecToRad;
}

// =================================================================
// Julian centuries
// =================================================================

TEST_CASE("Julian centuries at J2000.0 is 0.0")
{
    CHECK(TimeSystem::julian_centuries(astro_constants::kJ2000) == 0.0);
    CHECK(TimeSystem::julian_millennia(astro_constants::kJ2000) == 0.0);
}

TEST_CASE("Julian centuries at J2100.0")
{
    const f64 jd_2100 = astro_constants::kJ2000 + astro_constants::kDaysPerJulianCentury;
    CHECK(TimeSystem::julian_centuries(jd_2100) == doctest::Approx(1.0));
    CHECK(TimeSystem::julian_millennia(jd_2100) == doctest::Approx(0.1));
}

// =================================================================
// ΔT
// =================================================================

TEST_CASE("Delta T reference values")
{
    CHECK(std::abs(TimeSystem::delta_t(2000, Month::January) - 63.874) < kDeltaTTol);
    CHECK(std::abs(TimeSystem::delta_t(1950, Month::January) - 29.087) < kDeltaTTol);
    CHECK(std::abs(TimeSystem::delta_t(1900, Month::January) - (-2.728)) < kDeltaTTol);
    CHECK(std::abs(TimeSystem::delta_t(1820, Month::January) - 11.853) < kDeltaTTol);
    CHECK(std::abs(TimeSystem::delta_t(1000, Month::January) - 1573.968) < kDeltaTTol);
    CHECK(std::abs(TimeSystem::delta_t(0, Month::January) - 10583.177) < kDeltaTTol);
    CHECK(std::abs(TimeSystem::delta_t(-1000, Month::January) - 25426.928) < kDeltaTTol);
    CHECK(std::abs(TimeSystem::delta_t(2200, Month::January) - 442.181) < kDeltaTTol);
}

TEST_CASE("Delta T is nearly continuous across each era boundary")
{
    // December of the previous year vs. January of the threshold year.
    // The published fits do not join exactly; the largest step is
    // about 1.4 s at -500 and well under 1 s everywhere after 500.
    struct Boundary
    {
        i32 year;
        f64 max_jump;
    };

    const Boundary boundaries[] = {
        {-500, 1.5}, {500, 1.0}, {1600, 0.4}, {1700, 0.2}, {1800, 0.1},
        {1860, 0.1}, {1900, 0.1}, {1920, 0.1}, {1941, 0.1}, {1961, 0.1},
        {1986, 0.1}, {2005, 0.1}, {2050, 0.2}, {2150, 0.25},
    };

    for (const auto& b : boundaries)
    {
        const f64 before = TimeSystem::delta_t(b.year - 1, Month::December);
        const f64 after  = TimeSystem::delta_t(b.year, Month::January);

        CAPTURE(b.year);
        CAPTURE(before);
        CAPTURE(after);
        CHECK(std::abs(after - before) < b.max_jump);
    }
}

TEST_CASE("Delta T uses the month to place the year fraction")
{
    // 1900-1920 is rising steeply, so June lies above January
    CHECK(TimeSystem::delta_t(1910, Month::June) > TimeSystem::delta_t(1910, Month::January));
}

// =================================================================
// Sidereal time
// =================================================================

TEST_CASE("GMST at J2000.0 ≈ 280.46061837°")
{
    const f64 gmst = TimeSystem::mean_sidereal(astro_constants::kJ2000);
    CHECK(std::abs(to_deg(gmst) - 280.46061837) < kAngleTolDeg);
}

TEST_CASE("GMST 1987 April 10, 0h UT = 13h10m46.3668s")
{
    const f64 gmst = TimeSystem::mean_sidereal(2446895.5);
    CHECK(std::abs(to_deg(gmst) - 197.693195) < kAngleTolDeg);
}

TEST_CASE("GMST 1987 April 10, 19h21m00s UT = 128.7378734°")
{
    const f64 gmst = TimeSystem::mean_sidereal(2446896.30625);
    CHECK(std::abs(to_deg(gmst) - 128.7378734) < kAngleTolDeg);
}

TEST_CASE("GMST is in range [0, 2π)")
{
    for (f64 jd = 2400000.5; jd < 2500000.0; jd += 7777.77)
    {
        const f64 gmst = TimeSystem::mean_sidereal(jd);
        CHECK(gmst >= 0.0);
        CHECK(gmst < astro_constants::kTwoPi);
    }
}

TEST_CASE("Mean sidereal time advances about 360.9856° per day")
{
    const f64 jd = 2451545.0;
    const f64 step = Angle::normalize_two_pi(TimeSystem::mean_sidereal(jd + 1.0)
                                           - TimeSystem::mean_sidereal(jd));

    CHECK(std::abs(to_deg(step) - 0.98564736629) < 1e-6);
}

TEST_CASE("Apparent sidereal time applies the equation of the equinoxes")
{
    // Δψ = -3.788", ε = 23°26'36.85"
    const f64 gmst = TimeSystem::mean_sidereal(2446895.5);
    const f64 dpsi = -3.788 * astro_constants::kArcSecToRad;
    const f64 eps  = Angle::dms_to_degrees(23, 26, 36.85) * astro_constants::kDegToRad;

    const f64 gast = TimeSystem::apparent_sidereal(gmst, dpsi, eps);

    // 13h10m46.1351s
    CHECK(std::abs(to_deg(gast) - 197.692230) < 2e-6);
}

TEST_CASE("Apparent sidereal time from JD stays within 1.2s of GMST")
{
    const f64 jd = 2446895.5;
    const f64 diff = TimeSystem::apparent_sidereal(jd) - TimeSystem::mean_sidereal(jd);

    // Equation of the equinoxes never exceeds ~1.2 s of time (18")
    CHECK(std::abs(to_arcsec(diff)) < 18.0);
    CHECK(diff < 0.0);
}

// =================================================================
// Nutation and obliquity
// =================================================================

TEST_CASE("Nutation 1987 April 10, 0h TD")
{
    const Nutation nutation = Nutation::compute(2446895.5);

    // Full theory: Δψ = -3.788", Δε = +9.443"; abbreviated series is good to 0.5" / 0.1"
    CHECK(std::abs(to_arcsec(nutation.longitude) - (-3.788)) < 0.5);
    CHECK(std::abs(to_arcsec(nutation.obliquity) - 9.443) < 0.1);
}

TEST_CASE("Mean obliquity at J2000.0 is 23°26'21.448\"")
{
    const f64 laskar = Ecliptic::mean_obliquity_laskar(astro_constants::kJ2000);
    const f64 iau    = Ecliptic::mean_obliquity_iau(astro_constants::kJ2000);

    CHECK(std::abs(to_deg(laskar) - 23.4392911) < 1e-7);
    CHECK(std::abs(to_deg(iau) - 23.4392911) < 1e-7);
}

TEST_CASE("Mean obliquity 1987 April 10 = 23°26'27.407\"")
{
    const f64 laskar = Ecliptic::mean_obliquity_laskar(2446895.5);
    const f64 iau    = Ecliptic::mean_obliquity_iau(2446895.5);

    CHECK(std::abs(to_arcsec(laskar) - 84387.407) < kArcSecTol);
    CHECK(std::abs(to_arcsec(iau) - 84387.407) < kArcSecTol);
}

TEST_CASE("Laskar and IAU obliquity diverge far from J2000")
{
    // Year -3000: the cubic drifts from the Laskar series by about 18"
    const f64 jd = astro_constants::kJ2000 - 50.0 * astro_constants::kDaysPerJulianCentury;
    const f64 diff = Ecliptic::mean_obliquity_laskar(jd) - Ecliptic::mean_obliquity_iau(jd);

    CHECK(std::abs(to_arcsec(diff)) > 0.1);
}

TEST_CASE("True obliquity adds nutation in obliquity")
{
    const f64 jd = 2446895.5;
    const f64 expected = Ecliptic::mean_obliquity_laskar(jd) + Nutation::compute(jd).obliquity;

    CHECK(Ecliptic::true_obliquity(jd) == doctest::Approx(expected));
}
