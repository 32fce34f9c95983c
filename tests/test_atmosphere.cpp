// tests/test_atmosphere.cpp
#include "test_main.hpp"
#include "observatory/atmosphere.hpp"
#include <cmath>

using namespace almanac;

int testAtmosphere() {
    constexpr f64 kDeg    = astro_constants::kDegToRad;
    constexpr f64 kArcsec = astro_constants::kArcSecToRad;

    AtmosphericModel standard;

    // -----------------------------------------------------------------------
    // Standard atmosphere: 1010 hPa, 10 C -> factor 1
    // -----------------------------------------------------------------------
    test::checkNear(standard.conditions().refraction_factor(), 1.0, 1e-12,
                    "standard conditions scale by 1");

    // -----------------------------------------------------------------------
    // Bennett (apparent altitude)
    // -----------------------------------------------------------------------
    test::checkNear(standard.refraction_from_apparent_altitude(0.5 * kDeg) / kArcsec,
                    28.7537 * 60.0, 0.01, "Bennett at h0 = 0.5 deg");
    test::checkNear(standard.refraction_from_apparent_altitude(45.0 * kDeg) / kArcsec,
                    59.69, 0.01, "Bennett at h0 = 45 deg");
    test::checkNear(standard.refraction_from_apparent_altitude(astro_constants::kHalfPi), 0.0, 1e-12,
                    "Bennett clamps to 0 at the zenith");

    // -----------------------------------------------------------------------
    // Saemundsson (true altitude)
    // -----------------------------------------------------------------------
    test::checkNear(standard.refraction_from_true_altitude(0.5 * kDeg) / kArcsec,
                    25.0039 * 60.0, 0.01, "Saemundsson at h = 0.5 deg");
    test::check(standard.refraction_from_true_altitude(10.0 * kDeg)
                > standard.refraction_from_true_altitude(30.0 * kDeg),
                "refraction decreases with altitude");

    // Bennett and Saemundsson are near-inverses: R(h0) ~ R(h0 - R(h0))
    const f64 h0 = 5.0 * kDeg;
    const f64 r_app = standard.refraction_from_apparent_altitude(h0);
    const f64 r_true = standard.refraction_from_true_altitude(h0 - r_app);
    test::checkNear(r_true / kArcsec, r_app / kArcsec, 6.0,
                    "Bennett and Saemundsson agree at 5 deg");

    // -----------------------------------------------------------------------
    // Meeus 16.1 series above 15 deg
    // -----------------------------------------------------------------------
    test::checkNear(standard.refraction_above_15_degrees(45.0 * kDeg) / kArcsec,
                    58.2272, 1e-4, "series at 45 deg");
    test::checkNear(standard.refraction_above_15_degrees(20.0 * kDeg) / kArcsec,
                    158.776, 1e-3, "series at 20 deg");
    test::checkNear(standard.refraction_above_15_degrees(45.0 * kDeg),
                    standard.refraction_from_apparent_altitude(45.0 * kDeg), 2.0 * kArcsec,
                    "series agrees with Bennett at 45 deg");

    // -----------------------------------------------------------------------
    // Below the horizon limit
    // -----------------------------------------------------------------------
    test::checkNear(standard.refraction_from_apparent_altitude(-3.0 * kDeg), 0.0, 1e-15,
                    "no refraction below -1 deg (apparent)");
    test::checkNear(standard.refraction_from_true_altitude(-3.0 * kDeg), 0.0, 1e-15,
                    "no refraction below -1 deg (true)");

    // -----------------------------------------------------------------------
    // Pressure and temperature
    // -----------------------------------------------------------------------
    AtmosphericConditions high;
    high.pressure_hPa  = 2020.0;
    high.temperature_c = 10.0;
    AtmosphericModel dense(high);
    test::checkNear(dense.refraction_from_true_altitude(10.0 * kDeg),
                    2.0 * standard.refraction_from_true_altitude(10.0 * kDeg), 1e-12,
                    "refraction scales linearly with pressure");

    AtmosphericConditions cold;
    cold.temperature_c = -10.0;
    AtmosphericModel winter(cold);
    test::checkNear(winter.refraction_above_15_degrees(30.0 * kDeg),
                    standard.refraction_above_15_degrees(30.0 * kDeg) * 283.0 / 263.0, 1e-12,
                    "cold air refracts more");

    winter.conditions().temperature_c = 10.0;
    test::checkNear(winter.refraction_from_apparent_altitude(10.0 * kDeg),
                    standard.refraction_from_apparent_altitude(10.0 * kDeg), 1e-15,
                    "conditions can be updated in place");

    return 0;
}
