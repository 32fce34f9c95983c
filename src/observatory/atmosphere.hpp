#pragma once
// observatory/atmosphere.hpp - Atmospheric refraction for ground-based observing
//
// Models:
//  - Bennett (1982), refraction from apparent altitude
//  - Saemundsson (1986), refraction from true altitude
//  - Meeus 16.1 series, apparent altitudes above 15°
//  - Pressure and temperature scaling of all of the above

#include "core/types.hpp"

#include <algorithm>
#include <cmath>

namespace almanac {

// -----------------------------------------------------------------------
// AtmosphericConditions - snapshot of atmospheric state at the observer
// -----------------------------------------------------------------------
struct AtmosphericConditions {
    f64 pressure_hPa{1010.0};     ///< Atmospheric pressure [hPa]
    f64 temperature_c{10.0};      ///< Air temperature [°C]

    /// Scale factor relative to the standard 1010 hPa / 10 °C atmosphere.
    [[nodiscard]] f64 refraction_factor() const {
        return (pressure_hPa / 1010.0) * (283.0 / (273.0 + temperature_c));
    }
};

// -----------------------------------------------------------------------
// AtmosphericModel - refraction corrections, all angles in radians
// -----------------------------------------------------------------------
class AtmosphericModel {
public:
    /// Below this altitude the low-altitude fits diverge; refraction is reported as 0.
    static constexpr f64 kMinAltitudeDeg = -1.0;

    explicit AtmosphericModel(const AtmosphericConditions& cond = {})
        : m_cond(cond) {}

    const AtmosphericConditions& conditions() const { return m_cond; }
    AtmosphericConditions& conditions() { return m_cond; }

    // -----------------------------------------------------------------------
    // Bennett: R = cot(h0 + 7.31 / (h0 + 4.4))   [arcmin, h0 in degrees]
    // Subtract from the apparent altitude h0 to get the true altitude.
    // -----------------------------------------------------------------------
    [[nodiscard]] f64 refraction_from_apparent_altitude(f64 apparent_alt) const {
        const f64 h0 = apparent_alt * astro_constants::kRadToDeg;
        if (h0 < kMinAltitudeDeg) return 0.0;

        const f64 r_arcmin = 1.0 / std::tan((h0 + 7.31 / (h0 + 4.4)) * astro_constants::kDegToRad);
        return scaled_arcmin(r_arcmin);
    }

    // -----------------------------------------------------------------------
    // Saemundsson: R = 1.02 cot(h + 10.3 / (h + 5.11))   [arcmin, h in degrees]
    // Add to the true altitude h to get the apparent altitude.
    // -----------------------------------------------------------------------
    [[nodiscard]] f64 refraction_from_true_altitude(f64 true_alt) const {
        const f64 h = true_alt * astro_constants::kRadToDeg;
        if (h < kMinAltitudeDeg) return 0.0;

        const f64 r_arcmin = 1.02 / std::tan((h + 10.3 / (h + 5.11)) * astro_constants::kDegToRad);
        return scaled_arcmin(r_arcmin);
    }

    // -----------------------------------------------------------------------
    // Meeus 16.1: R = 58.294″ tan z − 0.0668″ tan³ z,  z = 90° − h0
    // Only meaningful for apparent altitudes above 15°.
    // -----------------------------------------------------------------------
    [[nodiscard]] f64 refraction_above_15_degrees(f64 apparent_alt) const {
        const f64 tan_z = std::tan(astro_constants::kHalfPi - apparent_alt);
        const f64 r_arcsec = 58.294 * tan_z - 0.0668 * tan_z * tan_z * tan_z;
        return std::max(r_arcsec * m_cond.refraction_factor(), 0.0) * astro_constants::kArcSecToRad;
    }

private:
    f64 scaled_arcmin(f64 r_arcmin) const {
        const f64 r_arcsec = r_arcmin * 60.0 * m_cond.refraction_factor();
        return std::max(r_arcsec, 0.0) * astro_constants::kArcSecToRad;
    }

    AtmosphericConditions m_cond;
};

} // namespace almanac
