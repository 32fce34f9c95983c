/// @file binary_star.cpp

#include "astro/binary_star.hpp"

#include "astro/angle.hpp"

#include <cmath>

namespace almanac::astro
{

f64 BinaryStar::mean_annual_motion(f64 period_years)
{
    return astro_constants::kTwoPi / period_years;
}

f64 BinaryStar::mean_anomaly(f64 mean_motion, f64 t, f64 t_periastron)
{
    return mean_motion * (t - t_periastron);
}

f64 BinaryStar::radius_vector(f64 semimajor_axis, f64 e, f64 eccentric_anomaly)
{
    return semimajor_axis * (1.0 - e * std::cos(eccentric_anomaly));
}

// tan(ν/2) = √((1 + e) / (1 − e)) tan(E/2)
f64 BinaryStar::true_anomaly(f64 e, f64 eccentric_anomaly)
{
    return 2.0 * std::atan(std::sqrt((1.0 + e) / (1.0 - e)) * std::tan(eccentric_anomaly * 0.5));
}

// -----------------------------------------------------------------
// tan(θ − Ω) = sin(ν + ω) cos i / cos(ν + ω)
// ρ = r √(sin²(ν + ω) cos² i + cos²(ν + ω))
// -----------------------------------------------------------------

f64 BinaryStar::apparent_position_angle(f64 ascending_node,
                                        f64 true_anom,
                                        f64 periastron_long,
                                        f64 inclination)
{
    const f64 u = true_anom + periastron_long;
    const f64 x = std::atan2(std::sin(u) * std::cos(inclination), std::cos(u));

    return Angle::normalize_two_pi(x + ascending_node);
}

f64 BinaryStar::angular_separation(f64 radius_vec,
                                   f64 true_anom,
                                   f64 periastron_long,
                                   f64 inclination)
{
    const f64 u = true_anom + periastron_long;
    const f64 projected_sin = std::sin(u) * std::cos(inclination);
    const f64 cos_u = std::cos(u);

    return radius_vec * std::sqrt(projected_sin * projected_sin + cos_u * cos_u);
}

// -----------------------------------------------------------------
// A = (1 − e² cos² ω) cos² i
// B = e² sin ω cos ω cos i
// C = 1 − e² sin² ω
// D = √((A − C)² + 4B²)
// e'² = 2D / (A + C + D)
// -----------------------------------------------------------------

f64 BinaryStar::eccentricity_of_apparent_orbit(f64 e, f64 periastron_long, f64 inclination)
{
    const f64 cos_i = std::cos(inclination);
    const f64 e_cos_w = e * std::cos(periastron_long);
    const f64 e_sin_w = e * std::sin(periastron_long);

    const f64 a = (1.0 - e_cos_w * e_cos_w) * cos_i * cos_i;
    const f64 b = e_sin_w * e_cos_w * cos_i;
    const f64 c = 1.0 - e_sin_w * e_sin_w;
    const f64 d = std::sqrt((a - c) * (a - c) + 4.0 * b * b);

    return std::sqrt(2.0 * d / (a + c + d));
}

} // namespace almanac::astro
