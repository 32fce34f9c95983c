#pragma once

/// @file lunar.hpp
/// @brief Parallax and apparent size of the Moon.

#include "core/types.hpp"

namespace almanac::astro
{
    /// @brief Static utility class for Moon distance-dependent quantities.
    class Lunar
    {
    public:
        Lunar() = delete;

        /// @brief Equatorial horizontal parallax π = asin(6378.14 / Δ).
        /// @param earth_moon_km Distance between the centers of Earth and Moon (km).
        [[nodiscard]] static f64 horizontal_parallax(f64 earth_moon_km);

        /// @brief Geocentric semidiameter s = asin(k sin π), k = 0.272481.
        [[nodiscard]] static f64 semidiameter(f64 earth_moon_km);
    };

} // namespace almanac::astro
