#pragma once

/// @file coordinates.hpp
/// @brief Astronomical coordinate transforms: Equatorial, Ecliptic, Horizontal, Galactic.

#include "core/types.hpp"

namespace almanac::astro
{
    /// @brief Equatorial coordinate (equinox of the caller's choosing).
    struct EquatorialCoord
    {
        f64 ra;     ///< Right ascension (radians)
        f64 dec;    ///< Declination (radians, -π/2..+π/2)

        /// @brief Great-circle separation from another equatorial position (radians).
        [[nodiscard]] f64 angular_separation(const EquatorialCoord& other) const;
    };

    /// @brief Ecliptic coordinate.
    struct EclipticCoord
    {
        f64 longitude;  ///< Ecliptic longitude λ (radians)
        f64 latitude;   ///< Ecliptic latitude β (radians)

        [[nodiscard]] f64 angular_separation(const EclipticCoord& other) const;
    };

    /// @brief Horizontal (topocentric) coordinate.
    ///
    /// Azimuth follows Meeus: measured westward from the South, so
    /// 0 = South, π/2 = West, π = North.
    struct HorizontalCoord
    {
        f64 azimuth;    ///< Azimuth (radians, from South, westward positive)
        f64 altitude;   ///< Altitude (radians, negative = below horizon)
    };

    /// @brief Galactic coordinate, System II, tied to equinox B1950.0.
    struct GalacticCoord
    {
        f64 longitude;  ///< Galactic longitude l (radians)
        f64 latitude;   ///< Galactic latitude b (radians)
    };

    /// @brief Point on the Earth's surface.
    struct GeographicCoord
    {
        f64 longitude;  ///< Geographic longitude (radians, west positive as in Meeus)
        f64 latitude;   ///< Geographic latitude (radians, north positive)

        [[nodiscard]] f64 angular_separation(const GeographicCoord& other) const;
    };

    /// @brief Local hour angle with declination.
    struct HourAngleDeclination
    {
        f64 hour_angle;  ///< Hour angle (radians, westward from the meridian)
        f64 dec;         ///< Declination (radians)
    };

    /// @brief Declination formula used by Coordinates::equatorial_from_horizontal.
    enum class DeclinationFormula
    {
        /// sin δ = sin φ sin h − cos φ cos h cos A (Meeus 13.6 inverse).
        Meeus,
        /// sin δ = sin φ sin h − cos φ cos² A, the expression shipped by the
        /// library this code replaces. It is not the inverse of
        /// horizontal_from_equatorial and exists only to reproduce its output.
        LegacySquaredAzimuth,
    };

    /// @brief Static utility class for astronomical coordinate transformations.
    ///
    /// All angular inputs and outputs are in radians. Each forward transform
    /// has an inverse here; both coordinates of a pair are always computed
    /// together from the same input. Longitude-like outputs come straight
    /// from atan2 and are not normalized; use Angle::normalize_two_pi.
    class Coordinates
    {
    public:
        Coordinates() = delete;

        /// @brief Equatorial → Ecliptic.
        /// @param obliquity True obliquity if eq is corrected for nutation,
        ///        mean obliquity otherwise.
        [[nodiscard]] static EclipticCoord ecliptic_from_equatorial(
            const EquatorialCoord& eq,
            f64 obliquity
        );

        /// @brief Ecliptic → Equatorial.
        /// @param obliquity True obliquity if ecl is corrected for nutation,
        ///        mean obliquity otherwise.
        [[nodiscard]] static EquatorialCoord equatorial_from_ecliptic(
            const EclipticCoord& ecl,
            f64 obliquity
        );

        /// @brief Equatorial (hour angle / Dec) → Horizontal.
        /// @param hour_angle Local hour angle of the object.
        /// @param dec Declination of the object.
        /// @param observer_lat Observer geographic latitude.
        [[nodiscard]] static HorizontalCoord horizontal_from_equatorial(
            f64 hour_angle,
            f64 dec,
            f64 observer_lat
        );

        /// @brief Horizontal → Equatorial (hour angle / Dec).
        /// @param hz Horizontal coordinates of the object.
        /// @param observer_lat Observer geographic latitude.
        /// @param formula Declination formula; there is deliberately no default.
        [[nodiscard]] static HourAngleDeclination equatorial_from_horizontal(
            const HorizontalCoord& hz,
            f64 observer_lat,
            DeclinationFormula formula
        );

        /// @brief Equatorial (B1950.0) → Galactic.
        [[nodiscard]] static GalacticCoord galactic_from_equatorial(const EquatorialCoord& eq_b1950);

        /// @brief Galactic → Equatorial (B1950.0).
        [[nodiscard]] static EquatorialCoord equatorial_from_galactic(const GalacticCoord& gal);

        /// @brief Hour angle from Greenwich sidereal time and observer longitude.
        /// @param greenwich_sidereal Greenwich sidereal time (mean or apparent).
        /// @param observer_long Observer longitude, west positive.
        /// @param ra Right ascension.
        [[nodiscard]] static f64 hour_angle_from_longitude(
            f64 greenwich_sidereal,
            f64 observer_long,
            f64 ra
        );

        /// @brief Hour angle from local sidereal time.
        [[nodiscard]] static f64 hour_angle_from_local_sidereal(f64 local_sidereal, f64 ra);
    };

} // namespace almanac::astro
