#pragma once

/// @file coordinates.hpp
/// @brief Astronomical coordinate transforms: ecliptic, equatorial, horizontal, precession.

#include "core/types.hpp"

namespace darksky::astro
{
    /// @brief Equatorial coordinate.
    struct EquatorialCoord
    {
        f64 ra;     ///< Right ascension (radians, 0..2π)
        f64 dec;    ///< Declination (radians, -π/2..+π/2)
    };

    /// @brief Ecliptic coordinate (of date).
    struct EclipticCoord
    {
        f64 lon;    ///< Ecliptic longitude (radians, 0..2π)
        f64 lat;    ///< Ecliptic latitude (radians)
    };

    /// @brief Horizontal (topocentric) coordinate.
    struct HorizontalCoord
    {
        f64 alt;    ///< Altitude (radians, -π/2..+π/2, negative = below horizon)
        f64 az;     ///< Azimuth (radians, 0..2π, 0=North, π/2=East)
    };

    /// @brief Observer geographic location.
    struct ObserverLocation
    {
        f64 latitude_rad;   ///< Geographic latitude (radians, north positive)
        f64 longitude_rad;  ///< Geographic longitude (radians, east positive)
    };

    /// @brief Static utility class for astronomical coordinate transformations.
    ///
    /// All angular inputs and outputs are in radians.
    /// Double precision (f64) is used throughout for arcsecond-level accuracy.
    class Coordinates
    {
    public:
        Coordinates() = delete;

        /// @brief Equatorial (RA/Dec of date) → Horizontal (Alt/Az).
        /// @param eq Equatorial coordinates of the object.
        /// @param observer Observer geographic location.
        /// @param local_sidereal_time_rad Local Sidereal Time (radians).
        /// @return Geometric horizontal coordinates (no refraction).
        [[nodiscard]] static HorizontalCoord equatorial_to_horizontal(
            const EquatorialCoord& eq,
            const ObserverLocation& observer,
            f64 local_sidereal_time_rad
        );

        /// @brief Ecliptic (of date) → Equatorial (of date) for a given obliquity.
        [[nodiscard]] static EquatorialCoord ecliptic_to_equatorial(
            const EclipticCoord& ecl,
            f64 obliquity_rad
        );

        /// @brief Precess J2000.0 mean coordinates to the mean equinox of a date.
        /// Rigorous method of Meeus, Astronomical Algorithms Ch. 21.
        /// @param jd_tt Target epoch as Julian Ephemeris Date.
        [[nodiscard]] static EquatorialCoord precess_from_j2000(
            const EquatorialCoord& j2000,
            f64 jd_tt
        );

        /// @brief Hour angle LST - RA, normalized to (-π, π].
        [[nodiscard]] static f64 hour_angle(f64 local_sidereal_time_rad, f64 ra);

        /// @brief Atmospheric refraction for a geometric (true) altitude.
        ///
        /// Saemundsson (1986) at 1010 hPa and 15 °C. Returns 0 well below the
        /// horizon where the formula diverges.
        [[nodiscard]] static f64 refraction(f64 true_alt_rad);

        /// @brief Geocentric → topocentric altitude for a body with the given
        /// equatorial horizontal parallax.
        [[nodiscard]] static f64 topocentric_altitude(f64 geocentric_alt_rad, f64 horizontal_parallax_rad);

    private:
        /// @brief Normalize an angle to the range [0, 2π).
        [[nodiscard]] static f64 normalize_radians(f64 angle);
    };

} // namespace darksky::astro
