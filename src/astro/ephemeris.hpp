#pragma once

/// @file ephemeris.hpp
/// @brief Low-precision positions of the Sun, the Moon and the Galactic Center.

#include "astro/coordinates.hpp"
#include "core/types.hpp"

#include <string_view>

namespace darksky::astro
{
    /// @brief Celestial objects the forecast tracks.
    enum class Body
    {
        Sun,
        Moon,
        GalacticCenter,   ///< Sgr A* region, 17h58m03.47s −26°06′04.6″ (J2000)
    };

    [[nodiscard]] std::string_view body_name(Body body);

    /// @brief Geocentric apparent place of a body at one instant.
    struct BodyPosition
    {
        EquatorialCoord equatorial;     ///< RA/Dec of date (radians)
        f64 horizontal_parallax;        ///< Equatorial horizontal parallax (radians, 0 for stars)
        f64 semi_diameter;              ///< Angular semi-diameter (radians, 0 for stars)
    };

    /// @brief Static ephemeris for the three forecast bodies.
    ///
    /// Sun: Meeus, Astronomical Algorithms Ch. 25 (≈0.01°).
    /// Moon: Meeus Ch. 47 with the principal periodic terms (≈0.02° in
    /// longitude, ≈50 km in distance), enough for minute-level rise/set.
    /// Galactic Center: fixed J2000 place precessed to the date.
    /// All entry points take a Julian Date in UT and apply ΔT internally.
    class Ephemeris
    {
    public:
        Ephemeris() = delete;

        /// @brief Rise/set altitude of the upper limb at the horizon, with
        /// 34′ of standard refraction (radians, geometric, topocentric).
        static constexpr f64 kHorizonRefraction = 34.0 / 60.0 * astro_constants::kDegToRad;

        [[nodiscard]] static BodyPosition position(Body body, f64 jd_ut);

        [[nodiscard]] static BodyPosition sun(f64 jd_ut);
        [[nodiscard]] static BodyPosition moon(f64 jd_ut);
        [[nodiscard]] static BodyPosition galactic_center(f64 jd_ut);

        /// @brief Mean J2000.0 place of the Galactic Center.
        [[nodiscard]] static EquatorialCoord galactic_center_j2000();

        /// @brief Topocentric geometric altitude of the body's center (radians).
        [[nodiscard]] static f64 altitude(Body body, const ObserverLocation& observer, f64 jd_ut);

        /// @brief Topocentric apparent altitude of the body's center, refraction included (radians).
        [[nodiscard]] static f64 apparent_altitude(Body body, const ObserverLocation& observer, f64 jd_ut);

        /// @brief Geometric altitude of the center at which the upper limb
        /// touches the refracted horizon: −(34′ + semi-diameter).
        [[nodiscard]] static f64 horizon_altitude(const BodyPosition& position);

        /// @brief Signed distance of the upper limb above the rise/set horizon (radians).
        [[nodiscard]] static f64 altitude_above_horizon(Body body, const ObserverLocation& observer, f64 jd_ut);

        /// @brief Hour angle of the body, normalized to (-π, π] (radians).
        [[nodiscard]] static f64 hour_angle(Body body, const ObserverLocation& observer, f64 jd_ut);

        /// @brief Geocentric apparent longitude of the Moon minus that of the
        /// Sun, normalized to (-π, π]. Crosses zero upward at new moon.
        [[nodiscard]] static f64 moon_sun_elongation(f64 jd_ut);

    private:
        struct SunGeometry
        {
            f64 longitude;      ///< Apparent ecliptic longitude of date (radians)
            f64 radius_au;
        };

        struct MoonGeometry
        {
            EclipticCoord ecliptic;     ///< Apparent ecliptic place of date (radians)
            f64 distance_km;
        };

        /// @param t Julian centuries (TT) since J2000.0.
        [[nodiscard]] static SunGeometry sun_geometry(f64 t);
        [[nodiscard]] static MoonGeometry moon_geometry(f64 t);

        /// @brief Nutation in longitude and true obliquity of date (radians).
        struct Nutation
        {
            f64 delta_psi;
            f64 true_obliquity;
        };

        [[nodiscard]] static Nutation nutation(f64 t);
        [[nodiscard]] static f64 normalize_degrees(f64 angle);
    };

} // namespace darksky::astro
