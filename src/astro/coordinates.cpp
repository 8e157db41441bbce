/// @file coordinates.cpp
/// @brief Implementation of astronomical coordinate transformations.

#include "astro/coordinates.hpp"

#include "core/types.hpp"

#include <algorithm>
#include <cmath>

namespace darksky::astro
{

// -----------------------------------------------------------------
// Equatorial (RA/Dec) → Horizontal (Alt/Az)
//
// Hour angle: H = LST - RA
//
// sin(alt) = sin(dec) × sin(lat) + cos(dec) × cos(lat) × cos(H)
//
// Azimuth (north-based):
//   az = atan2(-cos(dec)×sin(H), sin(dec)×cos(lat) - cos(dec)×sin(lat)×cos(H))
// -----------------------------------------------------------------

HorizontalCoord Coordinates::equatorial_to_horizontal(
    const EquatorialCoord& eq,
    const ObserverLocation& observer,
    f64 local_sidereal_time_rad)
{
    const f64 ha = local_sidereal_time_rad - eq.ra;

    const f64 sin_dec = std::sin(eq.dec);
    const f64 cos_dec = std::cos(eq.dec);
    const f64 sin_lat = std::sin(observer.latitude_rad);
    const f64 cos_lat = std::cos(observer.latitude_rad);
    const f64 cos_ha  = std::cos(ha);
    const f64 sin_ha  = std::sin(ha);

    const f64 sin_alt = sin_dec * sin_lat + cos_dec * cos_lat * cos_ha;
    const f64 alt = std::asin(std::clamp(sin_alt, -1.0, 1.0));

    const f64 az_y = -cos_dec * sin_ha;
    const f64 az_x = sin_dec * cos_lat - cos_dec * sin_lat * cos_ha;

    return HorizontalCoord{
        .alt = alt,
        .az  = normalize_radians(std::atan2(az_y, az_x)),
    };
}

// -----------------------------------------------------------------
// Ecliptic → Equatorial
//
// Rotate the ecliptic unit vector about the X axis (vernal equinox)
// by the obliquity ε:
//   x' = x
//   y' = y cos ε - z sin ε
//   z' = y sin ε + z cos ε
// -----------------------------------------------------------------

EquatorialCoord Coordinates::ecliptic_to_equatorial(
    const EclipticCoord& ecl,
    f64 obliquity_rad)
{
    const Vec3d ecliptic{
        std::cos(ecl.lat) * std::cos(ecl.lon),
        std::cos(ecl.lat) * std::sin(ecl.lon),
        std::sin(ecl.lat),
    };

    const f64 cos_eps = std::cos(obliquity_rad);
    const f64 sin_eps = std::sin(obliquity_rad);

    // glm matrices are column-major: each Vec3d below is one column
    const Mat3d rotation{
        Vec3d{1.0, 0.0, 0.0},
        Vec3d{0.0, cos_eps, sin_eps},
        Vec3d{0.0, -sin_eps, cos_eps},
    };

    const Vec3d equatorial = rotation * ecliptic;

    return EquatorialCoord{
        .ra  = normalize_radians(std::atan2(equatorial.y, equatorial.x)),
        .dec = std::asin(std::clamp(equatorial.z, -1.0, 1.0)),
    };
}

// -----------------------------------------------------------------
// Precession J2000.0 → date (Meeus Ch. 21, rigorous method)
//
// ζ = 2306.2181″t + 0.30188″t² + 0.017998″t³
// z = 2306.2181″t + 1.09468″t² + 0.018203″t³
// θ = 2004.3109″t − 0.42665″t² − 0.041833″t³
// -----------------------------------------------------------------

EquatorialCoord Coordinates::precess_from_j2000(
    const EquatorialCoord& j2000,
    f64 jd_tt)
{
    const f64 t  = (jd_tt - astro_constants::kJ2000) / 36525.0;
    const f64 t2 = t * t;
    const f64 t3 = t2 * t;

    const f64 zeta  = (2306.2181 * t + 0.30188 * t2 + 0.017998 * t3) * astro_constants::kArcSecToRad;
    const f64 z     = (2306.2181 * t + 1.09468 * t2 + 0.018203 * t3) * astro_constants::kArcSecToRad;
    const f64 theta = (2004.3109 * t - 0.42665 * t2 - 0.041833 * t3) * astro_constants::kArcSecToRad;

    const f64 cos_dec0 = std::cos(j2000.dec);
    const f64 sin_dec0 = std::sin(j2000.dec);
    const f64 ra_zeta  = j2000.ra + zeta;

    const f64 a = cos_dec0 * std::sin(ra_zeta);
    const f64 b = std::cos(theta) * cos_dec0 * std::cos(ra_zeta) - std::sin(theta) * sin_dec0;
    const f64 c = std::sin(theta) * cos_dec0 * std::cos(ra_zeta) + std::cos(theta) * sin_dec0;

    return EquatorialCoord{
        .ra  = normalize_radians(std::atan2(a, b) + z),
        .dec = std::asin(std::clamp(c, -1.0, 1.0)),
    };
}

f64 Coordinates::hour_angle(f64 local_sidereal_time_rad, f64 ra)
{
    f64 ha = normalize_radians(local_sidereal_time_rad - ra);
    if (ha > astro_constants::kPi)
    {
        ha -= astro_constants::kTwoPi;
    }
    return ha;
}

// -----------------------------------------------------------------
// Refraction (Saemundsson 1986)
//
// R[arcmin] = 1.02 / tan(h + 10.3 / (h + 5.11)),  h = true altitude [deg]
// scaled by (P / 1010) × (283 / (273 + T)) for P = 1010 hPa, T = 15 °C.
// -----------------------------------------------------------------

f64 Coordinates::refraction(f64 true_alt_rad)
{
    constexpr f64 kMinAltitudeDeg = -2.0;
    constexpr f64 kPressureHpa    = 1010.0;
    constexpr f64 kTemperatureC   = 15.0;

    const f64 h = true_alt_rad * astro_constants::kRadToDeg;
    if (h < kMinAltitudeDeg)
    {
        return 0.0;
    }

    const f64 scale = (kPressureHpa / 1010.0) * (283.0 / (273.0 + kTemperatureC));
    const f64 r_arcmin = 1.02 / std::tan((h + 10.3 / (h + 5.11)) * astro_constants::kDegToRad);
    return std::max(r_arcmin * scale, 0.0) / 60.0 * astro_constants::kDegToRad;
}

f64 Coordinates::topocentric_altitude(f64 geocentric_alt_rad, f64 horizontal_parallax_rad)
{
    // Parallax in altitude: p = asin(sin π × cos h)
    const f64 parallax = std::asin(std::sin(horizontal_parallax_rad) * std::cos(geocentric_alt_rad));
    return geocentric_alt_rad - parallax;
}

// -----------------------------------------------------------------
// Normalize angle to [0, 2π)
// -----------------------------------------------------------------

f64 Coordinates::normalize_radians(f64 angle)
{
    angle = std::fmod(angle, astro_constants::kTwoPi);
    if (angle < 0.0)
    {
        angle += astro_constants::kTwoPi;
    }
    return angle;
}

} // namespace darksky::astro
