/// @file time_system.cpp
/// @brief Implementation of astronomical time utilities.

#include "astro/time_system.hpp"

#include "core/types.hpp"

#include <cmath>

namespace darksky::astro
{

// -----------------------------------------------------------------
// Julian centuries since J2000.0
// -----------------------------------------------------------------

f64 TimeSystem::julian_centuries(f64 jd)
{
    return (jd - astro_constants::kJ2000) / 36525.0;
}

// -----------------------------------------------------------------
// GMST: IAU 1982 formula
//
// GMST (degrees) = 280.46061837
//                + 360.98564736629 × (JD − 2451545.0)
//                + 0.000387933 × T²
//                − T³ / 38710000
//
// Where T = Julian centuries from J2000.0
// Result normalized to [0, 360°), then converted to radians.
// -----------------------------------------------------------------

f64 TimeSystem::gmst(f64 jd)
{
    const f64 t = julian_centuries(jd);
    const f64 d = jd - astro_constants::kJ2000;

    // GMST in degrees
    f64 gmst_deg = 280.46061837
                 + 360.98564736629 * d
                 + 0.000387933 * t * t
                 - (t * t * t) / 38710000.0;

    // Normalize to [0, 360)
    gmst_deg = std::fmod(gmst_deg, 360.0);
    if (gmst_deg < 0.0)
    {
        gmst_deg += 360.0;
    }

    return gmst_deg * astro_constants::kDegToRad;
}

// -----------------------------------------------------------------
// LMST = GMST + observer longitude
// -----------------------------------------------------------------

f64 TimeSystem::lmst(f64 jd, f64 longitude_rad)
{
    return normalize_radians(gmst(jd) + longitude_rad);
}

// -----------------------------------------------------------------
// absl::Time <-> Julian Date (UT)
// -----------------------------------------------------------------

f64 TimeSystem::julian_date(absl::Time instant)
{
    const f64 seconds = absl::ToDoubleSeconds(instant - absl::UnixEpoch());
    return astro_constants::kUnixEpochJd + seconds / astro_constants::kSecondsPerDay;
}

absl::Time TimeSystem::to_time(f64 jd)
{
    const f64 millis = (jd - astro_constants::kUnixEpochJd) * astro_constants::kSecondsPerDay * 1000.0;
    return absl::UnixEpoch() + absl::Milliseconds(std::llround(millis));
}

// -----------------------------------------------------------------
// ΔT = TT - UT (Espenak & Meeus, NASA eclipse polynomials)
//
// Only the modern segments matter for forecasts; far-future dates
// fall back to the long-term parabola -20 + 32 u², u = (y - 1820) / 100.
// -----------------------------------------------------------------

f64 TimeSystem::delta_t_seconds(f64 jd_ut)
{
    const f64 y = 2000.0 + (jd_ut - 2451544.5) / 365.25;

    if (y >= 1986.0 && y < 2005.0)
    {
        const f64 t = y - 2000.0;
        return 63.86 + 0.3345 * t - 0.060374 * t * t + 0.0017275 * t * t * t
             + 0.000651814 * t * t * t * t + 0.00002373599 * t * t * t * t * t;
    }
    if (y >= 2005.0 && y < 2050.0)
    {
        const f64 t = y - 2000.0;
        return 62.92 + 0.32217 * t + 0.005589 * t * t;
    }

    const f64 u = (y - 1820.0) / 100.0;
    if (y >= 2050.0 && y < 2150.0)
    {
        return -20.0 + 32.0 * u * u - 0.5628 * (2150.0 - y);
    }
    return -20.0 + 32.0 * u * u;
}

f64 TimeSystem::to_terrestrial_time(f64 jd_ut)
{
    return jd_ut + delta_t_seconds(jd_ut) / astro_constants::kSecondsPerDay;
}

// -----------------------------------------------------------------
// Normalize angle to [0, 2π)
// -----------------------------------------------------------------

f64 TimeSystem::normalize_radians(f64 angle)
{
    angle = std::fmod(angle, astro_constants::kTwoPi);
    if (angle < 0.0)
    {
        angle += astro_constants::kTwoPi;
    }
    return angle;
}

} // namespace darksky::astro
