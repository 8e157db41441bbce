/// @file ephemeris.cpp
/// @brief Sun, Moon and Galactic Center positions.

#include "astro/ephemeris.hpp"

#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <array>
#include <cmath>

namespace darksky::astro
{

namespace
{

using astro_constants::kDegToRad;

// -----------------------------------------------------------------
// Lunar periodic terms (Meeus Tables 47.A and 47.B)
//
// Arguments are multiples of D (elongation), M (solar anomaly),
// M' (lunar anomaly), F (argument of latitude). Terms containing M
// are scaled by E (|M| = 1) or E² (|M| = 2).
// Σl, Σb in 1e-6 degrees, Σr in 1e-3 km.
// -----------------------------------------------------------------

struct LonDistTerm
{
    i32 d, m, mp, f;
    f64 sin_l;
    f64 cos_r;
};

struct LatTerm
{
    i32 d, m, mp, f;
    f64 sin_b;
};

constexpr std::array<LonDistTerm, 36> kLonDistTerms{{
    {0,  0,  1,  0,  6288774.0, -20905355.0},
    {2,  0, -1,  0,  1274027.0,  -3699111.0},
    {2,  0,  0,  0,   658314.0,  -2955968.0},
    {0,  0,  2,  0,   213618.0,   -569925.0},
    {0,  1,  0,  0,  -185116.0,     48888.0},
    {0,  0,  0,  2,  -114332.0,     -3149.0},
    {2,  0, -2,  0,    58793.0,    246158.0},
    {2, -1, -1,  0,    57066.0,   -152138.0},
    {2,  0,  1,  0,    53322.0,   -170733.0},
    {2, -1,  0,  0,    45758.0,   -204586.0},
    {0,  1, -1,  0,   -40923.0,   -129620.0},
    {1,  0,  0,  0,   -34720.0,    108743.0},
    {0,  1,  1,  0,   -30383.0,    104755.0},
    {2,  0,  0, -2,    15327.0,     10321.0},
    {0,  0,  1,  2,   -12528.0,         0.0},
    {0,  0,  1, -2,    10980.0,     79661.0},
    {4,  0, -1,  0,    10675.0,    -34782.0},
    {0,  0,  3,  0,    10034.0,    -23210.0},
    {4,  0, -2,  0,     8548.0,    -21636.0},
    {2,  1, -1,  0,    -7888.0,     24208.0},
    {2,  1,  0,  0,    -6766.0,     30824.0},
    {1,  0, -1,  0,    -5163.0,     -8379.0},
    {1,  1,  0,  0,     4987.0,    -16675.0},
    {2, -1,  1,  0,     4036.0,    -12831.0},
    {2,  0,  2,  0,     3994.0,    -10445.0},
    {4,  0,  0,  0,     3861.0,    -11650.0},
    {2,  0, -3,  0,     3665.0,     14403.0},
    {0,  1, -2,  0,    -2689.0,     -7003.0},
    {2,  0, -1,  2,    -2602.0,         0.0},
    {2, -1, -2,  0,     2390.0,     10056.0},
    {1,  0,  1,  0,    -2348.0,      6322.0},
    {2, -2,  0,  0,     2236.0,     -9884.0},
    {0,  1,  2,  0,    -2120.0,      5751.0},
    {0,  2,  0,  0,    -2069.0,         0.0},
    {2, -2, -1,  0,     2048.0,     -4950.0},
    {2,  0,  1, -2,    -1773.0,      4130.0},
}};

constexpr std::array<LatTerm, 30> kLatTerms{{
    {0,  0,  0,  1, 5128122.0},
    {0,  0,  1,  1,  280602.0},
    {0,  0,  1, -1,  277693.0},
    {2,  0,  0, -1,  173237.0},
    {2,  0, -1,  1,   55413.0},
    {2,  0, -1, -1,   46271.0},
    {2,  0,  0,  1,   32573.0},
    {0,  0,  2,  1,   17198.0},
    {2,  0,  1, -1,    9266.0},
    {0,  0,  2, -1,    8822.0},
    {2, -1,  0, -1,    8216.0},
    {2,  0, -2, -1,    4324.0},
    {2,  0,  1,  1,    4200.0},
    {2,  1,  0, -1,   -3359.0},
    {2, -1, -1,  1,    2463.0},
    {2, -1,  0,  1,    2211.0},
    {2, -1, -1, -1,    2065.0},
    {0,  1, -1, -1,   -1870.0},
    {4,  0, -1, -1,    1828.0},
    {0,  1,  0,  1,   -1794.0},
    {0,  0,  0,  3,   -1749.0},
    {0,  1, -1,  1,   -1565.0},
    {1,  0,  0,  1,   -1491.0},
    {0,  1,  1,  1,   -1475.0},
    {0,  1,  1, -1,   -1410.0},
    {0,  1,  0, -1,   -1344.0},
    {1,  0,  0, -1,   -1335.0},
    {0,  0,  3,  1,    1107.0},
    {4,  0,  0, -1,    1021.0},
    {4,  0, -1,  1,     833.0},
}};

// Galactic Center, J2000: 17h58m03.470s, −26°06′04.6″
constexpr f64 kGalacticCenterRaDeg  = (17.0 + 58.0 / 60.0 + 3.470 / 3600.0) * 15.0;
constexpr f64 kGalacticCenterDecDeg = -(26.0 + 6.0 / 60.0 + 4.6 / 3600.0);

constexpr f64 kMoonRadiusRatio = 0.272481;   // Moon radius / Earth equatorial radius
constexpr f64 kSunSemiDiameterAu = 959.63;   // arcsec at 1 AU
constexpr f64 kSunParallaxAu = 8.794;        // arcsec at 1 AU

f64 eccentricity_factor(i32 m, f64 e)
{
    const i32 power = std::abs(m);
    if (power == 1)
    {
        return e;
    }
    if (power == 2)
    {
        return e * e;
    }
    return 1.0;
}

} // namespace

std::string_view body_name(Body body)
{
    switch (body)
    {
        case Body::Sun:            return "Sun";
        case Body::Moon:           return "Moon";
        case Body::GalacticCenter: return "Galactic Center";
    }
    return "Unknown";
}

// -----------------------------------------------------------------
// Dispatch
// -----------------------------------------------------------------

BodyPosition Ephemeris::position(Body body, f64 jd_ut)
{
    switch (body)
    {
        case Body::Sun:            return sun(jd_ut);
        case Body::Moon:           return moon(jd_ut);
        case Body::GalacticCenter: return galactic_center(jd_ut);
    }
    return galactic_center(jd_ut);
}

// -----------------------------------------------------------------
// Nutation (Meeus Ch. 22, low-accuracy terms)
//
// Δψ = −17.20″ sin Ω − 1.32″ sin 2L − 0.23″ sin 2L′ + 0.21″ sin 2Ω
// Δε =   9.20″ cos Ω + 0.57″ cos 2L + 0.10″ cos 2L′ − 0.09″ cos 2Ω
// ε₀ = 23°26′21.448″ − 46.8150″T − 0.00059″T² + 0.001813″T³
// -----------------------------------------------------------------

Ephemeris::Nutation Ephemeris::nutation(f64 t)
{
    const f64 omega  = normalize_degrees(125.04452 - 1934.136261 * t) * kDegToRad;
    const f64 l_sun  = normalize_degrees(280.4665 + 36000.7698 * t) * kDegToRad;
    const f64 l_moon = normalize_degrees(218.3165 + 481267.8813 * t) * kDegToRad;

    const f64 delta_psi = -17.20 * std::sin(omega) - 1.32 * std::sin(2.0 * l_sun)
                        - 0.23 * std::sin(2.0 * l_moon) + 0.21 * std::sin(2.0 * omega);
    const f64 delta_eps = 9.20 * std::cos(omega) + 0.57 * std::cos(2.0 * l_sun)
                        + 0.10 * std::cos(2.0 * l_moon) - 0.09 * std::cos(2.0 * omega);

    const f64 eps0_arcsec = 84381.448 - 46.8150 * t - 0.00059 * t * t + 0.001813 * t * t * t;

    return Nutation{
        .delta_psi      = delta_psi * astro_constants::kArcSecToRad,
        .true_obliquity = (eps0_arcsec + delta_eps) * astro_constants::kArcSecToRad,
    };
}

// -----------------------------------------------------------------
// Sun (Meeus Ch. 25)
// -----------------------------------------------------------------

Ephemeris::SunGeometry Ephemeris::sun_geometry(f64 t)
{
    const f64 l0 = normalize_degrees(280.46646 + 36000.76983 * t + 0.0003032 * t * t);
    const f64 m  = normalize_degrees(357.52911 + 35999.05029 * t - 0.0001537 * t * t);
    const f64 e  = 0.016708634 - 0.000042037 * t - 0.0000001267 * t * t;
    const f64 m_rad = m * kDegToRad;

    // Equation of center
    const f64 c = (1.914602 - 0.004817 * t - 0.000014 * t * t) * std::sin(m_rad)
                + (0.019993 - 0.000101 * t) * std::sin(2.0 * m_rad)
                + 0.000289 * std::sin(3.0 * m_rad);

    const f64 true_longitude = l0 + c;
    const f64 true_anomaly   = (m + c) * kDegToRad;
    const f64 radius_au      = 1.000001018 * (1.0 - e * e) / (1.0 + e * std::cos(true_anomaly));

    // Apparent longitude: aberration (−20.4898″ / R) plus nutation
    const f64 aberration = -20.4898 / radius_au * astro_constants::kArcSecToRad;

    return SunGeometry{
        .longitude = true_longitude * kDegToRad + nutation(t).delta_psi + aberration,
        .radius_au = radius_au,
    };
}

BodyPosition Ephemeris::sun(f64 jd_ut)
{
    const f64 t = TimeSystem::julian_centuries(TimeSystem::to_terrestrial_time(jd_ut));
    const SunGeometry geometry = sun_geometry(t);

    return BodyPosition{
        .equatorial          = Coordinates::ecliptic_to_equatorial({.lon = geometry.longitude, .lat = 0.0},
                                                                   nutation(t).true_obliquity),
        .horizontal_parallax = kSunParallaxAu / geometry.radius_au * astro_constants::kArcSecToRad,
        .semi_diameter       = kSunSemiDiameterAu / geometry.radius_au * astro_constants::kArcSecToRad,
    };
}

// -----------------------------------------------------------------
// Moon (Meeus Ch. 47)
// -----------------------------------------------------------------

Ephemeris::MoonGeometry Ephemeris::moon_geometry(f64 t)
{
    const f64 t2 = t * t;
    const f64 t3 = t2 * t;
    const f64 t4 = t3 * t;

    // Fundamental arguments (degrees)
    const f64 lp = normalize_degrees(218.3164477 + 481267.88123421 * t - 0.0015786 * t2
                                     + t3 / 538841.0 - t4 / 65194000.0);
    const f64 d  = normalize_degrees(297.8501921 + 445267.1114034 * t - 0.0018819 * t2
                                     + t3 / 545868.0 - t4 / 113065000.0);
    const f64 m  = normalize_degrees(357.5291092 + 35999.0502909 * t - 0.0001536 * t2
                                     + t3 / 24490000.0);
    const f64 mp = normalize_degrees(134.9633964 + 477198.8675055 * t + 0.0087414 * t2
                                     + t3 / 69699.0 - t4 / 14712000.0);
    const f64 f  = normalize_degrees(93.2720950 + 483202.0175233 * t - 0.0036539 * t2
                                     - t3 / 3526000.0 + t4 / 863310000.0);

    const f64 a1 = normalize_degrees(119.75 + 131.849 * t) * kDegToRad;
    const f64 a2 = normalize_degrees(53.09 + 479264.290 * t) * kDegToRad;
    const f64 a3 = normalize_degrees(313.45 + 481266.484 * t) * kDegToRad;
    const f64 e  = 1.0 - 0.002516 * t - 0.0000074 * t2;

    const f64 lp_rad = lp * kDegToRad;
    const f64 d_rad  = d * kDegToRad;
    const f64 m_rad  = m * kDegToRad;
    const f64 mp_rad = mp * kDegToRad;
    const f64 f_rad  = f * kDegToRad;

    f64 sum_l = 0.0;
    f64 sum_r = 0.0;
    for (const auto& term : kLonDistTerms)
    {
        const f64 arg = term.d * d_rad + term.m * m_rad + term.mp * mp_rad + term.f * f_rad;
        const f64 scale = eccentricity_factor(term.m, e);
        sum_l += term.sin_l * scale * std::sin(arg);
        sum_r += term.cos_r * scale * std::cos(arg);
    }

    f64 sum_b = 0.0;
    for (const auto& term : kLatTerms)
    {
        const f64 arg = term.d * d_rad + term.m * m_rad + term.mp * mp_rad + term.f * f_rad;
        sum_b += term.sin_b * eccentricity_factor(term.m, e) * std::sin(arg);
    }

    // Additive terms (Venus, Jupiter, flattening of the Earth)
    sum_l += 3958.0 * std::sin(a1) + 1962.0 * std::sin(lp_rad - f_rad) + 318.0 * std::sin(a2);
    sum_b += -2235.0 * std::sin(lp_rad) + 382.0 * std::sin(a3)
           + 175.0 * std::sin(a1 - f_rad) + 175.0 * std::sin(a1 + f_rad)
           + 127.0 * std::sin(lp_rad - mp_rad) - 115.0 * std::sin(lp_rad + mp_rad);

    return MoonGeometry{
        .ecliptic    = {.lon = (lp + sum_l / 1.0e6) * kDegToRad + nutation(t).delta_psi,
                        .lat = (sum_b / 1.0e6) * kDegToRad},
        .distance_km = 385000.56 + sum_r / 1000.0,
    };
}

BodyPosition Ephemeris::moon(f64 jd_ut)
{
    const f64 t = TimeSystem::julian_centuries(TimeSystem::to_terrestrial_time(jd_ut));
    const MoonGeometry geometry = moon_geometry(t);

    const f64 parallax = std::asin(astro_constants::kEarthRadiusKm / geometry.distance_km);

    return BodyPosition{
        .equatorial          = Coordinates::ecliptic_to_equatorial(geometry.ecliptic,
                                                                   nutation(t).true_obliquity),
        .horizontal_parallax = parallax,
        .semi_diameter       = std::asin(kMoonRadiusRatio * std::sin(parallax)),
    };
}

// -----------------------------------------------------------------
// Lunar phase: apparent longitude of the Moon minus that of the Sun.
// Zero at new moon, ±π at full moon.
// -----------------------------------------------------------------

f64 Ephemeris::moon_sun_elongation(f64 jd_ut)
{
    const f64 t = TimeSystem::julian_centuries(TimeSystem::to_terrestrial_time(jd_ut));
    f64 elongation = TimeSystem::normalize_radians(moon_geometry(t).ecliptic.lon - sun_geometry(t).longitude);
    if (elongation > astro_constants::kPi)
    {
        elongation -= astro_constants::kTwoPi;
    }
    return elongation;
}

// -----------------------------------------------------------------
// Galactic Center
// -----------------------------------------------------------------

EquatorialCoord Ephemeris::galactic_center_j2000()
{
    return EquatorialCoord{
        .ra  = kGalacticCenterRaDeg * kDegToRad,
        .dec = kGalacticCenterDecDeg * kDegToRad,
    };
}

BodyPosition Ephemeris::galactic_center(f64 jd_ut)
{
    return BodyPosition{
        .equatorial          = Coordinates::precess_from_j2000(galactic_center_j2000(),
                                                               TimeSystem::to_terrestrial_time(jd_ut)),
        .horizontal_parallax = 0.0,
        .semi_diameter       = 0.0,
    };
}

// -----------------------------------------------------------------
// Observer-relative quantities
// -----------------------------------------------------------------

f64 Ephemeris::altitude(Body body, const ObserverLocation& observer, f64 jd_ut)
{
    const BodyPosition pos = position(body, jd_ut);
    const f64 lst = TimeSystem::lmst(jd_ut, observer.longitude_rad);
    const HorizontalCoord hz = Coordinates::equatorial_to_horizontal(pos.equatorial, observer, lst);
    return Coordinates::topocentric_altitude(hz.alt, pos.horizontal_parallax);
}

f64 Ephemeris::apparent_altitude(Body body, const ObserverLocation& observer, f64 jd_ut)
{
    const f64 alt = altitude(body, observer, jd_ut);
    return alt + Coordinates::refraction(alt);
}

f64 Ephemeris::horizon_altitude(const BodyPosition& position)
{
    return -(kHorizonRefraction + position.semi_diameter);
}

f64 Ephemeris::altitude_above_horizon(Body body, const ObserverLocation& observer, f64 jd_ut)
{
    const BodyPosition pos = position(body, jd_ut);
    const f64 lst = TimeSystem::lmst(jd_ut, observer.longitude_rad);
    const HorizontalCoord hz = Coordinates::equatorial_to_horizontal(pos.equatorial, observer, lst);
    const f64 topocentric = Coordinates::topocentric_altitude(hz.alt, pos.horizontal_parallax);
    return topocentric - horizon_altitude(pos);
}

f64 Ephemeris::hour_angle(Body body, const ObserverLocation& observer, f64 jd_ut)
{
    const BodyPosition pos = position(body, jd_ut);
    const f64 lst = TimeSystem::lmst(jd_ut, observer.longitude_rad);
    return Coordinates::hour_angle(lst, pos.equatorial.ra);
}

f64 Ephemeris::normalize_degrees(f64 angle)
{
    angle = std::fmod(angle, 360.0);
    if (angle < 0.0)
    {
        angle += 360.0;
    }
    return angle;
}

} // namespace darksky::astro
