/// @file test_coordinates.cpp
/// @brief Unit tests for darksky::astro::Coordinates.
///
/// Verifies equatorial-to-horizontal transforms, ecliptic rotation,
/// precession, refraction and parallax against Meeus reference values.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/coordinates.hpp"
#include "core/types.hpp"

#include <cmath>

using namespace darksky;
using namespace darksky::astro;

// =================================================================
// Tolerance constants
// =================================================================

/// 1 arcminute in radians: loose tolerance for approximate checks
static constexpr f64 kArcMinRad = astro_constants::kDegToRad / 60.0;

/// 1 arcsecond in radians: tight tolerance for precision checks
static constexpr f64 kArcSecRad = astro_constants::kArcSecToRad;

/// Degree tolerance for general angular comparisons
static constexpr f64 kDegTol = 0.5 * astro_constants::kDegToRad;

// =================================================================
// Equatorial → Horizontal tests
// =================================================================

TEST_CASE("Polaris near zenith from North Pole")
{
    // Polaris: RA ≈ 02h 31m 49s = 37.954°, Dec ≈ +89°15'51" ≈ +89.264°
    const EquatorialCoord polaris = {
        .ra  = 37.954 * astro_constants::kDegToRad,
        .dec = 89.264 * astro_constants::kDegToRad,
    };

    // Observer at North Pole
    const ObserverLocation north_pole = {
        .latitude_rad  = 90.0 * astro_constants::kDegToRad,
        .longitude_rad = 0.0,
    };

    // At the North Pole, altitude = declination for any LST
    const f64 lst = 0.0;  // LST doesn't matter for a pole observer + polar star

    const auto hz = Coordinates::equatorial_to_horizontal(polaris, north_pole, lst);

    // Altitude should be ≈ 89.264° (essentially at zenith)
    CHECK(hz.alt == doctest::Approx(89.264 * astro_constants::kDegToRad).epsilon(kArcMinRad));
}

TEST_CASE("Star transiting at zenith: RA=LST, Dec=Lat → alt≈90°")
{
    // If a star's RA equals the LST and its Dec equals the observer latitude,
    // it is transiting directly overhead (altitude ≈ 90°).
    const f64 lat = 45.0 * astro_constants::kDegToRad;
    const f64 lst = 6.0 * astro_constants::kHourToRad;  // 6h = 90°

    const EquatorialCoord eq = {
        .ra  = lst,   // RA = LST → hour angle = 0
        .dec = lat,   // Dec = latitude
    };

    const ObserverLocation observer = {
        .latitude_rad  = lat,
        .longitude_rad = 0.0,
    };

    const auto hz = Coordinates::equatorial_to_horizontal(eq, observer, lst);

    // Altitude should be 90° (zenith)
    CHECK(hz.alt == doctest::Approx(astro_constants::kHalfPi).epsilon(kArcSecRad));
}

TEST_CASE("Star on celestial equator due south at transit")
{
    // Observer at lat 45°N, star with Dec=0 at transit (HA=0)
    // Expected altitude = 90° - |lat| = 45°
    // Expected azimuth = 180° (due south)
    const f64 lat = 45.0 * astro_constants::kDegToRad;
    const f64 lst = 3.0 * astro_constants::kHourToRad;  // 45°

    const EquatorialCoord eq = {
        .ra  = lst,   // RA = LST → transit
        .dec = 0.0,   // Celestial equator
    };

    const ObserverLocation observer = {
        .latitude_rad  = lat,
        .longitude_rad = 0.0,
    };

    const auto hz = Coordinates::equatorial_to_horizontal(eq, observer, lst);

    // Altitude = 90° - 45° = 45°
    CHECK(hz.alt == doctest::Approx(45.0 * astro_constants::kDegToRad).epsilon(kArcSecRad));

    // Azimuth = 180° (due south)
    CHECK(hz.az == doctest::Approx(astro_constants::kPi).epsilon(kDegTol));
}

TEST_CASE("Star below horizon has negative altitude")
{
    // Circumpolar check: star at Dec = -60° from lat 45°N should be below horizon
    // when it transits (HA = 0): alt = 90° - |lat - dec| = 90° - 105° = -15°
    const f64 lat = 45.0 * astro_constants::kDegToRad;
    const f64 lst = 0.0;

    const EquatorialCoord eq = {
        .ra  = lst,
        .dec = -60.0 * astro_constants::kDegToRad,
    };

    const ObserverLocation observer = {
        .latitude_rad  = lat,
        .longitude_rad = 0.0,
    };

    const auto hz = Coordinates::equatorial_to_horizontal(eq, observer, lst);

    CHECK(hz.alt < 0.0);
}

// =================================================================
// Ecliptic → Equatorial
// =================================================================

TEST_CASE("Pollux ecliptic to equatorial (Meeus example 13.a)")
{
    const EclipticCoord pollux = {
        .lon = 113.215630 * astro_constants::kDegToRad,
        .lat = 6.684170 * astro_constants::kDegToRad,
    };
    const f64 obliquity = 23.4392911 * astro_constants::kDegToRad;

    const auto eq = Coordinates::ecliptic_to_equatorial(pollux, obliquity);

    CHECK(eq.ra  == doctest::Approx(116.328942 * astro_constants::kDegToRad).epsilon(1e-6));
    CHECK(eq.dec == doctest::Approx(28.026183 * astro_constants::kDegToRad).epsilon(1e-6));
}

TEST_CASE("Zero obliquity leaves longitude and latitude unchanged")
{
    const EclipticCoord ecl = {.lon = 1.2, .lat = -0.3};
    const auto eq = Coordinates::ecliptic_to_equatorial(ecl, 0.0);

    CHECK(eq.ra  == doctest::Approx(1.2).epsilon(1e-12));
    CHECK(eq.dec == doctest::Approx(-0.3).epsilon(1e-12));
}

// =================================================================
// Precession
// =================================================================

TEST_CASE("Theta Persei precessed to 2028 (Meeus example 21.b, no proper motion)")
{
    const EquatorialCoord j2000 = {
        .ra  = 41.054063 * astro_constants::kDegToRad,
        .dec = 49.227750 * astro_constants::kDegToRad,
    };
    const f64 jde = 2462088.69;   // 2028 Nov 13.19 TD

    const auto eq = Coordinates::precess_from_j2000(j2000, jde);

    // Meeus gives 41.547214°, 49.348483° including ~15″ of proper motion
    CHECK(eq.ra * astro_constants::kRadToDeg  == doctest::Approx(41.547214).epsilon(2e-4));
    CHECK(eq.dec * astro_constants::kRadToDeg == doctest::Approx(49.348483).epsilon(2e-4));
}

TEST_CASE("Precession to J2000.0 itself is the identity")
{
    const EquatorialCoord j2000 = {.ra = 4.7, .dec = -0.45};
    const auto eq = Coordinates::precess_from_j2000(j2000, astro_constants::kJ2000);

    CHECK(eq.ra  == doctest::Approx(4.7).epsilon(1e-12));
    CHECK(eq.dec == doctest::Approx(-0.45).epsilon(1e-12));
}

// =================================================================
// Hour angle
// =================================================================

TEST_CASE("Hour angle is normalized to (-π, π]")
{
    CHECK(Coordinates::hour_angle(0.1, 6.2) > 0.0);
    CHECK(Coordinates::hour_angle(0.1, 6.2) == doctest::Approx(0.1 - 6.2 + astro_constants::kTwoPi));
    CHECK(Coordinates::hour_angle(6.2, 0.1) < 0.0);
    CHECK(Coordinates::hour_angle(1.0, 1.0) == doctest::Approx(0.0));
}

// =================================================================
// Refraction and parallax
// =================================================================

TEST_CASE("Refraction is about half a degree at the horizon")
{
    const f64 r_arcmin = Coordinates::refraction(0.0) * astro_constants::kRadToDeg * 60.0;
    CHECK(r_arcmin > 25.0);
    CHECK(r_arcmin < 36.0);
}

TEST_CASE("Refraction vanishes at the zenith and well below the horizon")
{
    CHECK(Coordinates::refraction(astro_constants::kHalfPi) * astro_constants::kRadToDeg * 3600.0
          == doctest::Approx(0.0).epsilon(1.0));
    CHECK(Coordinates::refraction(-5.0 * astro_constants::kDegToRad) == 0.0);
}

TEST_CASE("Refraction decreases with altitude")
{
    const f64 low  = Coordinates::refraction(5.0 * astro_constants::kDegToRad);
    const f64 mid  = Coordinates::refraction(20.0 * astro_constants::kDegToRad);
    const f64 high = Coordinates::refraction(60.0 * astro_constants::kDegToRad);
    CHECK(low > mid);
    CHECK(mid > high);
}

TEST_CASE("Topocentric altitude drops by the full parallax at the horizon")
{
    const f64 parallax = 1.0 * astro_constants::kDegToRad;   // Moon-like
    CHECK(Coordinates::topocentric_altitude(0.0, parallax) == doctest::Approx(-parallax).epsilon(1e-9));
    CHECK(Coordinates::topocentric_altitude(astro_constants::kHalfPi, parallax)
          == doctest::Approx(astro_constants::kHalfPi).epsilon(1e-9));
}
