/// @file test_time_system.cpp
/// @brief Unit tests for darksky::astro::TimeSystem.
///
/// Verifies Julian Dates of civil instants, absl::Time interop,
/// ΔT, GMST (IAU 1982) and LMST against known reference values.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <absl/time/civil_time.h>
#include <absl/time/time.h>

#include <cmath>

using namespace darksky;
using namespace darksky::astro;

// =================================================================
// Helpers
// =================================================================

static constexpr f64 kJdTolerance = 1e-6;   // ~0.086 seconds
static constexpr f64 kAngleTolDeg = 0.01;   // Degrees

/// Julian Date of a UTC civil time.
static f64 jd_utc(i32 year, i32 month, i32 day, i32 hour, i32 minute, i32 second)
{
    return TimeSystem::julian_date(
        absl::FromCivil(absl::CivilSecond(year, month, day, hour, minute, second), absl::UTCTimeZone()));
}

// =================================================================
// Julian Date of civil instants
// =================================================================

TEST_CASE("J2000.0 epoch gives JD 2451545.0")
{
    CHECK(jd_utc(2000, 1, 1, 12, 0, 0) == doctest::Approx(2451545.0).epsilon(kJdTolerance));
}

TEST_CASE("Known date: 1999-01-01 00:00 UTC → JD 2451179.5")
{
    CHECK(jd_utc(1999, 1, 1, 0, 0, 0) == doctest::Approx(2451179.5).epsilon(kJdTolerance));
}

TEST_CASE("Historical date: Sputnik launch 1957-10-04 19:28:34 UTC")
{
    CHECK(jd_utc(1957, 10, 4, 19, 28, 34) == doctest::Approx(2436116.31150).epsilon(1e-4));
}

// =================================================================
// Julian centuries
// =================================================================

TEST_CASE("Julian centuries at J2000.0 is 0.0")
{
    const f64 t = TimeSystem::julian_centuries(astro_constants::kJ2000);
    CHECK(t == doctest::Approx(0.0).epsilon(1e-12));
}

TEST_CASE("Julian centuries at J2100.0")
{
    // 2100-01-01 12:00 UTC is ~1.0 century after J2000.0
    const f64 t = TimeSystem::julian_centuries(jd_utc(2100, 1, 1, 12, 0, 0));
    CHECK(t == doctest::Approx(1.0).epsilon(0.001));
}

// =================================================================
// GMST tests
// =================================================================

TEST_CASE("GMST at J2000.0 ≈ 280.46° (≈ 4.8949 rad)")
{
    const f64 gmst_rad = TimeSystem::gmst(astro_constants::kJ2000);
    const f64 gmst_deg = gmst_rad * astro_constants::kRadToDeg;

    // IAU 1982 formula gives exactly 280.46061837° at J2000.0
    CHECK(gmst_deg == doctest::Approx(280.46).epsilon(kAngleTolDeg));
}

TEST_CASE("GMST is in range [0, 2π)")
{
    // Test across several dates
    const f64 dates[] = {
        2451545.0,   // J2000.0
        2460000.0,   // ~2023
        2460476.0,   // ~2024-06
        2440587.5,   // Unix epoch
    };

    for (const f64 jd : dates)
    {
        const f64 gmst_rad = TimeSystem::gmst(jd);
        CHECK(gmst_rad >= 0.0);
        CHECK(gmst_rad < astro_constants::kTwoPi);
    }
}

// =================================================================
// LMST tests
// =================================================================

TEST_CASE("LMST at Greenwich (longitude 0) equals GMST")
{
    const f64 jd = astro_constants::kJ2000;
    const f64 gmst_val = TimeSystem::gmst(jd);
    const f64 lmst_val = TimeSystem::lmst(jd, 0.0);

    CHECK(lmst_val == doctest::Approx(gmst_val).epsilon(1e-12));
}

TEST_CASE("LMST shifts east by longitude")
{
    const f64 jd = astro_constants::kJ2000;
    const f64 lon = 15.0 * astro_constants::kDegToRad;  // 15° East = 1 hour

    const f64 gmst_val = TimeSystem::gmst(jd);
    const f64 lmst_val = TimeSystem::lmst(jd, lon);

    // LMST should be GMST + 15° (mod 2π)
    f64 expected = std::fmod(gmst_val + lon, astro_constants::kTwoPi);
    if (expected < 0.0)
    {
        expected += astro_constants::kTwoPi;
    }

    CHECK(lmst_val == doctest::Approx(expected).epsilon(1e-10));
}

TEST_CASE("LMST is in range [0, 2π)")
{
    // Test with a western longitude (negative)
    const f64 jd = 2460000.0;
    const f64 lon = -104.02 * astro_constants::kDegToRad;  // McDonald Observatory

    const f64 lmst_val = TimeSystem::lmst(jd, lon);
    CHECK(lmst_val >= 0.0);
    CHECK(lmst_val < astro_constants::kTwoPi);
}

// =================================================================
// absl::Time interop
// =================================================================

TEST_CASE("Unix epoch instant is JD 2440587.5")
{
    CHECK(TimeSystem::julian_date(absl::UnixEpoch()) == doctest::Approx(2440587.5).epsilon(1e-12));
}

TEST_CASE("Civil instant and Julian Date agree with the Meeus conversion")
{
    const absl::Time instant = absl::FromCivil(absl::CivilSecond(2024, 6, 15, 22, 30, 0), absl::UTCTimeZone());
    CHECK(TimeSystem::julian_date(instant) == doctest::Approx(2460476.4375).epsilon(kJdTolerance));
}

TEST_CASE("to_time inverts julian_date to the millisecond")
{
    const absl::Time instant = absl::FromCivil(absl::CivilSecond(2023, 7, 1, 7, 47, 12), absl::UTCTimeZone());
    const absl::Time back = TimeSystem::to_time(TimeSystem::julian_date(instant));
    CHECK(std::abs(absl::ToDoubleMilliseconds(back - instant)) <= 1.0);
}

// =================================================================
// ΔT
// =================================================================

TEST_CASE("ΔT around 2023 is roughly 70 seconds")
{
    const f64 jd = jd_utc(2023, 7, 1, 0, 0, 0);
    const f64 delta_t = TimeSystem::delta_t_seconds(jd);
    CHECK(delta_t > 60.0);
    CHECK(delta_t < 80.0);
}

TEST_CASE("Terrestrial time runs ahead of UT by ΔT")
{
    const f64 jd = 2460000.0;
    const f64 jde = TimeSystem::to_terrestrial_time(jd);
    CHECK((jde - jd) * astro_constants::kSecondsPerDay
          == doctest::Approx(TimeSystem::delta_t_seconds(jd)).epsilon(1e-6));
}
