#pragma once

/// @file time_system.hpp
/// @brief Astronomical time utilities: Julian Date, sidereal time, instant conversion.

#include "core/types.hpp"

#include <absl/time/time.h>

namespace darksky::astro
{
    /// @brief Static utility class for astronomical time computations.
    ///
    /// Provides conversion between absl::Time instants and Julian Dates, ΔT for the
    /// dynamical-time arguments of the ephemeris, and Greenwich/Local Mean
    /// Sidereal Time (IAU 1982). All angular results are in radians unless noted otherwise.
    class TimeSystem
    {
    public:
        TimeSystem() = delete;

        /// @brief Julian Date (UT) of an absolute instant.
        [[nodiscard]] static f64 julian_date(absl::Time instant);

        /// @brief Absolute instant of a Julian Date (UT), rounded to the millisecond.
        [[nodiscard]] static absl::Time to_time(f64 jd);

        /// @brief Compute Julian centuries elapsed since J2000.0.
        /// @param jd Julian Date.
        /// @return T = (JD - 2451545.0) / 36525.0
        [[nodiscard]] static f64 julian_centuries(f64 jd);

        /// @brief ΔT = TT - UT in seconds (Espenak & Meeus polynomial fits).
        [[nodiscard]] static f64 delta_t_seconds(f64 jd_ut);

        /// @brief Julian Ephemeris Date (TT) for a Julian Date (UT).
        [[nodiscard]] static f64 to_terrestrial_time(f64 jd_ut);

        /// @brief Greenwich Mean Sidereal Time (radians).
        /// @param jd Julian Date (UT).
        /// @return GMST in radians, normalized to [0, 2π).
        /// Uses the IAU 1982 formula (accurate to ~0.1 second of time).
        [[nodiscard]] static f64 gmst(f64 jd);

        /// @brief Local Mean Sidereal Time (radians).
        /// @param jd Julian Date (UT).
        /// @param longitude_rad Observer longitude in radians (east positive).
        /// @return LMST in radians, normalized to [0, 2π).
        [[nodiscard]] static f64 lmst(f64 jd, f64 longitude_rad);

        /// @brief Normalize an angle to the range [0, 2π).
        [[nodiscard]] static f64 normalize_radians(f64 angle);
    };

} // namespace darksky::astro
