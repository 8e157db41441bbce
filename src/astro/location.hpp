#pragma once

/// @file location.hpp
/// @brief Observer site with its resolved IANA time zone.

#include "astro/coordinates.hpp"
#include "core/error.hpp"
#include "core/types.hpp"

#include <absl/time/civil_time.h>
#include <absl/time/time.h>

#include <string>

namespace darksky::astro
{
    /// @brief Immutable observer site: geographic position plus local time zone.
    ///
    /// Built only through resolve(), which validates the coordinate ranges and
    /// loads the zone from the system time-zone database.
    class Location
    {
    public:
        /// @brief Validate and resolve a site.
        /// @throws core::InvalidInputError for latitude outside [-90, 90], longitude
        ///         outside [-180, 180] or an unknown zone name.
        [[nodiscard]] static Location resolve(f64 latitude_deg, f64 longitude_deg,
                                              const std::string& time_zone_name);

        [[nodiscard]] f64 latitude() const noexcept { return m_latitude; }
        [[nodiscard]] f64 longitude() const noexcept { return m_longitude; }
        [[nodiscard]] const std::string& time_zone_name() const noexcept { return m_time_zone_name; }
        [[nodiscard]] const absl::TimeZone& time_zone() const noexcept { return m_time_zone; }

        /// @brief Position in radians for the coordinate transforms.
        [[nodiscard]] ObserverLocation observer() const;

        /// @brief Local civil time of an instant.
        [[nodiscard]] absl::CivilSecond to_local(absl::Time instant) const;

        /// @brief Instant of a local civil hour. Skipped or repeated hours
        /// around DST transitions resolve to the pre-transition offset.
        [[nodiscard]] absl::Time to_utc(absl::CivilSecond local) const;

        /// @brief Instant of local midnight starting @p day.
        [[nodiscard]] absl::Time local_midnight(absl::CivilDay day) const;

        /// @brief Error context naming this site.
        [[nodiscard]] core::ErrorContext error_context(std::string operation) const;

    private:
        Location(f64 latitude_deg, f64 longitude_deg, std::string time_zone_name, absl::TimeZone zone);

        f64 m_latitude;
        f64 m_longitude;
        std::string m_time_zone_name;
        absl::TimeZone m_time_zone;
    };

} // namespace darksky::astro
