/// @file location.cpp
/// @brief Observer site validation and local-time conversion.

#include "astro/location.hpp"

#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <utility>

namespace darksky::astro
{

Location::Location(f64 latitude_deg, f64 longitude_deg, std::string time_zone_name, absl::TimeZone zone)
    : m_latitude(latitude_deg)
    , m_longitude(longitude_deg)
    , m_time_zone_name(std::move(time_zone_name))
    , m_time_zone(zone)
{
}

Location Location::resolve(f64 latitude_deg, f64 longitude_deg, const std::string& time_zone_name)
{
    core::ErrorContext context{
        .operation = "resolve_location",
        .latitude  = latitude_deg,
        .longitude = longitude_deg,
        .when      = std::nullopt,
    };

    if (!std::isfinite(latitude_deg) || latitude_deg < -90.0 || latitude_deg > 90.0)
    {
        throw core::InvalidInputError(
            fmt::format("Latitude {} is outside [-90, 90]", latitude_deg), std::move(context));
    }
    if (!std::isfinite(longitude_deg) || longitude_deg < -180.0 || longitude_deg > 180.0)
    {
        throw core::InvalidInputError(
            fmt::format("Longitude {} is outside [-180, 180]", longitude_deg), std::move(context));
    }

    absl::TimeZone zone;
    if (time_zone_name.empty() || !absl::LoadTimeZone(time_zone_name, &zone))
    {
        throw core::InvalidInputError(
            fmt::format("Unknown time zone '{}'", time_zone_name), std::move(context));
    }

    DSK_CORE_DEBUG("Resolved location ({:.4f}, {:.4f}) in {}", latitude_deg, longitude_deg, time_zone_name);
    return Location(latitude_deg, longitude_deg, time_zone_name, zone);
}

ObserverLocation Location::observer() const
{
    return ObserverLocation{
        .latitude_rad  = m_latitude * astro_constants::kDegToRad,
        .longitude_rad = m_longitude * astro_constants::kDegToRad,
    };
}

absl::CivilSecond Location::to_local(absl::Time instant) const
{
    return absl::ToCivilSecond(instant, m_time_zone);
}

absl::Time Location::to_utc(absl::CivilSecond local) const
{
    return m_time_zone.At(local).pre;
}

absl::Time Location::local_midnight(absl::CivilDay day) const
{
    return to_utc(absl::CivilSecond(day));
}

core::ErrorContext Location::error_context(std::string operation) const
{
    return core::ErrorContext{
        .operation = std::move(operation),
        .latitude  = m_latitude,
        .longitude = m_longitude,
        .when      = std::nullopt,
    };
}

} // namespace darksky::astro
