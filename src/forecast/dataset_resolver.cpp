/// @file dataset_resolver.cpp
/// @brief Backward scan over dated update directories.

#include "forecast/dataset_resolver.hpp"

#include "core/error.hpp"
#include "core/logger.hpp"

#include <absl/time/clock.h>
#include <absl/time/time.h>
#include <spdlog/fmt/fmt.h>

#include <charconv>
#include <cstddef>
#include <system_error>
#include <utility>

namespace darksky::forecast
{

std::string_view dataset_kind_name(DatasetKind kind)
{
    switch (kind)
    {
        case DatasetKind::Gfs:  return "gfs";
        case DatasetKind::Gefs: return "gefs";
    }
    return "unknown";
}

std::vector<std::string> dataset_variables(DatasetKind kind)
{
    if (kind == DatasetKind::Gfs)
    {
        return {"cloud", "humidity"};
    }
    return {"aerosol"};
}

DatasetResolver::DatasetResolver(core::DataConfig config)
    : m_config(std::move(config))
{
}

std::optional<absl::CivilDay> DatasetResolver::parse_date(std::string_view yyyymmdd)
{
    if (yyyymmdd.size() != 8)
    {
        return std::nullopt;
    }

    // Fixed-width fields; absl's %Y would consume every digit
    const auto field = [yyyymmdd](std::size_t pos, std::size_t len) -> std::optional<i32>
    {
        i32 value = 0;
        const char* first = yyyymmdd.data() + pos;
        const auto [ptr, ec] = std::from_chars(first, first + len, value);
        if (ec != std::errc{} || ptr != first + len)
        {
            return std::nullopt;
        }
        return value;
    };

    const auto year = field(0, 4);
    const auto month = field(4, 2);
    const auto day = field(6, 2);
    if (!year || !month || !day)
    {
        DSK_CORE_DEBUG("Rejected date '{}': not all digits", yyyymmdd);
        return std::nullopt;
    }

    // CivilDay normalizes out-of-range fields; a changed field means an invalid date
    const absl::CivilDay date(*year, *month, *day);
    if (date.year() != *year || date.month() != *month || date.day() != *day)
    {
        DSK_CORE_DEBUG("Rejected date '{}': no such day", yyyymmdd);
        return std::nullopt;
    }
    return date;
}

DatasetWindow DatasetResolver::resolve(DatasetKind kind, std::optional<absl::CivilDay> reference_date) const
{
    const absl::CivilDay reference = reference_date
        ? *reference_date
        : absl::ToCivilDay(absl::Now(), absl::UTCTimeZone());

    for (i32 day_offset = 0; day_offset < m_config.lookback_days; ++day_offset)
    {
        const absl::CivilDay day = reference - day_offset;
        const std::string date = absl::FormatCivilTime(day);    // YYYY-MM-DD
        const std::string compact = fmt::format("{:04d}{:02d}{:02d}", day.year(), day.month(), day.day());

        for (const i32 hour : m_config.update_hours)
        {
            const std::string hh = fmt::format("{:02d}", hour);
            const std::filesystem::path update_dir = m_config.root / compact / hh;

            std::error_code ec;
            const bool complete = std::filesystem::is_directory(update_dir, ec)
                               && std::filesystem::exists(update_dir / m_config.completion_marker, ec);
            if (!complete)
            {
                DSK_CORE_TRACE("No complete dataset at {} {}Z", date, hh);
                continue;
            }

            DatasetWindow window{
                .path      = update_dir / std::string(dataset_kind_name(kind)),
                .timestamp = compact + hh,
            };
            DSK_CORE_DEBUG("Resolved {} dataset {} at {}", dataset_kind_name(kind),
                           window.timestamp, window.path.string());
            return window;
        }
    }

    const std::string reference_text = fmt::format("{:04d}{:02d}{:02d}",
                                                   reference.year(), reference.month(), reference.day());
    DSK_CORE_WARN("No complete {} dataset within {} days of {}",
                  dataset_kind_name(kind), m_config.lookback_days, reference_text);
    throw core::DataUnavailableError(
        "Cannot find processed NOAA datasets.",
        core::ErrorContext{.operation = "resolve_window", .when = reference_text});
}

} // namespace darksky::forecast
