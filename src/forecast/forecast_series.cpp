/// @file forecast_series.cpp
/// @brief Grid sampling, gap filling and source merging.

#include "forecast/forecast_series.hpp"

#include "core/error.hpp"
#include "core/logger.hpp"
#include "grid/npy_reader.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <charconv>
#include <string_view>
#include <system_error>
#include <utility>

namespace darksky::forecast
{

namespace
{

core::ErrorContext series_context(const DatasetWindow& window)
{
    return core::ErrorContext{.operation = "assemble_series", .when = window.timestamp};
}

const std::vector<f64>& variable_or_throw(const DatasetSeries& series, const std::string& name)
{
    const auto it = series.variables.find(name);
    if (it == series.variables.end())
    {
        throw core::DataUnavailableError(
            fmt::format("{} series has no '{}' values", dataset_kind_name(series.kind), name),
            core::ErrorContext{.operation = "merge_series", .when = series.timestamp});
    }
    return it->second;
}

} // namespace

SeriesAssembler::SeriesAssembler(core::ForecastConfig config)
    : m_config(config)
{
}

i32 SeriesAssembler::interval(DatasetKind kind) const
{
    return kind == DatasetKind::Gefs ? m_config.aerosol_interval : 1;
}

std::optional<absl::Time> SeriesAssembler::parse_timestamp(const std::string& timestamp)
{
    if (timestamp.size() != 10)
    {
        return std::nullopt;
    }

    const auto date = DatasetResolver::parse_date(std::string_view(timestamp).substr(0, 8));
    i32 hour = 0;
    const char* first = timestamp.data() + 8;
    const auto [ptr, ec] = std::from_chars(first, first + 2, hour);
    if (!date || ec != std::errc{} || ptr != first + 2 || hour < 0 || hour > 23)
    {
        DSK_CORE_DEBUG("Rejected timestamp '{}'", timestamp);
        return std::nullopt;
    }
    return absl::FromCivil(absl::CivilHour(*date) + hour, absl::UTCTimeZone());
}

// -----------------------------------------------------------------
// Assembly
// -----------------------------------------------------------------

DatasetSeries SeriesAssembler::assemble(DatasetKind kind, const grid::GridIndex& cell,
                                        const DatasetWindow& window) const
{
    std::error_code ec;
    if (!std::filesystem::is_directory(window.path, ec))
    {
        throw core::DataUnavailableError(
            fmt::format("Dataset directory {} does not exist", window.path.string()),
            series_context(window));
    }

    const i32 hours = core::ForecastConfig::kHours;
    const i32 step = interval(kind);
    const std::vector<std::string> names = dataset_variables(kind);

    // Sampled values keyed by variable, then by forecast hour
    std::map<std::string, std::map<i32, f64>> sampled;

    for (const auto& entry : std::filesystem::directory_iterator(window.path, ec))
    {
        if (!entry.is_regular_file())
        {
            continue;
        }
        const std::string filename = entry.path().filename().string();
        const auto file = grid::NpyReader::parse_forecast_filename(filename);
        if (!file)
        {
            DSK_CORE_DEBUG("Ignoring {} in {}", filename, window.path.string());
            continue;
        }
        if (std::find(names.begin(), names.end(), file->variable) == names.end() || file->hour >= hours)
        {
            continue;
        }

        const auto value = grid::NpyReader::read_element(entry.path(),
                                                         static_cast<u64>(cell.row),
                                                         static_cast<u64>(cell.col));
        if (!value)
        {
            throw core::DataUnavailableError(
                fmt::format("Cannot read grid {}", entry.path().string()), series_context(window));
        }
        sampled[file->variable][file->hour] = *value;
    }
    if (ec)
    {
        throw core::DataUnavailableError(
            fmt::format("Cannot list {}: {}", window.path.string(), ec.message()), series_context(window));
    }

    DatasetSeries series{.kind = kind, .timestamp = window.timestamp, .variables = {}};
    for (const auto& name : names)
    {
        const auto& by_hour = sampled[name];
        std::vector<f64> values(static_cast<std::size_t>(hours));

        for (i32 hour = 0; hour < hours; ++hour)
        {
            // Hours between samples repeat the preceding sample
            const i32 source_hour = (hour / step) * step;
            const auto it = by_hour.find(source_hour);
            if (it == by_hour.end())
            {
                throw core::DataUnavailableError(
                    fmt::format("Missing {} grid for forecast hour {} in {}",
                                name, source_hour, window.path.string()),
                    series_context(window));
            }
            values[static_cast<std::size_t>(hour)] = it->second;
        }
        series.variables.emplace(name, std::move(values));
    }

    DSK_DEBUG("Assembled {} series {} at cell ({}, {})",
              dataset_kind_name(kind), window.timestamp, cell.row, cell.col);
    return series;
}

// -----------------------------------------------------------------
// Merge
// -----------------------------------------------------------------

ForecastSeries SeriesAssembler::merge(const DatasetSeries& gfs, const DatasetSeries& gefs) const
{
    if (gfs.timestamp != gefs.timestamp)
    {
        DSK_ERROR("GFS and GEFS data have different timestamps: {} {}", gfs.timestamp, gefs.timestamp);
    }

    const auto base = parse_timestamp(gefs.timestamp);
    if (!base)
    {
        throw core::InvalidInputError(
            fmt::format("Malformed dataset timestamp '{}'", gefs.timestamp),
            core::ErrorContext{.operation = "merge_series", .when = gefs.timestamp});
    }

    const auto& cloud = variable_or_throw(gfs, "cloud");
    const auto& humidity = variable_or_throw(gfs, "humidity");
    const auto& aerosol = variable_or_throw(gefs, "aerosol");

    const std::size_t hours = static_cast<std::size_t>(core::ForecastConfig::kHours);
    if (cloud.size() < hours || humidity.size() < hours || aerosol.size() < hours)
    {
        throw core::DataUnavailableError(
            fmt::format("Series shorter than {} hours", hours),
            core::ErrorContext{.operation = "merge_series", .when = gefs.timestamp});
    }

    ForecastSeries series{.timestamp = gefs.timestamp, .base = *base, .records = {}};
    series.records.reserve(hours);
    for (std::size_t h = 0; h < hours; ++h)
    {
        series.records.push_back(ForecastRecord{
            .hour         = static_cast<i32>(h),
            .cloud        = cloud[h],
            .humidity     = humidity[h],
            .aerosol      = aerosol[h],
            .transparency = std::nullopt,
        });
    }
    return series;
}

} // namespace darksky::forecast
