/// @file history_service.cpp
/// @brief Monthly median lookup and yearly sky calendar.

#include "forecast/history_service.hpp"

#include "core/error.hpp"
#include "core/logger.hpp"
#include "grid/npy_reader.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <string>
#include <utility>

namespace darksky::forecast
{

namespace
{

core::ErrorContext history_context(i32 month)
{
    return core::ErrorContext{.operation = "historical_transparency", .when = fmt::format("month {}", month)};
}

} // namespace

HistoryService::HistoryService(core::HistoryConfig config, std::shared_ptr<const grid::GridAssets> assets)
    : m_config(std::move(config))
    , m_assets(std::move(assets))
{
}

f64 HistoryService::read(const grid::GridIndex& cell, i32 month, std::string_view variable) const
{
    const auto path = m_config.root / std::to_string(month) / (std::string(variable) + ".npy");
    const std::optional<f64> value = grid::NpyReader::read_element(
        path, static_cast<u64>(cell.row), static_cast<u64>(cell.col));
    if (!value || !std::isfinite(*value))
    {
        throw core::DataUnavailableError(
            fmt::format("No historical {} at ({}, {}) in {}", variable, cell.row, cell.col, path.string()),
            history_context(month));
    }
    return *value;
}

MonthlyClimate HistoryService::month(const grid::GridIndex& cell, i32 month) const
{
    if (month < 1 || month > 12)
    {
        throw core::InvalidInputError(fmt::format("Month {} is outside 1..12", month), history_context(month));
    }

    const f64 transparency = read(cell, month, "transparency");
    const i32 rating = static_cast<i32>(std::lround(transparency));
    if (rating < 1 || rating > 5)
    {
        throw core::DataUnavailableError(
            fmt::format("Historical transparency {} at ({}, {}) outside 1..5", transparency, cell.row, cell.col),
            history_context(month));
    }

    return MonthlyClimate{
        .month        = month,
        .transparency = rating,
        .cloud        = read(cell, month, "cloud"),
        .humidity     = read(cell, month, "humidity"),
        .aerosol      = read(cell, month, "aerosol"),
    };
}

HistoricalSummary HistoryService::summary(const astro::Location& location, i32 year) const
{
    DSK_INFO("Historical summary requested for ({:.4f}, {:.4f}) {}, year {}",
             location.latitude(), location.longitude(), location.time_zone_name(), year);

    const grid::GridIndex cell = grid::GridIndexer::index(*m_assets, location.latitude(), location.longitude());

    std::vector<MonthlyClimate> months;
    months.reserve(12);
    for (i32 m = 1; m <= 12; ++m)
    {
        months.push_back(month(cell, m));
    }

    HistoricalSummary summary{
        .cell             = cell,
        .year             = year,
        .months           = std::move(months),
        .milky_way_season = astro::EventEngine::milky_way_season(location, year),
        .max_altitude_deg = astro::EventEngine::max_altitude(location),
        .new_moon_dates   = astro::EventEngine::new_moon_dates(location, year),
    };

    DSK_INFO("Historical summary at cell ({}, {}): {} new moons, Milky Way season {}",
             cell.row, cell.col, summary.new_moon_dates.size(),
             summary.milky_way_season ? "found" : "not found");
    return summary;
}

} // namespace darksky::forecast
