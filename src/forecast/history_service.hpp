#pragma once

/// @file history_service.hpp
/// @brief Monthly climatology and yearly sky calendar for one location.

#include "astro/event_engine.hpp"
#include "astro/location.hpp"
#include "core/config.hpp"
#include "grid/grid_assets.hpp"
#include "grid/grid_indexer.hpp"

#include <absl/time/civil_time.h>

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace darksky::forecast
{
    /// @brief Median conditions of one calendar month at a grid cell.
    struct MonthlyClimate
    {
        i32 month;              ///< 1 = January .. 12 = December
        i32 transparency;       ///< Rating 1..5 from the conversion table
        f64 cloud;              ///< Total cloud cover (%)
        f64 humidity;           ///< Relative humidity (%)
        f64 aerosol;            ///< Aerosol optical depth
    };

    /// @brief Everything the historical view shows for a location and year.
    struct HistoricalSummary
    {
        grid::GridIndex cell;
        i32 year;
        std::vector<MonthlyClimate> months;                     ///< January first, 12 entries
        std::optional<astro::MilkyWaySeason> milky_way_season;
        f64 max_altitude_deg;                                   ///< Galactic Center culmination
        std::vector<absl::CivilDay> new_moon_dates;             ///< Local dates in @c year
    };

    /// @brief Reads the precomputed monthly medians and adds the yearly sky calendar.
    ///
    /// The medians live in <root>/<month>/<variable>.npy, one 2-D grid per
    /// variable, aligned with the forecast grid. Only the requested cell is read.
    class HistoryService
    {
    public:
        HistoryService(core::HistoryConfig config, std::shared_ptr<const grid::GridAssets> assets);

        /// @brief Medians of @p month at @p cell.
        /// @throws core::InvalidInputError for a month outside 1..12.
        /// @throws core::DataUnavailableError for a missing or malformed grid, or
        ///         a transparency value outside 1..5.
        [[nodiscard]] MonthlyClimate month(const grid::GridIndex& cell, i32 month) const;

        /// @brief Twelve months of medians plus the Milky Way season, the
        /// Galactic Center maximum altitude and the new moons of @p year.
        [[nodiscard]] HistoricalSummary summary(const astro::Location& location, i32 year) const;

    private:
        [[nodiscard]] f64 read(const grid::GridIndex& cell, i32 month, std::string_view variable) const;

        core::HistoryConfig m_config;
        std::shared_ptr<const grid::GridAssets> m_assets;
    };

} // namespace darksky::forecast
