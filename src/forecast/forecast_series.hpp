#pragma once

/// @file forecast_series.hpp
/// @brief Hourly point forecasts assembled from per-hour grids.

#include "core/config.hpp"
#include "core/types.hpp"
#include "forecast/dataset_resolver.hpp"
#include "grid/grid_indexer.hpp"

#include <absl/time/time.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace darksky::forecast
{
    /// @brief One forecast hour at one grid cell.
    struct ForecastRecord
    {
        i32 hour;                           ///< Offset from the base timestamp, 0..71
        f64 cloud;                          ///< Total cloud cover (%)
        f64 humidity;                       ///< Relative humidity (%)
        f64 aerosol;                        ///< Aerosol optical depth
        std::optional<i32> transparency;    ///< Rating 1..5, set by the classifier
    };

    /// @brief Contiguous hourly series anchored to a UTC base timestamp.
    struct ForecastSeries
    {
        std::string timestamp;              ///< YYYYMMDDHH
        absl::Time base;                    ///< Instant of hour 0
        std::vector<ForecastRecord> records;

        /// @brief Instant of a record's forecast hour.
        [[nodiscard]] absl::Time instant(const ForecastRecord& record) const
        {
            return base + absl::Hours(record.hour);
        }
    };

    /// @brief Per-variable values of one source, one entry per forecast hour.
    struct DatasetSeries
    {
        DatasetKind kind;
        std::string timestamp;
        std::map<std::string, std::vector<f64>> variables;
    };

    /// @brief Reads per-hour grids of a resolved dataset at one cell.
    ///
    /// The hourly source must provide every hour; the lower-cadence source
    /// provides every interval-th hour and the hours in between are filled
    /// from the preceding sampled hour.
    class SeriesAssembler
    {
    public:
        explicit SeriesAssembler(core::ForecastConfig config);

        /// @brief Sampling interval of a source in hours.
        [[nodiscard]] i32 interval(DatasetKind kind) const;

        /// @throws core::DataUnavailableError if the directory or a required hour is missing.
        [[nodiscard]] DatasetSeries assemble(DatasetKind kind, const grid::GridIndex& cell,
                                             const DatasetWindow& window) const;

        /// @brief Combine the hourly and 3-hourly series into forecast records.
        ///
        /// A timestamp mismatch between the sources is logged; the aerosol
        /// source's timestamp becomes the series base.
        /// @throws core::InvalidInputError if the base timestamp is malformed.
        [[nodiscard]] ForecastSeries merge(const DatasetSeries& gfs, const DatasetSeries& gefs) const;

        /// @brief Parse YYYYMMDDHH as a UTC instant.
        [[nodiscard]] static std::optional<absl::Time> parse_timestamp(const std::string& timestamp);

    private:
        core::ForecastConfig m_config;
    };

} // namespace darksky::forecast
