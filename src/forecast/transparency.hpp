#pragma once

/// @file transparency.hpp
/// @brief Sky transparency from cloud, humidity and aerosol buckets.

#include "core/types.hpp"
#include "forecast/forecast_series.hpp"
#include "grid/grid_assets.hpp"

namespace darksky::forecast
{
    /// @brief Static bucketing and table lookup.
    ///
    /// Cloud and humidity: [0, 20) → 0, [20, 40) → 1, [40, 100] → 2.
    /// Aerosol: [0, 0.1) → 0, [0.1, 0.3) → 1, [0.3, ∞) → 2.
    class TransparencyClassifier
    {
    public:
        TransparencyClassifier() = delete;

        /// @throws core::InvalidInputError outside [0, 100].
        [[nodiscard]] static i32 cloud_humidity_bucket(f64 percent);

        /// @throws core::InvalidInputError for negative or non-finite values.
        [[nodiscard]] static i32 aerosol_bucket(f64 concentration);

        /// @brief Transparency rating of one record.
        [[nodiscard]] static i32 rating(const grid::GridAssets& assets, const ForecastRecord& record);

        /// @brief Copy of @p series with every record's transparency set.
        [[nodiscard]] static ForecastSeries classify(const grid::GridAssets& assets, ForecastSeries series);
    };

} // namespace darksky::forecast
