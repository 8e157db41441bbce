/// @file transparency.cpp
/// @brief Bucket boundaries and per-hour classification.

#include "forecast/transparency.hpp"

#include "core/error.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>

namespace darksky::forecast
{

i32 TransparencyClassifier::cloud_humidity_bucket(f64 percent)
{
    if (!(percent >= 0.0 && percent <= 100.0))
    {
        throw core::InvalidInputError(
            fmt::format("Percentage {} is outside [0, 100]", percent),
            core::ErrorContext{.operation = "classify"});
    }
    if (percent < 20.0)
    {
        return 0;
    }
    if (percent < 40.0)
    {
        return 1;
    }
    return 2;
}

i32 TransparencyClassifier::aerosol_bucket(f64 concentration)
{
    if (!(concentration >= 0.0) || !std::isfinite(concentration))
    {
        throw core::InvalidInputError(
            fmt::format("Aerosol concentration {} is invalid", concentration),
            core::ErrorContext{.operation = "classify"});
    }
    if (concentration < 0.1)
    {
        return 0;
    }
    if (concentration < 0.3)
    {
        return 1;
    }
    return 2;
}

i32 TransparencyClassifier::rating(const grid::GridAssets& assets, const ForecastRecord& record)
{
    return assets.transparency(cloud_humidity_bucket(record.cloud),
                               cloud_humidity_bucket(record.humidity),
                               aerosol_bucket(record.aerosol));
}

ForecastSeries TransparencyClassifier::classify(const grid::GridAssets& assets, ForecastSeries series)
{
    for (auto& record : series.records)
    {
        try
        {
            record.transparency = rating(assets, record);
        }
        catch (const core::InvalidInputError& error)
        {
            // Re-raise with the forecast hour that carried the bad value
            throw core::InvalidInputError(
                error.message(),
                core::ErrorContext{
                    .operation = "classify",
                    .when      = fmt::format("{}+{}h", series.timestamp, record.hour),
                });
        }
    }
    return series;
}

} // namespace darksky::forecast
