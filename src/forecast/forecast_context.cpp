/// @file forecast_context.cpp
/// @brief Stage-by-stage construction of the request context.

#include "forecast/forecast_context.hpp"

#include <utility>

namespace darksky::forecast
{

ForecastContext ForecastContext::start(astro::Location location, i32 bortle, grid::GridIndex cell)
{
    return ForecastContext{
        .location             = std::move(location),
        .bortle               = bortle,
        .light_pollution_tier = scoring::ScoreEngine::light_pollution_tier(bortle),
        .cell                 = cell,
    };
}

ForecastContext ForecastContext::with_series(ForecastSeries classified) const
{
    ForecastContext next = *this;
    next.local = LocalForecast::group(classified, location);
    next.series = std::move(classified);
    return next;
}

ForecastContext ForecastContext::with_windows(std::vector<astro::AstronomicalWindow> sun,
                                              std::vector<astro::AstronomicalWindow> moon,
                                              std::vector<astro::AstronomicalWindow> galactic_center) const
{
    ForecastContext next = *this;
    next.sun_windows = std::move(sun);
    next.moon_windows = std::move(moon);
    next.galactic_center_windows = std::move(galactic_center);
    return next;
}

ForecastContext ForecastContext::with_max_altitude(f64 degrees) const
{
    ForecastContext next = *this;
    next.max_altitude_deg = degrees;
    return next;
}

ForecastContext ForecastContext::with_scores(std::vector<i32> scores, std::optional<scoring::Grade> result) const
{
    ForecastContext next = *this;
    next.hourly_scores = std::move(scores);
    next.grade = result;
    return next;
}

} // namespace darksky::forecast
