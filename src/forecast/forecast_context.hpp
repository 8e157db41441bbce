#pragma once

/// @file forecast_context.hpp
/// @brief Request-scoped forecast result, built step by step by value.

#include "astro/event_engine.hpp"
#include "astro/location.hpp"
#include "core/types.hpp"
#include "forecast/forecast_series.hpp"
#include "forecast/local_forecast.hpp"
#include "grid/grid_indexer.hpp"
#include "scoring/score_engine.hpp"

#include <optional>
#include <vector>

namespace darksky::forecast
{
    /// @brief Everything computed for one request.
    ///
    /// Each with_* call returns a new context with one more stage filled in;
    /// the receiver is left unchanged.
    struct ForecastContext
    {
        astro::Location location;
        i32 bortle;
        i32 light_pollution_tier;
        grid::GridIndex cell{};

        ForecastSeries series{};
        LocalForecast local{};

        std::vector<astro::AstronomicalWindow> sun_windows;
        std::vector<astro::AstronomicalWindow> moon_windows;
        std::vector<astro::AstronomicalWindow> galactic_center_windows;
        std::optional<f64> max_altitude_deg;    ///< Cached per request

        std::vector<i32> hourly_scores;
        std::optional<scoring::Grade> grade;    ///< Empty: no available score

        [[nodiscard]] static ForecastContext start(astro::Location location, i32 bortle, grid::GridIndex cell);

        [[nodiscard]] ForecastContext with_series(ForecastSeries classified) const;
        [[nodiscard]] ForecastContext with_windows(std::vector<astro::AstronomicalWindow> sun,
                                                   std::vector<astro::AstronomicalWindow> moon,
                                                   std::vector<astro::AstronomicalWindow> galactic_center) const;
        [[nodiscard]] ForecastContext with_max_altitude(f64 degrees) const;
        [[nodiscard]] ForecastContext with_scores(std::vector<i32> scores,
                                                  std::optional<scoring::Grade> result) const;
    };

} // namespace darksky::forecast
