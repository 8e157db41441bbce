#pragma once

/// @file local_forecast.hpp
/// @brief Forecast records grouped by local date and hour.

#include "astro/location.hpp"
#include "forecast/forecast_series.hpp"

#include <absl/time/civil_time.h>

#include <cstddef>
#include <map>
#include <utility>
#include <vector>

namespace darksky::forecast
{
    /// @brief Lookup of forecast records by local civil hour.
    ///
    /// Built from a series and the location's zone. When a DST fall-back
    /// repeats a local hour, the earlier record is kept.
    class LocalForecast
    {
    public:
        LocalForecast() = default;

        [[nodiscard]] static LocalForecast group(const ForecastSeries& series, const astro::Location& location);

        /// @brief Record for a local hour, or nullptr when the series does not cover it.
        [[nodiscard]] const ForecastRecord* find(absl::CivilHour local_hour) const;

        /// @brief Local dates covered, in order.
        [[nodiscard]] std::vector<absl::CivilDay> days() const;

        /// @brief Records of one local date, ordered by hour.
        [[nodiscard]] std::vector<std::pair<absl::CivilHour, ForecastRecord>> hours_of(absl::CivilDay day) const;

        [[nodiscard]] bool empty() const noexcept { return m_hours.empty(); }
        [[nodiscard]] std::size_t size() const noexcept { return m_hours.size(); }

    private:
        std::map<absl::CivilHour, ForecastRecord> m_hours;
    };

} // namespace darksky::forecast
