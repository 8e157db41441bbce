/// @file local_forecast.cpp
/// @brief UTC forecast hours re-keyed by local civil hour.

#include "forecast/local_forecast.hpp"

namespace darksky::forecast
{

LocalForecast LocalForecast::group(const ForecastSeries& series, const astro::Location& location)
{
    LocalForecast grouped;
    for (const auto& record : series.records)
    {
        const absl::CivilHour local(location.to_local(series.instant(record)));
        grouped.m_hours.emplace(local, record);
    }
    return grouped;
}

const ForecastRecord* LocalForecast::find(absl::CivilHour local_hour) const
{
    const auto it = m_hours.find(local_hour);
    return it == m_hours.end() ? nullptr : &it->second;
}

std::vector<absl::CivilDay> LocalForecast::days() const
{
    std::vector<absl::CivilDay> result;
    for (const auto& [hour, record] : m_hours)
    {
        const absl::CivilDay day(hour);
        if (result.empty() || result.back() != day)
        {
            result.push_back(day);
        }
    }
    return result;
}

std::vector<std::pair<absl::CivilHour, ForecastRecord>> LocalForecast::hours_of(absl::CivilDay day) const
{
    std::vector<std::pair<absl::CivilHour, ForecastRecord>> result;
    const absl::CivilHour first(day);
    const absl::CivilHour last(day + 1);
    for (auto it = m_hours.lower_bound(first); it != m_hours.end() && it->first < last; ++it)
    {
        result.emplace_back(it->first, it->second);
    }
    return result;
}

} // namespace darksky::forecast
