/// @file score_engine.cpp
/// @brief Hourly scoring, dark-hour iteration and grading.

#include "scoring/score_engine.hpp"

#include "astro/ephemeris.hpp"
#include "astro/time_system.hpp"
#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <utility>

namespace darksky::scoring
{

namespace
{

std::string format_hour(absl::CivilHour hour)
{
    return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:00",
                       hour.year(), hour.month(), hour.day(), hour.hour());
}

} // namespace

std::string_view grade_name(Grade grade)
{
    switch (grade)
    {
        case Grade::S: return "S";
        case Grade::A: return "A";
        case Grade::B: return "B";
        case Grade::C: return "C";
    }
    return "?";
}

// -----------------------------------------------------------------
// HourlyScoreResult
// -----------------------------------------------------------------

HourlyScoreResult HourlyScoreResult::scored(i32 score)
{
    HourlyScoreResult result;
    result.m_score = score;
    return result;
}

HourlyScoreResult HourlyScoreResult::skipped(std::string reason, core::ErrorContext context)
{
    HourlyScoreResult result;
    result.m_reason = std::move(reason);
    result.m_context = std::move(context);
    return result;
}

i32 HourlyScoreResult::value() const
{
    if (!m_score)
    {
        throw core::MissingDataError(m_reason, m_context);
    }
    return *m_score;
}

// -----------------------------------------------------------------
// ScoreEngine
// -----------------------------------------------------------------

ScoreEngine::ScoreEngine(std::shared_ptr<const grid::GridAssets> assets)
    : m_assets(std::move(assets))
{
}

i32 ScoreEngine::light_pollution_tier(i32 bortle)
{
    if (bortle < 1 || bortle > 9)
    {
        throw core::InvalidInputError(fmt::format("Bortle class {} is outside 1..9", bortle),
                                      core::ErrorContext{.operation = "light_pollution_tier"});
    }
    if (bortle == 1)
    {
        return 0;
    }
    if (bortle <= 4)
    {
        return 1;
    }
    if (bortle == 5)
    {
        return 2;
    }
    return 3;
}

i32 ScoreEngine::transparency_index(i32 rating)
{
    if (rating < 1 || rating > 5)
    {
        throw core::InvalidInputError(fmt::format("Transparency rating {} is outside 1..5", rating),
                                      core::ErrorContext{.operation = "transparency_index"});
    }
    return 5 - rating;
}

bool ScoreEngine::is_moon_free(const astro::Location& location, absl::Time hour_start)
{
    const astro::ObserverLocation observer = location.observer();

    const f64 start_jd = astro::TimeSystem::julian_date(hour_start);
    if (astro::Ephemeris::apparent_altitude(astro::Body::Moon, observer, start_jd) > 0.0)
    {
        return false;
    }

    const f64 end_jd = astro::TimeSystem::julian_date(hour_start + absl::Hours(1));
    return astro::Ephemeris::apparent_altitude(astro::Body::Moon, observer, end_jd) <= 0.0;
}

HourlyScoreResult ScoreEngine::hourly_score(const astro::Location& location,
                                            absl::CivilHour local_hour,
                                            i32 light_pollution_tier,
                                            const forecast::LocalForecast& forecast) const
{
    if (light_pollution_tier < 0 || light_pollution_tier > 3)
    {
        throw core::InvalidInputError(
            fmt::format("Light-pollution tier {} is outside 0..3", light_pollution_tier),
            location.error_context("hourly_score"));
    }

    const absl::Time start = location.to_utc(absl::CivilSecond(local_hour));
    if (!is_moon_free(location, start))
    {
        return HourlyScoreResult::scored(1);
    }

    core::ErrorContext context = location.error_context("hourly_score");
    context.when = format_hour(local_hour);

    const forecast::ForecastRecord* record = forecast.find(local_hour);
    if (record == nullptr)
    {
        return HourlyScoreResult::skipped(
            fmt::format("No available data for {}", format_hour(local_hour)), std::move(context));
    }
    if (!record->transparency)
    {
        return HourlyScoreResult::skipped(
            fmt::format("No transparency rating for {}", format_hour(local_hour)), std::move(context));
    }

    const i32 index = transparency_index(*record->transparency);
    return HourlyScoreResult::scored(m_assets->score(light_pollution_tier, index));
}

std::vector<i32> ScoreEngine::dark_hour_scores(const astro::Location& location,
                                               std::span<const astro::AstronomicalWindow> sun_windows,
                                               i32 light_pollution_tier,
                                               const forecast::LocalForecast& forecast) const
{
    std::vector<i32> scores;
    for (const auto& window : sun_windows)
    {
        const absl::CivilSecond sunset = window.set.local;
        const absl::CivilSecond sunrise = window.rise.local;

        // Round sunset up and sunrise down to whole hours
        absl::CivilHour hour(sunset);
        if (sunset.minute() != 0 || sunset.second() != 0)
        {
            ++hour;
        }
        const absl::CivilHour last(sunrise);

        for (; hour < last; ++hour)
        {
            const HourlyScoreResult result = hourly_score(location, hour, light_pollution_tier, forecast);
            if (!result.is_scored())
            {
                DSK_ERROR("Ignored error: {}", result.reason());
                continue;
            }
            scores.push_back(result.value());
        }
    }
    return scores;
}

Grade ScoreEngine::aggregate_grade(std::span<const i32> scores)
{
    if (static_cast<i32>(scores.size()) < kMinimumScores)
    {
        throw core::InsufficientDataError(
            fmt::format("Not enough valid hourly scores ({} of {})", scores.size(), kMinimumScores),
            core::ErrorContext{.operation = "aggregate_grade"});
    }
    for (const i32 score : scores)
    {
        if (score < 1 || score > 4)
        {
            throw core::InvalidInputError(fmt::format("Hourly score {} outside 1..4", score),
                                          core::ErrorContext{.operation = "aggregate_grade"});
        }
    }

    const auto count_at_least = [&scores](i32 threshold)
    {
        return std::count_if(scores.begin(), scores.end(), [threshold](i32 s) { return s >= threshold; });
    };

    if (count_at_least(4) >= 3)
    {
        return Grade::S;
    }
    if (count_at_least(3) >= 3)
    {
        return Grade::A;
    }
    if (count_at_least(2) >= 5)
    {
        return Grade::B;
    }
    return Grade::C;
}

} // namespace darksky::scoring
