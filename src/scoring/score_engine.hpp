#pragma once

/// @file score_engine.hpp
/// @brief Hourly stargazing scores and their aggregate grade.

#include "astro/event_engine.hpp"
#include "astro/location.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "forecast/local_forecast.hpp"
#include "grid/grid_assets.hpp"

#include <absl/time/civil_time.h>
#include <absl/time/time.h>

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace darksky::scoring
{
    /// @brief Aggregate quality of a forecast horizon, best first.
    enum class Grade
    {
        S,
        A,
        B,
        C,
    };

    [[nodiscard]] std::string_view grade_name(Grade grade);

    /// @brief Outcome of scoring one hour: a score 1..4, or a skip with its reason.
    class HourlyScoreResult
    {
    public:
        [[nodiscard]] static HourlyScoreResult scored(i32 score);
        [[nodiscard]] static HourlyScoreResult skipped(std::string reason, core::ErrorContext context);

        [[nodiscard]] bool is_scored() const noexcept { return m_score.has_value(); }

        /// @brief The score.
        /// @throws core::MissingDataError if the hour was skipped.
        [[nodiscard]] i32 value() const;

        [[nodiscard]] const std::string& reason() const noexcept { return m_reason; }
        [[nodiscard]] const core::ErrorContext& context() const noexcept { return m_context; }

    private:
        std::optional<i32> m_score;
        std::string m_reason;
        core::ErrorContext m_context;
    };

    /// @brief Combines moon visibility, transparency and light pollution.
    ///
    /// Score 1 = poor, 4 = excellent. An hour with the Moon above the horizon
    /// at either end scores 1 regardless of the sky; otherwise the score comes
    /// from score_table[light-pollution tier][transparency index].
    class ScoreEngine
    {
    public:
        static constexpr i32 kMinimumScores = 5;

        explicit ScoreEngine(std::shared_ptr<const grid::GridAssets> assets);

        /// @brief Tier 0 for Bortle 1, 1 for 2..4, 2 for 5, 3 for 6..9.
        /// @throws core::InvalidInputError outside 1..9.
        [[nodiscard]] static i32 light_pollution_tier(i32 bortle);

        /// @brief Reverse a transparency rating (5 → 0 .. 1 → 4).
        /// @throws core::InvalidInputError outside 1..5.
        [[nodiscard]] static i32 transparency_index(i32 rating);

        /// @brief True when the Moon's apparent center is at or below the
        /// horizon at both @p hour_start and one hour later.
        [[nodiscard]] static bool is_moon_free(const astro::Location& location, absl::Time hour_start);

        /// @brief Score for one local hour.
        /// @throws core::InvalidInputError for an invalid tier or transparency rating.
        [[nodiscard]] HourlyScoreResult hourly_score(const astro::Location& location,
                                                     absl::CivilHour local_hour,
                                                     i32 light_pollution_tier,
                                                     const forecast::LocalForecast& forecast) const;

        /// @brief Scores of every whole local hour inside the Sun's dark windows.
        ///
        /// Each window's sunset is rounded up and its sunrise down to the hour.
        /// Skipped hours are logged and left out.
        [[nodiscard]] std::vector<i32> dark_hour_scores(const astro::Location& location,
                                                        std::span<const astro::AstronomicalWindow> sun_windows,
                                                        i32 light_pollution_tier,
                                                        const forecast::LocalForecast& forecast) const;

        /// @brief Grade from at least five hourly scores.
        ///
        /// Three 4s → S; else three scores ≥ 3 → A; else five scores ≥ 2 → B; else C.
        /// @throws core::InsufficientDataError for fewer than five scores.
        /// @throws core::InvalidInputError for a score outside 1..4.
        [[nodiscard]] static Grade aggregate_grade(std::span<const i32> scores);

    private:
        std::shared_ptr<const grid::GridAssets> m_assets;
    };

} // namespace darksky::scoring
