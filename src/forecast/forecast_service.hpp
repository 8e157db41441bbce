#pragma once

/// @file forecast_service.hpp
/// @brief End-to-end forecast for one location.

#include "astro/event_engine.hpp"
#include "astro/location.hpp"
#include "core/config.hpp"
#include "forecast/dataset_resolver.hpp"
#include "forecast/forecast_context.hpp"
#include "forecast/forecast_series.hpp"
#include "grid/grid_assets.hpp"
#include "scoring/score_engine.hpp"

#include <absl/time/civil_time.h>

#include <memory>
#include <optional>

namespace darksky::forecast
{
    /// @brief Runs resolver → assembler → classifier → event engine → scoring.
    ///
    /// Holds only immutable collaborators, so one instance can serve
    /// concurrent requests.
    class ForecastService
    {
    public:
        ForecastService(const core::Config& config, std::shared_ptr<const grid::GridAssets> assets);

        /// @brief Full forecast for a location.
        /// @param reference_date UTC date the dataset scan starts from; today when absent.
        /// @throws core::InvalidInputError for a bad Bortle class or forecast value.
        /// @throws core::DataUnavailableError when no complete dataset is found.
        /// @throws core::InconsistentEphemerisError when windows cannot be ordered.
        [[nodiscard]] ForecastContext build(const astro::Location& location, i32 bortle,
                                            std::optional<absl::CivilDay> reference_date = std::nullopt) const;

        /// @brief Classified 72-hour series at the location's grid cell.
        [[nodiscard]] ForecastSeries series(const grid::GridIndex& cell,
                                            std::optional<absl::CivilDay> reference_date) const;

        [[nodiscard]] const astro::EventEngine& event_engine() const noexcept { return m_event_engine; }
        [[nodiscard]] const scoring::ScoreEngine& score_engine() const noexcept { return m_score_engine; }

    private:
        std::shared_ptr<const grid::GridAssets> m_assets;
        DatasetResolver m_resolver;
        SeriesAssembler m_assembler;
        astro::EventEngine m_event_engine;
        scoring::ScoreEngine m_score_engine;
    };

} // namespace darksky::forecast
