/// @file forecast_service.cpp
/// @brief Forecast pipeline.

#include "forecast/forecast_service.hpp"

#include "core/error.hpp"
#include "core/logger.hpp"
#include "forecast/transparency.hpp"
#include "grid/grid_indexer.hpp"

#include <utility>

namespace darksky::forecast
{

ForecastService::ForecastService(const core::Config& config, std::shared_ptr<const grid::GridAssets> assets)
    : m_assets(assets)
    , m_resolver(config.data)
    , m_assembler(config.forecast)
    , m_event_engine(config.astronomy.window_count)
    , m_score_engine(std::move(assets))
{
}

ForecastSeries ForecastService::series(const grid::GridIndex& cell,
                                       std::optional<absl::CivilDay> reference_date) const
{
    const DatasetWindow gfs_window = m_resolver.resolve(DatasetKind::Gfs, reference_date);
    const DatasetWindow gefs_window = m_resolver.resolve(DatasetKind::Gefs, reference_date);

    const DatasetSeries gfs = m_assembler.assemble(DatasetKind::Gfs, cell, gfs_window);
    const DatasetSeries gefs = m_assembler.assemble(DatasetKind::Gefs, cell, gefs_window);

    return TransparencyClassifier::classify(*m_assets, m_assembler.merge(gfs, gefs));
}

ForecastContext ForecastService::build(const astro::Location& location, i32 bortle,
                                       std::optional<absl::CivilDay> reference_date) const
{
    DSK_INFO("Forecast requested for ({:.4f}, {:.4f}) {}, Bortle {}",
             location.latitude(), location.longitude(), location.time_zone_name(), bortle);

    const grid::GridIndex cell = grid::GridIndexer::index(*m_assets, location.latitude(), location.longitude());

    ForecastContext context = ForecastContext::start(location, bortle, cell);
    context = context.with_series(series(cell, reference_date));

    const std::vector<absl::CivilDay> days = context.local.days();
    if (days.empty())
    {
        throw core::DataUnavailableError("Forecast series is empty",
                                         location.error_context("forecast"));
    }
    const absl::CivilDay first_day = days.front();

    context = context.with_windows(
        m_event_engine.windows(location, astro::Body::Sun, first_day),
        m_event_engine.windows(location, astro::Body::Moon, first_day),
        m_event_engine.windows(location, astro::Body::GalacticCenter, first_day));

    context = context.with_max_altitude(astro::EventEngine::max_altitude(location));

    std::vector<i32> scores = m_score_engine.dark_hour_scores(
        location, context.sun_windows, context.light_pollution_tier, context.local);

    std::optional<scoring::Grade> grade;
    try
    {
        grade = scoring::ScoreEngine::aggregate_grade(scores);
    }
    catch (const core::InsufficientDataError& error)
    {
        DSK_WARN("{}", error.what());
    }

    DSK_INFO("Forecast {} at ({:.4f}, {:.4f}): {} hourly scores, grade {}",
             context.series.timestamp, location.latitude(), location.longitude(), scores.size(),
             grade ? scoring::grade_name(*grade) : std::string_view{"none"});

    return context.with_scores(std::move(scores), grade);
}

} // namespace darksky::forecast
