/// @file test_forecast_service.cpp
/// @brief End-to-end tests for darksky::forecast::ForecastService.
///
/// A miniature dataset tree (5×3 grid around Ann Arbor, one complete
/// 2023-07-01 00Z update) is written to a temporary directory and run
/// through the full pipeline.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "astro/location.hpp"
#include "core/config.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"
#include "forecast/forecast_context.hpp"
#include "forecast/forecast_service.hpp"
#include "grid/grid_assets.hpp"
#include "grid/npy_reader.hpp"
#include "npy_fixture.hpp"

#include <absl/time/civil_time.h>

#include <filesystem>
#include <fstream>

using namespace darksky;
using namespace darksky::forecast;

// =================================================================
// Custom main: initialize logger before tests
// =================================================================

int main(int argc, char** argv)
{
    darksky::core::Logger::init();
    const int result = doctest::Context(argc, argv).run();
    darksky::core::Logger::shutdown();
    return result;
}

namespace
{

constexpr u64 kRows = 5;
constexpr u64 kCols = 3;

std::shared_ptr<const grid::GridAssets> mini_assets()
{
    return grid::GridAssets::create({43.0, 42.75, 42.5, 42.25, 42.0}, {96.0, 96.25, 96.5},
                                    test::sample_transparency_table(), test::sample_score_table());
}

/// One complete update at <root>/20230701/00 with clear, dry, clean air.
void write_dataset(const std::filesystem::path& root, bool complete = true)
{
    const auto update = root / "20230701" / "00";
    std::filesystem::create_directories(update / "gfs");
    std::filesystem::create_directories(update / "gefs");

    for (i32 h = 0; h < 72; ++h)
    {
        test::write_uniform_grid(update / "gfs" / grid::NpyReader::forecast_filename("cloud", h), kRows, kCols, 5.0f);
        test::write_uniform_grid(update / "gfs" / grid::NpyReader::forecast_filename("humidity", h), kRows, kCols, 10.0f);
        if (h % 3 == 0)
        {
            test::write_uniform_grid(update / "gefs" / grid::NpyReader::forecast_filename("aerosol", h), kRows, kCols, 0.05f);
        }
    }
    if (complete)
    {
        std::ofstream(update / "complete.flag") << "";
    }
}

core::Config config_for(const std::filesystem::path& root)
{
    core::Config config;
    config.data.root = root;
    return config;
}

astro::Location ann_arbor()
{
    return astro::Location::resolve(42.2776, -83.7409, "America/Detroit");
}

} // namespace

// =================================================================
// Full pipeline
// =================================================================

TEST_CASE("Forecast for Ann Arbor from a 2023-07-01 00Z dataset")
{
    const test::TempDirectory dir("darksky_test_service");
    write_dataset(dir.path());

    const ForecastService service(config_for(dir.path()), mini_assets());
    const ForecastContext context = service.build(ann_arbor(), 2, absl::CivilDay(2023, 7, 1));

    // Request parameters
    CHECK(context.bortle == 2);
    CHECK(context.light_pollution_tier == 1);
    CHECK(context.cell == grid::GridIndex{.row = 3, .col = 1});

    // Series
    CHECK(context.series.timestamp == "2023070100");
    REQUIRE(context.series.records.size() == 72);
    for (const auto& record : context.series.records)
    {
        CHECK(record.transparency == 5);
    }

    // 00Z is 20:00 EDT on June 30
    CHECK(context.local.size() == 72);
    CHECK(context.local.days().front() == absl::CivilDay(2023, 6, 30));

    // Windows start on the first local date
    REQUIRE(context.sun_windows.size() == 4);
    CHECK(absl::CivilDay(context.sun_windows.front().set.local) == absl::CivilDay(2023, 6, 30));
    CHECK(context.moon_windows.size() == 4);
    REQUIRE(context.galactic_center_windows.size() == 4);
    for (const auto& window : context.galactic_center_windows)
    {
        CHECK(window.transit.has_value());
    }

    REQUIRE(context.max_altitude_deg.has_value());
    CHECK(*context.max_altitude_deg == doctest::Approx(astro::EventEngine::max_altitude(ann_arbor())));

    // Clear sky everywhere: 4 when the Moon is down, 1 when it is up
    REQUIRE(context.hourly_scores.size() >= 5);
    for (const i32 score : context.hourly_scores)
    {
        CHECK((score == 1 || score == 4));
    }
    CHECK(context.grade.has_value());
}

TEST_CASE("Configured window count reaches the event engine")
{
    const test::TempDirectory dir("darksky_test_service_windows");
    write_dataset(dir.path());

    core::Config config = config_for(dir.path());
    config.astronomy.window_count = 2;

    const ForecastService service(config, mini_assets());
    CHECK(service.event_engine().window_count() == 2);

    const ForecastContext context = service.build(ann_arbor(), 7, absl::CivilDay(2023, 7, 1));
    CHECK(context.sun_windows.size() == 2);
    CHECK(context.moon_windows.size() == 2);
    CHECK(context.light_pollution_tier == 3);
}

TEST_CASE("Series alone can be requested for a cell")
{
    const test::TempDirectory dir("darksky_test_service_series");
    write_dataset(dir.path());

    const ForecastService service(config_for(dir.path()), mini_assets());
    const ForecastSeries series = service.series(grid::GridIndex{.row = 0, .col = 2}, absl::CivilDay(2023, 7, 2));
    CHECK(series.timestamp == "2023070100");
    CHECK(series.records.size() == 72);
    CHECK(series.records.back().aerosol == doctest::Approx(0.05));
}

// =================================================================
// Failures
// =================================================================

TEST_CASE("Incomplete dataset is DataUnavailable")
{
    const test::TempDirectory dir("darksky_test_service_incomplete");
    write_dataset(dir.path(), false);

    const ForecastService service(config_for(dir.path()), mini_assets());
    CHECK_THROWS_AS((void)service.build(ann_arbor(), 2, absl::CivilDay(2023, 7, 1)), core::DataUnavailableError);
}

TEST_CASE("Invalid Bortle class is InvalidInput")
{
    const test::TempDirectory dir("darksky_test_service_bortle");
    write_dataset(dir.path());

    const ForecastService service(config_for(dir.path()), mini_assets());
    CHECK_THROWS_AS((void)service.build(ann_arbor(), 0, absl::CivilDay(2023, 7, 1)), core::InvalidInputError);
    CHECK_THROWS_AS((void)service.build(ann_arbor(), 10, absl::CivilDay(2023, 7, 1)), core::InvalidInputError);
}

TEST_CASE("Out-of-range forecast values are InvalidInput")
{
    const test::TempDirectory dir("darksky_test_service_values");
    write_dataset(dir.path());
    test::write_uniform_grid(dir.path() / "20230701" / "00" / "gfs" / "cloud.f030.npy", kRows, kCols, 150.0f);

    const ForecastService service(config_for(dir.path()), mini_assets());
    CHECK_THROWS_AS((void)service.build(ann_arbor(), 2, absl::CivilDay(2023, 7, 1)), core::InvalidInputError);
}
