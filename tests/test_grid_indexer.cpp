/// @file test_grid_indexer.cpp
/// @brief Unit tests for darksky::grid::GridAssets and GridIndexer.
///
/// Verifies nearest-cell selection on the 0.25° grid including ties,
/// bounds and longitude wrap, plus asset validation and loading.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "core/config.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"
#include "grid/grid_assets.hpp"
#include "grid/grid_indexer.hpp"
#include "npy_fixture.hpp"

#include <vector>

using namespace darksky;
using namespace darksky::grid;

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

std::shared_ptr<const GridAssets> regular_assets()
{
    return GridAssets::regular(test::sample_transparency_table(), test::sample_score_table());
}

} // namespace

// =================================================================
// Regular grid
// =================================================================

TEST_CASE("Regular grid axes")
{
    const auto assets = regular_assets();
    REQUIRE(assets->latitudes().size() == static_cast<std::size_t>(GridAssets::kRows));
    REQUIRE(assets->longitudes().size() == static_cast<std::size_t>(GridAssets::kCols));

    CHECK(assets->latitudes().front() == 90.0);
    CHECK(assets->latitudes()[360] == 0.0);
    CHECK(assets->latitudes().back() == -90.0);
    CHECK(assets->longitudes().front() == 0.0);
    CHECK(assets->longitudes().back() == 359.75);
}

// =================================================================
// Latitude index
// =================================================================

TEST_CASE("Latitude index: nearest row, first on ties")
{
    const auto assets = regular_assets();

    CHECK(GridIndexer::latitude_index(*assets, 90.0) == 0);
    CHECK(GridIndexer::latitude_index(*assets, 89.875) == 0);
    CHECK(GridIndexer::latitude_index(*assets, 89.9) == 0);
    CHECK(GridIndexer::latitude_index(*assets, 89.8) == 1);
    CHECK(GridIndexer::latitude_index(*assets, 0.125) == 359);
    CHECK(GridIndexer::latitude_index(*assets, 0.0) == 360);
    CHECK(GridIndexer::latitude_index(*assets, -0.125) == 360);
    CHECK(GridIndexer::latitude_index(*assets, -89.875) == 719);
    CHECK(GridIndexer::latitude_index(*assets, -90.0) == 720);
}

TEST_CASE("Latitude index rejects values off the globe")
{
    const auto assets = regular_assets();
    CHECK_THROWS_AS((void)GridIndexer::latitude_index(*assets, 90.01), core::InvalidInputError);
    CHECK_THROWS_AS((void)GridIndexer::latitude_index(*assets, -90.01), core::InvalidInputError);
}

// =================================================================
// Longitude index
// =================================================================

TEST_CASE("Longitude index is shifted by +180 degrees")
{
    const auto assets = regular_assets();

    CHECK(GridIndexer::longitude_index(*assets, -180.0) == 0);
    CHECK(GridIndexer::longitude_index(*assets, -179.875) == 0);
    CHECK(GridIndexer::longitude_index(*assets, -0.125) == 719);
    CHECK(GridIndexer::longitude_index(*assets, 0.0) == 720);
    CHECK(GridIndexer::longitude_index(*assets, 0.125) == 720);
    CHECK(GridIndexer::longitude_index(*assets, 179.625) == 1438);
    CHECK(GridIndexer::longitude_index(*assets, 180.0) == 1439);
}

TEST_CASE("Longitude index rejects values outside [-180, 180]")
{
    const auto assets = regular_assets();
    CHECK_THROWS_AS((void)GridIndexer::longitude_index(*assets, 180.5), core::InvalidInputError);
    CHECK_THROWS_AS((void)GridIndexer::longitude_index(*assets, -181.0), core::InvalidInputError);
}

TEST_CASE("Combined index for Ann Arbor")
{
    const auto assets = regular_assets();
    const GridIndex cell = GridIndexer::index(*assets, 42.2776, -83.7409);

    // 90 - 42.25 = 47.75 → row 191; -83.7409 + 180 = 96.2591 → 96.25 → col 385
    CHECK(cell == GridIndex{.row = 191, .col = 385});
}

TEST_CASE("Out-of-range index carries the offending coordinate")
{
    const auto assets = regular_assets();
    try
    {
        (void)GridIndexer::index(*assets, 95.0, 0.0);
        FAIL("expected InvalidInputError");
    }
    catch (const core::InvalidInputError& error)
    {
        REQUIRE(error.context().latitude.has_value());
        CHECK(*error.context().latitude == 95.0);
    }
}

// =================================================================
// Asset validation
// =================================================================

TEST_CASE("Asset creation validates coordinate arrays and tables")
{
    const auto transparency = test::sample_transparency_table();
    const auto scores = test::sample_score_table();

    CHECK_THROWS_AS((void)GridAssets::create({}, {0.0}, transparency, scores), core::InvalidInputError);
    CHECK_THROWS_AS((void)GridAssets::create({0.0}, {}, transparency, scores), core::InvalidInputError);

    auto bad_rating = transparency;
    bad_rating[1][1][1] = 0;
    CHECK_THROWS_AS((void)GridAssets::create({0.0}, {0.0}, bad_rating, scores), core::InvalidInputError);

    auto bad_score = scores;
    bad_score[3][4] = 5;
    CHECK_THROWS_AS((void)GridAssets::create({0.0}, {0.0}, transparency, bad_score), core::InvalidInputError);

    // Small grids are accepted with a warning
    const auto small = GridAssets::create({1.0, 0.0}, {0.0, 1.0}, transparency, scores);
    CHECK(small->latitudes().size() == 2);
    CHECK(small->transparency(0, 0, 0) == 5);
    CHECK(small->score(0, 0) == 4);
}

// =================================================================
// Asset loading
// =================================================================

TEST_CASE("Assets load from .npy files")
{
    const test::TempDirectory dir("darksky_test_assets");

    // 2-D latitude grid (column 0 is the axis), 1-D longitudes
    test::write_npy_f32(dir.path() / "lats.npy", {3, 2}, {45.0f, 45.0f, 44.75f, 44.75f, 44.5f, 44.5f});
    test::write_npy_f64(dir.path() / "lngs.npy", {4}, {96.0, 96.25, 96.5, 96.75});

    std::vector<i64> ratings;
    const auto table = test::sample_transparency_table();
    for (const auto& plane : table)
    {
        for (const auto& row : plane)
        {
            for (const i32 value : row)
            {
                ratings.push_back(value);
            }
        }
    }
    test::write_npy_i64(dir.path() / "transparency.npy", {3, 3, 3}, ratings);

    std::vector<i64> score_values;
    for (const auto& row : test::sample_score_table())
    {
        score_values.insert(score_values.end(), row.begin(), row.end());
    }
    test::write_npy_i64(dir.path() / "scores.npy", {4, 5}, score_values);

    const core::AssetConfig config{
        .latitudes          = dir.path() / "lats.npy",
        .longitudes         = dir.path() / "lngs.npy",
        .transparency_table = dir.path() / "transparency.npy",
        .score_table        = dir.path() / "scores.npy",
    };
    const auto assets = GridAssets::load(config);

    CHECK(assets->latitudes() == std::vector<f64>{45.0, 44.75, 44.5});
    CHECK(assets->longitudes().size() == 4);
    CHECK(assets->transparency_table() == table);
    CHECK(assets->score_table() == test::sample_score_table());

    CHECK(GridIndexer::index(*assets, 44.7, -83.74) == GridIndex{.row = 1, .col = 1});
}

TEST_CASE("Missing or misshapen asset files are DataUnavailable")
{
    const test::TempDirectory dir("darksky_test_assets_bad");
    test::write_npy_f64(dir.path() / "lats.npy", {2}, {1.0, 0.0});
    test::write_npy_f64(dir.path() / "lngs.npy", {2}, {0.0, 1.0});
    test::write_npy_f64(dir.path() / "scores.npy", {5, 4}, std::vector<f64>(20, 1.0));

    core::AssetConfig config{
        .latitudes          = dir.path() / "lats.npy",
        .longitudes         = dir.path() / "lngs.npy",
        .transparency_table = dir.path() / "absent.npy",
        .score_table        = dir.path() / "scores.npy",
    };
    CHECK_THROWS_AS((void)GridAssets::load(config), core::DataUnavailableError);

    test::write_npy_f64(dir.path() / "transparency.npy", {3, 3, 3}, std::vector<f64>(27, 3.0));
    config.transparency_table = dir.path() / "transparency.npy";
    CHECK_THROWS_AS((void)GridAssets::load(config), core::DataUnavailableError);

    // Valid tables from here on; only the coordinate arrays are malformed
    test::write_npy_f64(dir.path() / "scores.npy", {4, 5}, std::vector<f64>(20, 1.0));

    SUBCASE("Longitude grid with zero rows")
    {
        test::write_npy_f64(dir.path() / "lngs0.npy", {0, 1440}, {});
        config.longitudes = dir.path() / "lngs0.npy";
        CHECK_THROWS_AS((void)GridAssets::load(config), core::DataUnavailableError);
    }

    SUBCASE("Latitude grid with zero columns")
    {
        test::write_npy_f64(dir.path() / "lats0.npy", {721, 0}, {});
        config.latitudes = dir.path() / "lats0.npy";
        CHECK_THROWS_AS((void)GridAssets::load(config), core::DataUnavailableError);
    }

    SUBCASE("Empty 1-D longitude axis")
    {
        test::write_npy_f64(dir.path() / "lngs_empty.npy", {0}, {});
        config.longitudes = dir.path() / "lngs_empty.npy";
        CHECK_THROWS_AS((void)GridAssets::load(config), core::DataUnavailableError);
    }
}
