/// @file grid_assets.cpp
/// @brief Asset loading and validation.

#include "grid/grid_assets.hpp"

#include "core/error.hpp"
#include "core/logger.hpp"
#include "grid/npy_reader.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <string>
#include <utility>

namespace darksky::grid
{

namespace
{

core::ErrorContext asset_context(const std::filesystem::path& path)
{
    return core::ErrorContext{
        .operation = "load_assets",
        .latitude  = std::nullopt,
        .longitude = std::nullopt,
        .when      = path.string(),
    };
}

NdArray load_or_throw(const std::filesystem::path& path)
{
    auto array = NpyReader::load(path);
    if (!array)
    {
        throw core::DataUnavailableError(fmt::format("Cannot load asset {}", path.string()),
                                         asset_context(path));
    }
    return std::move(*array);
}

// Every dimension non-zero and the data matching the shape
void require_dense(const NdArray& array, const std::filesystem::path& path)
{
    u64 expected = 1;
    for (const u64 extent : array.shape)
    {
        if (extent == 0)
        {
            throw core::DataUnavailableError(
                fmt::format("Asset {} has a zero-length dimension", path.string()), asset_context(path));
        }
        expected *= extent;
    }
    if (expected != array.data.size())
    {
        throw core::DataUnavailableError(
            fmt::format("Asset {} holds {} values for {} cells", path.string(), array.data.size(), expected),
            asset_context(path));
    }
}

// Latitude: (721, 1440) taking column 0, or (721,)
std::vector<f64> latitude_axis(const NdArray& array, const std::filesystem::path& path)
{
    require_dense(array, path);

    std::vector<f64> axis;
    if (array.rank() == 1)
    {
        axis = array.data;
    }
    else if (array.rank() == 2)
    {
        axis.reserve(array.shape[0]);
        for (u64 row = 0; row < array.shape[0]; ++row)
        {
            axis.push_back(array.at(row, 0));
        }
    }
    else
    {
        throw core::DataUnavailableError(
            fmt::format("Latitude array must be 1-D or 2-D, found rank {}", array.rank()),
            asset_context(path));
    }
    return axis;
}

// Longitude: (1440,), or 2-D taking row 0
std::vector<f64> longitude_axis(const NdArray& array, const std::filesystem::path& path)
{
    require_dense(array, path);

    if (array.rank() == 1)
    {
        return array.data;
    }
    if (array.rank() == 2)
    {
        return std::vector<f64>(array.data.begin(),
                                array.data.begin() + static_cast<std::ptrdiff_t>(array.shape[1]));
    }
    throw core::DataUnavailableError(
        fmt::format("Longitude array must be 1-D or 2-D, found rank {}", array.rank()),
        asset_context(path));
}

TransparencyTable transparency_from(const NdArray& array, const std::filesystem::path& path)
{
    if (array.shape != std::vector<u64>{3, 3, 3})
    {
        throw core::DataUnavailableError("Transparency table must have shape (3, 3, 3)", asset_context(path));
    }
    TransparencyTable table{};
    for (u64 c = 0; c < 3; ++c)
    {
        for (u64 h = 0; h < 3; ++h)
        {
            for (u64 a = 0; a < 3; ++a)
            {
                table[c][h][a] = static_cast<i32>(std::lround(array.at(c, h, a)));
            }
        }
    }
    return table;
}

ScoreTable scores_from(const NdArray& array, const std::filesystem::path& path)
{
    if (array.shape != std::vector<u64>{4, 5})
    {
        throw core::DataUnavailableError("Score table must have shape (4, 5)", asset_context(path));
    }
    ScoreTable table{};
    for (u64 tier = 0; tier < 4; ++tier)
    {
        for (u64 index = 0; index < 5; ++index)
        {
            table[tier][index] = static_cast<i32>(std::lround(array.at(tier, index)));
        }
    }
    return table;
}

} // namespace

GridAssets::GridAssets(Key, std::vector<f64> latitudes, std::vector<f64> longitudes,
                       const TransparencyTable& transparency, const ScoreTable& scores)
    : m_latitudes(std::move(latitudes))
    , m_longitudes(std::move(longitudes))
    , m_transparency(transparency)
    , m_scores(scores)
{
}

std::shared_ptr<const GridAssets> GridAssets::load(const core::AssetConfig& config)
{
    const NdArray lats = load_or_throw(config.latitudes);
    const NdArray lngs = load_or_throw(config.longitudes);
    const NdArray transparency = load_or_throw(config.transparency_table);
    const NdArray scores = load_or_throw(config.score_table);

    auto assets = create(latitude_axis(lats, config.latitudes),
                         longitude_axis(lngs, config.longitudes),
                         transparency_from(transparency, config.transparency_table),
                         scores_from(scores, config.score_table));

    DSK_CORE_INFO("Grid assets loaded: {} latitudes, {} longitudes, transparency 3x3x3, score 4x5",
                  assets->latitudes().size(), assets->longitudes().size());
    return assets;
}

std::shared_ptr<const GridAssets> GridAssets::create(
    std::vector<f64> latitudes,
    std::vector<f64> longitudes,
    const TransparencyTable& transparency,
    const ScoreTable& scores)
{
    const core::ErrorContext context{.operation = "create_assets"};

    if (latitudes.empty() || longitudes.empty())
    {
        throw core::InvalidInputError("Grid coordinate arrays must not be empty", context);
    }
    if (latitudes.size() != static_cast<std::size_t>(kRows) || longitudes.size() != static_cast<std::size_t>(kCols))
    {
        DSK_CORE_WARN("Non-standard grid {}x{} (expected {}x{})",
                      latitudes.size(), longitudes.size(), kRows, kCols);
    }

    for (const auto& plane : transparency)
    {
        for (const auto& row : plane)
        {
            for (const i32 value : row)
            {
                if (value < 1 || value > 5)
                {
                    throw core::InvalidInputError(
                        fmt::format("Transparency rating {} outside 1..5", value), context);
                }
            }
        }
    }
    for (const auto& row : scores)
    {
        for (const i32 value : row)
        {
            if (value < 1 || value > 4)
            {
                throw core::InvalidInputError(
                    fmt::format("Score table value {} outside 1..4", value), context);
            }
        }
    }

    return std::make_shared<const GridAssets>(Key{}, std::move(latitudes), std::move(longitudes),
                                              transparency, scores);
}

std::shared_ptr<const GridAssets> GridAssets::regular(const TransparencyTable& transparency,
                                                      const ScoreTable& scores)
{
    std::vector<f64> lats;
    lats.reserve(kRows);
    for (i32 i = 0; i < kRows; ++i)
    {
        lats.push_back(90.0 - kSpacingDeg * static_cast<f64>(i));
    }

    std::vector<f64> lngs;
    lngs.reserve(kCols);
    for (i32 j = 0; j < kCols; ++j)
    {
        lngs.push_back(kSpacingDeg * static_cast<f64>(j));
    }

    return create(std::move(lats), std::move(lngs), transparency, scores);
}

i32 GridAssets::transparency(i32 cloud_bucket, i32 humidity_bucket, i32 aerosol_bucket) const
{
    return m_transparency.at(static_cast<std::size_t>(cloud_bucket))
                         .at(static_cast<std::size_t>(humidity_bucket))
                         .at(static_cast<std::size_t>(aerosol_bucket));
}

i32 GridAssets::score(i32 light_pollution_tier, i32 transparency_index) const
{
    return m_scores.at(static_cast<std::size_t>(light_pollution_tier))
                   .at(static_cast<std::size_t>(transparency_index));
}

} // namespace darksky::grid
