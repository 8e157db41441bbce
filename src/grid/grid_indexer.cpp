/// @file grid_indexer.cpp
/// @brief Nearest-cell selection on the coordinate axes.

#include "grid/grid_indexer.hpp"

#include "core/error.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>

namespace darksky::grid
{

i32 GridIndexer::nearest(std::span<const f64> axis, f64 value)
{
    i32 best = 0;
    f64 best_distance = std::abs(axis[0] - value);
    for (std::size_t i = 1; i < axis.size(); ++i)
    {
        const f64 distance = std::abs(axis[i] - value);
        // Strict comparison keeps the first occurrence on ties
        if (distance < best_distance)
        {
            best_distance = distance;
            best = static_cast<i32>(i);
        }
    }
    return best;
}

i32 GridIndexer::latitude_index(const GridAssets& assets, f64 latitude)
{
    if (!(latitude >= -90.0 && latitude <= 90.0))
    {
        throw core::InvalidInputError(
            fmt::format("Latitude {} is outside [-90, 90]", latitude),
            core::ErrorContext{.operation = "grid_index", .latitude = latitude});
    }
    return nearest(assets.latitudes(), latitude);
}

i32 GridIndexer::longitude_index(const GridAssets& assets, f64 longitude)
{
    if (!(longitude >= -180.0 && longitude <= 180.0))
    {
        throw core::InvalidInputError(
            fmt::format("Longitude {} is outside [-180, 180]", longitude),
            core::ErrorContext{.operation = "grid_index", .longitude = longitude});
    }
    return nearest(assets.longitudes(), longitude + 180.0);
}

GridIndex GridIndexer::index(const GridAssets& assets, f64 latitude, f64 longitude)
{
    return GridIndex{
        .row = latitude_index(assets, latitude),
        .col = longitude_index(assets, longitude),
    };
}

} // namespace darksky::grid
