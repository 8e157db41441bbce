#pragma once

/// @file grid_indexer.hpp
/// @brief Nearest grid cell for a geographic position.

#include "core/types.hpp"
#include "grid/grid_assets.hpp"

#include <span>

namespace darksky::grid
{
    /// @brief Cell of the 721×1440 forecast grid.
    struct GridIndex
    {
        i32 row;    ///< Latitude index, 0 at 90° N
        i32 col;    ///< Longitude index, 0 at the −180° meridian

        bool operator==(const GridIndex&) const = default;
    };

    /// @brief Static nearest-cell lookup.
    ///
    /// The cell minimizing the absolute coordinate difference wins; on a tie
    /// the lower index is kept. Longitudes are shifted by +180° before the
    /// lookup to match the 0..360 axis of the processed grids.
    class GridIndexer
    {
    public:
        GridIndexer() = delete;

        /// @throws core::InvalidInputError if @p latitude is outside [-90, 90].
        [[nodiscard]] static i32 latitude_index(const GridAssets& assets, f64 latitude);

        /// @throws core::InvalidInputError if @p longitude is outside [-180, 180].
        [[nodiscard]] static i32 longitude_index(const GridAssets& assets, f64 longitude);

        [[nodiscard]] static GridIndex index(const GridAssets& assets, f64 latitude, f64 longitude);

    private:
        /// @brief First index of the minimum |axis[i] - value|.
        [[nodiscard]] static i32 nearest(std::span<const f64> axis, f64 value);
    };

} // namespace darksky::grid
