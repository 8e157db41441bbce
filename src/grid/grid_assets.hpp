#pragma once

/// @file grid_assets.hpp
/// @brief Immutable backing assets: grid coordinates and lookup tables.

#include "core/config.hpp"
#include "core/types.hpp"

#include <array>
#include <memory>
#include <vector>

namespace darksky::grid
{
    /// @brief [cloud bucket][humidity bucket][aerosol bucket] → transparency rating
    /// (1 = poor .. 5 = excellent).
    using TransparencyTable = std::array<std::array<std::array<i32, 3>, 3>, 3>;

    /// @brief [light-pollution tier][transparency index] → score 1..4.
    using ScoreTable = std::array<std::array<i32, 5>, 4>;

    /// @brief Read-only assets shared by every request.
    ///
    /// Loaded once at startup and passed around as
    /// std::shared_ptr<const GridAssets>; nothing mutates it afterwards.
    class GridAssets
    {
        /// Restricts construction to create() while keeping make_shared usable.
        struct Key
        {
            explicit Key() = default;
        };

    public:
        static constexpr i32 kRows = 721;       ///< 90° → −90° at 0.25°
        static constexpr i32 kCols = 1440;      ///< 0° → 359.75° at 0.25°
        static constexpr f64 kSpacingDeg = 0.25;

        /// @brief Load every asset named in the configuration.
        /// @throws core::DataUnavailableError if a file is missing or malformed.
        [[nodiscard]] static std::shared_ptr<const GridAssets> load(const core::AssetConfig& config);

        /// @brief Build from in-memory arrays.
        /// @throws core::InvalidInputError for empty coordinate arrays or
        ///         table values outside their ranges.
        [[nodiscard]] static std::shared_ptr<const GridAssets> create(
            std::vector<f64> latitudes,
            std::vector<f64> longitudes,
            const TransparencyTable& transparency,
            const ScoreTable& scores);

        /// @brief Standard 0.25° coordinate arrays generated in memory.
        [[nodiscard]] static std::shared_ptr<const GridAssets> regular(
            const TransparencyTable& transparency,
            const ScoreTable& scores);

        [[nodiscard]] const std::vector<f64>& latitudes() const noexcept { return m_latitudes; }
        [[nodiscard]] const std::vector<f64>& longitudes() const noexcept { return m_longitudes; }
        [[nodiscard]] const TransparencyTable& transparency_table() const noexcept { return m_transparency; }
        [[nodiscard]] const ScoreTable& score_table() const noexcept { return m_scores; }

        [[nodiscard]] i32 transparency(i32 cloud_bucket, i32 humidity_bucket, i32 aerosol_bucket) const;
        [[nodiscard]] i32 score(i32 light_pollution_tier, i32 transparency_index) const;

        GridAssets(Key, std::vector<f64> latitudes, std::vector<f64> longitudes,
                   const TransparencyTable& transparency, const ScoreTable& scores);

    private:
        std::vector<f64> m_latitudes;
        std::vector<f64> m_longitudes;
        TransparencyTable m_transparency;
        ScoreTable m_scores;
    };

} // namespace darksky::grid
