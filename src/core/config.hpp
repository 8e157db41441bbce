#pragma once

/// @file config.hpp
/// @brief Engine configuration loaded from YAML.

#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace darksky::core
{
    /// @brief Location and completeness rules of the processed dataset tree.
    struct DataConfig
    {
        std::filesystem::path root{"data"};
        std::string completion_marker{"complete.flag"};
        i32 lookback_days{3};
        std::vector<i32> update_hours{18, 12, 6, 0};   ///< Scan order within a day
    };

    /// @brief Read-only assets loaded once at startup.
    struct AssetConfig
    {
        std::filesystem::path latitudes{"data/lats.npy"};
        std::filesystem::path longitudes{"data/lngs.npy"};
        std::filesystem::path transparency_table{"data/sky_transparency_table.npy"};
        std::filesystem::path score_table{"data/score_table.npy"};
    };

    struct ForecastConfig
    {
        static constexpr i32 kHours = 72;   ///< Fixed horizon of every series
        i32 aerosol_interval{3};
    };

    /// @brief Monthly climatology tree: <root>/<month>/<variable>.npy.
    struct HistoryConfig
    {
        std::filesystem::path root{"history_data"};
    };

    struct AstronomyConfig
    {
        i32 window_count{4};
    };

    struct LoggingConfig
    {
        std::string level{"info"};
        std::string file{"darksky.log"};
    };

    /// @brief Complete engine configuration.
    ///
    /// Every key of the YAML file is optional; absent keys keep the defaults
    /// above. Out-of-range values reject the whole file.
    struct Config
    {
        DataConfig data;
        AssetConfig assets;
        ForecastConfig forecast;
        HistoryConfig history;
        AstronomyConfig astronomy;
        LoggingConfig logging;

        /// @brief Load a configuration file.
        /// @return The configuration, or std::nullopt if the file is unreadable or invalid.
        [[nodiscard]] static std::optional<Config> load_file(const std::filesystem::path& path);

        /// @brief Parse configuration from YAML text.
        [[nodiscard]] static std::optional<Config> parse(std::string_view yaml_text);

        /// @brief Check value ranges.
        /// @return Empty string when valid, otherwise the first problem found.
        [[nodiscard]] std::string validate() const;
    };

} // namespace darksky::core
