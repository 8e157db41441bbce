#pragma once

/// @file dataset_resolver.hpp
/// @brief Locates the most recent complete forecast dataset.

#include "core/config.hpp"
#include "core/types.hpp"

#include <absl/time/civil_time.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace darksky::forecast
{
    /// @brief Forecast source.
    enum class DatasetKind
    {
        Gfs,    ///< Hourly cloud cover and relative humidity
        Gefs,   ///< 3-hourly aerosol optical depth
    };

    /// @brief Directory name of a source ("gfs", "gefs").
    [[nodiscard]] std::string_view dataset_kind_name(DatasetKind kind);

    /// @brief Variables stored under a source directory.
    [[nodiscard]] std::vector<std::string> dataset_variables(DatasetKind kind);

    /// @brief A resolved dataset: its directory and base timestamp.
    struct DatasetWindow
    {
        std::filesystem::path path;     ///< <root>/<YYYYMMDD>/<HH>/<kind>
        std::string timestamp;          ///< YYYYMMDDHH, UTC
    };

    /// @brief Scans the dataset tree backward from a reference date.
    ///
    /// An update directory counts only when it holds the completion marker.
    /// Days are scanned newest first for lookback_days days, update hours in
    /// the configured order (18, 12, 06, 00 by default).
    class DatasetResolver
    {
    public:
        explicit DatasetResolver(core::DataConfig config);

        /// @brief Most recent complete dataset of @p kind.
        /// @param reference_date UTC date to scan back from; today when absent.
        /// @throws core::DataUnavailableError if nothing complete exists in the lookback.
        [[nodiscard]] DatasetWindow resolve(DatasetKind kind,
                                            std::optional<absl::CivilDay> reference_date = std::nullopt) const;

        /// @brief Parse a YYYYMMDD string.
        [[nodiscard]] static std::optional<absl::CivilDay> parse_date(std::string_view yyyymmdd);

        [[nodiscard]] const core::DataConfig& config() const noexcept { return m_config; }

    private:
        core::DataConfig m_config;
    };

} // namespace darksky::forecast
