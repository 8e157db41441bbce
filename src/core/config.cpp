/// @file config.cpp
/// @brief YAML configuration loading (yaml-cpp).

#include "core/config.hpp"

#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>
#include <yaml-cpp/yaml.h>

#include <array>
#include <fstream>
#include <sstream>

namespace darksky::core
{

namespace
{

// Assign `target` from `node[key]` when the key is present.
template <typename T>
void read_optional(const YAML::Node& node, const char* key, T& target)
{
    if (node && node[key])
    {
        target = node[key].as<T>();
    }
}

void read_path(const YAML::Node& node, const char* key, std::filesystem::path& target)
{
    if (node && node[key])
    {
        target = node[key].as<std::string>();
    }
}

Config from_yaml(const YAML::Node& root)
{
    Config config;

    const YAML::Node data = root["data"];
    read_path(data, "root", config.data.root);
    read_optional(data, "completion_marker", config.data.completion_marker);
    read_optional(data, "lookback_days", config.data.lookback_days);
    read_optional(data, "update_hours", config.data.update_hours);

    const YAML::Node assets = root["assets"];
    read_path(assets, "latitudes", config.assets.latitudes);
    read_path(assets, "longitudes", config.assets.longitudes);
    read_path(assets, "transparency_table", config.assets.transparency_table);
    read_path(assets, "score_table", config.assets.score_table);

    const YAML::Node forecast = root["forecast"];
    read_optional(forecast, "aerosol_interval", config.forecast.aerosol_interval);

    const YAML::Node history = root["history"];
    read_path(history, "root", config.history.root);

    const YAML::Node astronomy = root["astronomy"];
    read_optional(astronomy, "window_count", config.astronomy.window_count);

    const YAML::Node logging = root["logging"];
    read_optional(logging, "level", config.logging.level);
    read_optional(logging, "file", config.logging.file);

    return config;
}

} // namespace

// -----------------------------------------------------------------
// Loading
// -----------------------------------------------------------------

std::optional<Config> Config::load_file(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        DSK_CORE_ERROR("Config: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto config = parse(buffer.str());
    if (config)
    {
        DSK_CORE_INFO("Config: Loaded {}", path.string());
    }
    return config;
}

std::optional<Config> Config::parse(std::string_view yaml_text)
{
    Config config;
    try
    {
        const YAML::Node root = YAML::Load(std::string(yaml_text));
        if (root && !root.IsNull() && !root.IsMap())
        {
            DSK_CORE_ERROR("Config: Top level must be a mapping");
            return std::nullopt;
        }
        config = from_yaml(root);
    }
    catch (const YAML::Exception& e)
    {
        DSK_CORE_ERROR("Config: YAML error: {}", e.what());
        return std::nullopt;
    }

    if (const std::string problem = config.validate(); !problem.empty())
    {
        DSK_CORE_ERROR("Config: {}", problem);
        return std::nullopt;
    }

    return config;
}

// -----------------------------------------------------------------
// Validation
// -----------------------------------------------------------------

std::string Config::validate() const
{
    if (data.lookback_days <= 0)
    {
        return fmt::format("data.lookback_days must be positive (got {})", data.lookback_days);
    }
    if (data.update_hours.empty())
    {
        return "data.update_hours must not be empty";
    }
    for (const i32 hour : data.update_hours)
    {
        if (hour < 0 || hour > 23)
        {
            return fmt::format("data.update_hours contains {} (expected 0..23)", hour);
        }
    }
    if (data.completion_marker.empty())
    {
        return "data.completion_marker must not be empty";
    }
    if (forecast.aerosol_interval <= 0)
    {
        return fmt::format("forecast.aerosol_interval must be positive (got {})",
                           forecast.aerosol_interval);
    }
    if (astronomy.window_count <= 0)
    {
        return fmt::format("astronomy.window_count must be positive (got {})",
                           astronomy.window_count);
    }

    constexpr std::array kLevels{"trace", "debug", "info", "warning", "warn", "error", "critical", "off"};
    bool level_known = false;
    for (const char* level : kLevels)
    {
        level_known = level_known || logging.level == level;
    }
    if (!level_known)
    {
        return fmt::format("logging.level '{}' is not a known level", logging.level);
    }

    return {};
}

} // namespace darksky::core
