/// @file logger.cpp
/// @brief Logger implementation: dual spdlog loggers with console + rotating file sinks.

#include "core/logger.hpp"

#include "core/config.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace darksky::core
{

// ---- Static member definitions ----
std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_service_logger;

void Logger::init()
{
    configure(spdlog::level::info, LoggingConfig{}.file);
}

void Logger::init(const LoggingConfig& config)
{
    configure(spdlog::level::from_str(config.level), config.file);
}

void Logger::configure(spdlog::level::level_enum level, const std::string& file_path)
{
    // -----------------------------------------------------------------
    // Shared sinks: both loggers write to the same console and file
    // -----------------------------------------------------------------

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%T.%e] [%n] [%^%l%$] %v");

    std::vector<spdlog::sink_ptr> sinks{console_sink};

    // Rotating file sink: 5 MB max size, 3 rotated files. An empty path logs to the console only
    if (!file_path.empty())
    {
        constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024; // 5 MB
        constexpr std::size_t kMaxFiles = 3;
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            file_path, kMaxFileSize, kMaxFiles);
        file_sink->set_pattern("[%Y-%m-%d %T.%e] [%n] [%l] %v");
        sinks.push_back(file_sink);
    }

    // Re-initialization replaces any previously registered loggers
    spdlog::drop("DARKSKY");
    spdlog::drop("SERVICE");

    // -----------------------------------------------------------------
    // Core logger ("DARKSKY")
    // -----------------------------------------------------------------
    s_core_logger = std::make_shared<spdlog::logger>("DARKSKY", sinks.begin(), sinks.end());
    s_core_logger->set_level(level);
    s_core_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_core_logger);

    // -----------------------------------------------------------------
    // Service logger ("SERVICE")
    // -----------------------------------------------------------------
    s_service_logger = std::make_shared<spdlog::logger>("SERVICE", sinks.begin(), sinks.end());
    s_service_logger->set_level(level);
    s_service_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_service_logger);
}

void Logger::shutdown()
{
    s_core_logger.reset();
    s_service_logger.reset();
    spdlog::drop_all();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger>& Logger::get_core_logger()
{
    if (!s_core_logger)
    {
        s_core_logger = make_console_fallback("DARKSKY");
    }
    return s_core_logger;
}

std::shared_ptr<spdlog::logger>& Logger::get_service_logger()
{
    if (!s_service_logger)
    {
        s_service_logger = make_console_fallback("SERVICE");
    }
    return s_service_logger;
}

// -----------------------------------------------------------------
// Console-only logger used when init() has not run (library use, tests)
// -----------------------------------------------------------------

std::shared_ptr<spdlog::logger> Logger::make_console_fallback(const std::string& name)
{
    if (auto existing = spdlog::get(name))
    {
        return existing;
    }

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%T.%e] [%n] [%^%l%$] %v");

    auto logger = std::make_shared<spdlog::logger>(name, console_sink);
    logger->set_level(spdlog::level::info);
    return logger;
}

} // namespace darksky::core
