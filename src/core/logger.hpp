#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (engine + service loggers).

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace darksky::core
{
    struct LoggingConfig;

    /// @brief Centralized logging facility for Darksky.
    ///
    /// Provides two separate loggers:
    /// - **DARKSKY** (core): asset loading, dataset resolution, ephemeris anomalies
    /// - **SERVICE**: request flow, series assembly, scoring decisions
    ///
    /// Both write to colored console output and a rotating log file.
    /// Call init() once from main() before any logging. Library code may log
    /// before init(); the accessors then fall back to a console-only logger.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console + file sinks and default settings.
        static void init();

        /// @brief Initialize both loggers from the logging section of the configuration.
        static void init(const LoggingConfig& config);

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Access the engine-internal logger ("DARKSKY").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the request-level logger ("SERVICE").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_service_logger();

    private:
        static void configure(spdlog::level::level_enum level, const std::string& file_path);
        static std::shared_ptr<spdlog::logger> make_console_fallback(const std::string& name);

        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_service_logger;
    };

} // namespace darksky::core

// -----------------------------------------------------------------
// Core engine log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define DSK_CORE_TRACE(...)    ::darksky::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define DSK_CORE_DEBUG(...)    ::darksky::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define DSK_CORE_INFO(...)     ::darksky::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define DSK_CORE_WARN(...)     ::darksky::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define DSK_CORE_ERROR(...)    ::darksky::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define DSK_CORE_CRITICAL(...) ::darksky::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Service log macros
// -----------------------------------------------------------------
#define DSK_TRACE(...)         ::darksky::core::Logger::get_service_logger()->trace(__VA_ARGS__)
#define DSK_DEBUG(...)         ::darksky::core::Logger::get_service_logger()->debug(__VA_ARGS__)
#define DSK_INFO(...)          ::darksky::core::Logger::get_service_logger()->info(__VA_ARGS__)
#define DSK_WARN(...)          ::darksky::core::Logger::get_service_logger()->warn(__VA_ARGS__)
#define DSK_ERROR(...)         ::darksky::core::Logger::get_service_logger()->error(__VA_ARGS__)
#define DSK_CRITICAL(...)      ::darksky::core::Logger::get_service_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
