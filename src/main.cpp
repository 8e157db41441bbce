// src/main.cpp - Darksky stargazing forecast entry point
//
// Usage: darksky_forecast <config.yaml> <lat> <lng> <timezone> <bortle> [YYYYMMDD]
//        darksky_forecast --history <config.yaml> <lat> <lng> <timezone> <year>
//
//  1. Load configuration and start logging
//  2. Load grid assets
//  3. Resolve the location and run the forecast pipeline (or the history lookup)
//  4. Print the local forecast table, astronomical windows and grade
//     (or the monthly medians, Milky Way season and new moons)

#include "astro/event_engine.hpp"
#include "astro/location.hpp"
#include "core/config.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"
#include "forecast/dataset_resolver.hpp"
#include "forecast/forecast_service.hpp"
#include "forecast/history_service.hpp"
#include "grid/grid_assets.hpp"

#include <absl/time/civil_time.h>
#include <spdlog/fmt/fmt.h>

#include <charconv>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace darksky;

namespace
{

void print_usage()
{
    std::cerr << "Usage: darksky_forecast <config.yaml> <lat> <lng> <timezone> <bortle> [YYYYMMDD]\n"
              << "       darksky_forecast --history <config.yaml> <lat> <lng> <timezone> <year>\n";
}

template <typename T>
std::optional<T> parse_number(std::string_view text)
{
    T value{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size())
    {
        return std::nullopt;
    }
    return value;
}

std::string format_local(const absl::CivilSecond& local)
{
    return fmt::format("{:04d}/{:02d}/{:02d} {:02d}:{:02d}",
                       local.year(), local.month(), local.day(), local.hour(), local.minute());
}

void print_windows(const std::string& title, const std::vector<astro::AstronomicalWindow>& windows)
{
    std::cout << title << "\n";
    for (const auto& window : windows)
    {
        if (window.mode == astro::PairingMode::SettingThenRising)
        {
            std::cout << "  set  " << format_local(window.set.local)
                      << "   rise " << format_local(window.rise.local) << "\n";
        }
        else
        {
            std::cout << "  rise " << format_local(window.rise.local)
                      << "   set  " << format_local(window.set.local);
            if (window.transit)
            {
                std::cout << "   transit " << fmt::format("{:02d}:{:02d}",
                                                         window.transit->local.hour(),
                                                         window.transit->local.minute());
            }
            std::cout << "\n";
        }
    }
    std::cout << "\n";
}

void print_forecast(const forecast::ForecastContext& context)
{
    std::cout << "================================================================\n"
              << "  DARKSKY forecast  (" << std::fixed << std::setprecision(4)
              << context.location.latitude() << ", " << context.location.longitude() << ")  "
              << context.location.time_zone_name() << "\n"
              << "  Dataset " << context.series.timestamp << "Z, Bortle " << context.bortle << "\n"
              << "================================================================\n\n";

    // -----------------------------------------------------------------
    // Hourly table by local date
    // -----------------------------------------------------------------
    for (const absl::CivilDay& day : context.local.days())
    {
        std::cout << fmt::format("{:04d}/{:02d}/{:02d}\n", day.year(), day.month(), day.day())
                  << "  hour  cloud%  humid%  aerosol  transp\n";
        for (const auto& [hour, record] : context.local.hours_of(day))
        {
            std::cout << fmt::format("  {:02d}    {:6.1f}  {:6.1f}  {:7.3f}  {:>6}\n",
                                     hour.hour(), record.cloud, record.humidity, record.aerosol,
                                     record.transparency ? std::to_string(*record.transparency) : "-");
        }
        std::cout << "\n";
    }

    // -----------------------------------------------------------------
    // Astronomical windows
    // -----------------------------------------------------------------
    print_windows("Sun (dark hours):", context.sun_windows);
    print_windows("Moon (moon-free):", context.moon_windows);
    print_windows("Milky Way core:", context.galactic_center_windows);

    if (context.max_altitude_deg)
    {
        std::cout << "Milky Way core max altitude: " << std::setprecision(2)
                  << *context.max_altitude_deg << " deg\n";
    }

    std::cout << "Score: "
              << (context.grade ? std::string(scoring::grade_name(*context.grade)) : "No available score")
              << "  (" << context.hourly_scores.size() << " dark hours scored)\n";
}

void print_history(const forecast::HistoricalSummary& summary, const astro::Location& location)
{
    std::cout << "================================================================\n"
              << "  DARKSKY history  (" << std::fixed << std::setprecision(4)
              << location.latitude() << ", " << location.longitude() << ")  "
              << location.time_zone_name() << "  " << summary.year << "\n"
              << "================================================================\n\n"
              << "  month  transp  cloud%  humid%  aerosol\n";
    for (const auto& month : summary.months)
    {
        std::cout << fmt::format("  {:>5}  {:>6}  {:6.1f}  {:6.1f}  {:7.3f}\n",
                                 month.month, month.transparency, month.cloud, month.humidity, month.aerosol);
    }
    std::cout << "\n";

    if (summary.milky_way_season)
    {
        std::cout << "Milky Way season: "
                  << fmt::format("{:02d}/{:02d}", summary.milky_way_season->start.month(),
                                 summary.milky_way_season->start.day())
                  << " - "
                  << fmt::format("{:02d}/{:02d}", summary.milky_way_season->end.month(),
                                 summary.milky_way_season->end.day())
                  << "\n";
    }
    std::cout << "Milky Way core max altitude: " << std::setprecision(2) << summary.max_altitude_deg << " deg\n";

    std::cout << "New moons:";
    for (const absl::CivilDay& day : summary.new_moon_dates)
    {
        std::cout << fmt::format(" {:02d}/{:02d}", day.month(), day.day());
    }
    std::cout << "\n";
}

int run_history(int argc, char* argv[])
{
    if (argc != 7)
    {
        print_usage();
        return 2;
    }

    const auto config = core::Config::load_file(argv[2]);
    if (!config)
    {
        std::cerr << "Invalid configuration: " << argv[2] << "\n";
        return 1;
    }
    core::Logger::init(config->logging);

    const auto lat = parse_number<f64>(argv[3]);
    const auto lng = parse_number<f64>(argv[4]);
    const auto year = parse_number<i32>(argv[6]);
    if (!lat || !lng || !year)
    {
        print_usage();
        core::Logger::shutdown();
        return 2;
    }

    int exit_code = 0;
    try
    {
        const auto assets = grid::GridAssets::load(config->assets);
        const astro::Location location = astro::Location::resolve(*lat, *lng, argv[5]);
        const forecast::HistoryService service(config->history, assets);
        print_history(service.summary(location, *year), location);
    }
    catch (const core::DarkskyError& error)
    {
        DSK_CRITICAL("{}", error.what());
        exit_code = error.kind() == core::ErrorKind::InvalidInput ? 2 : 1;
    }

    core::Logger::shutdown();
    return exit_code;
}

} // namespace

int main(int argc, char* argv[])
{
    if (argc > 1 && std::string_view(argv[1]) == "--history")
    {
        return run_history(argc, argv);
    }
    if (argc < 6 || argc > 7)
    {
        print_usage();
        return 2;
    }

    // -----------------------------------------------------------------
    // 1. Configuration and logging
    // -----------------------------------------------------------------
    const auto config = core::Config::load_file(argv[1]);
    if (!config)
    {
        std::cerr << "Invalid configuration: " << argv[1] << "\n";
        return 1;
    }
    core::Logger::init(config->logging);

    const auto lat = parse_number<f64>(argv[2]);
    const auto lng = parse_number<f64>(argv[3]);
    const auto bortle = parse_number<i32>(argv[5]);
    if (!lat || !lng || !bortle)
    {
        print_usage();
        core::Logger::shutdown();
        return 2;
    }

    std::optional<absl::CivilDay> reference_date;
    if (argc == 7)
    {
        reference_date = forecast::DatasetResolver::parse_date(argv[6]);
        if (!reference_date)
        {
            DSK_CRITICAL("Reference date '{}' is not YYYYMMDD", argv[6]);
            core::Logger::shutdown();
            return 2;
        }
    }

    int exit_code = 0;
    try
    {
        // -------------------------------------------------------------
        // 2. Assets
        // -------------------------------------------------------------
        const auto assets = grid::GridAssets::load(config->assets);

        // -------------------------------------------------------------
        // 3. Pipeline
        // -------------------------------------------------------------
        const astro::Location location = astro::Location::resolve(*lat, *lng, argv[4]);
        const forecast::ForecastService service(*config, assets);
        const forecast::ForecastContext context = service.build(location, *bortle, reference_date);

        // -------------------------------------------------------------
        // 4. Output
        // -------------------------------------------------------------
        print_forecast(context);

        const auto season = astro::EventEngine::milky_way_season(location, context.local.days().front().year());
        if (season)
        {
            std::cout << "Milky Way season: "
                      << fmt::format("{:02d}/{:02d}", season->start.month(), season->start.day()) << " - "
                      << fmt::format("{:02d}/{:02d}", season->end.month(), season->end.day()) << "\n";
        }
    }
    catch (const core::DarkskyError& error)
    {
        DSK_CRITICAL("{}", error.what());
        exit_code = error.kind() == core::ErrorKind::InvalidInput ? 2 : 1;
    }

    core::Logger::shutdown();
    return exit_code;
}
