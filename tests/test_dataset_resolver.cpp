/// @file test_dataset_resolver.cpp
/// @brief Unit tests for darksky::forecast::DatasetResolver.
///
/// Builds throwaway dataset trees far in the future so the scan never
/// meets real data.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "core/config.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"
#include "forecast/dataset_resolver.hpp"
#include "npy_fixture.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace darksky;
using namespace darksky::forecast;

// =================================================================
// Custom main: initialize logger before tests
// =================================================================

int main(int argc, char** argv)
{
    darksky::core::Logger::init();
    const int result = doctest::Context(argc, argv).run();
    darksky::core::Logger::shutdown();
    return result;
}

namespace
{

/// Create <root>/<date>/<hour>, optionally with its completion marker.
void make_update(const std::filesystem::path& root, const std::string& date, const std::string& hour,
                 bool complete)
{
    const auto dir = root / date / hour;
    std::filesystem::create_directories(dir / "gfs");
    std::filesystem::create_directories(dir / "gefs");
    if (complete)
    {
        std::ofstream(dir / "complete.flag") << "";
    }
}

core::DataConfig config_for(const std::filesystem::path& root)
{
    core::DataConfig config;
    config.root = root;
    return config;
}

} // namespace

// =================================================================
// Kinds
// =================================================================

TEST_CASE("Dataset kinds and their variables")
{
    CHECK(dataset_kind_name(DatasetKind::Gfs) == "gfs");
    CHECK(dataset_kind_name(DatasetKind::Gefs) == "gefs");
    CHECK(dataset_variables(DatasetKind::Gfs) == std::vector<std::string>{"cloud", "humidity"});
    CHECK(dataset_variables(DatasetKind::Gefs) == std::vector<std::string>{"aerosol"});
}

// =================================================================
// Resolution
// =================================================================

TEST_CASE("Only the complete update of the day is chosen")
{
    const test::TempDirectory dir("darksky_test_resolver_single");
    make_update(dir.path(), "30770617", "18", false);
    make_update(dir.path(), "30770617", "12", true);
    make_update(dir.path(), "30770617", "06", false);

    const DatasetResolver resolver(config_for(dir.path()));
    const DatasetWindow gfs = resolver.resolve(DatasetKind::Gfs, absl::CivilDay(3077, 6, 17));
    CHECK(gfs.path == dir.path() / "30770617" / "12" / "gfs");
    CHECK(gfs.timestamp == "3077061712");

    const DatasetWindow gefs = resolver.resolve(DatasetKind::Gefs, absl::CivilDay(3077, 6, 17));
    CHECK(gefs.path == dir.path() / "30770617" / "12" / "gefs");
    CHECK(gefs.timestamp == "3077061712");
}

TEST_CASE("Later update hours win within a day")
{
    const test::TempDirectory dir("darksky_test_resolver_order");
    make_update(dir.path(), "30770617", "00", true);
    make_update(dir.path(), "30770617", "06", true);
    make_update(dir.path(), "30770617", "18", true);

    const DatasetResolver resolver(config_for(dir.path()));
    CHECK(resolver.resolve(DatasetKind::Gfs, absl::CivilDay(3077, 6, 17)).timestamp == "3077061718");
}

TEST_CASE("Scan falls back to earlier days within the lookback")
{
    const test::TempDirectory dir("darksky_test_resolver_lookback");
    make_update(dir.path(), "30770615", "06", true);

    const DatasetResolver resolver(config_for(dir.path()));
    CHECK(resolver.resolve(DatasetKind::Gfs, absl::CivilDay(3077, 6, 17)).timestamp == "3077061506");

    // Across a month boundary
    make_update(dir.path(), "30770630", "00", true);
    CHECK(resolver.resolve(DatasetKind::Gfs, absl::CivilDay(3077, 7, 1)).timestamp == "3077063000");
}

TEST_CASE("Nothing complete in the lookback is DataUnavailable")
{
    const test::TempDirectory dir("darksky_test_resolver_none");
    make_update(dir.path(), "30770617", "12", false);
    make_update(dir.path(), "30770614", "12", true);   // one day past the lookback

    const DatasetResolver resolver(config_for(dir.path()));
    try
    {
        (void)resolver.resolve(DatasetKind::Gfs, absl::CivilDay(3077, 6, 17));
        FAIL("expected DataUnavailableError");
    }
    catch (const core::DataUnavailableError& error)
    {
        CHECK(error.message() == "Cannot find processed NOAA datasets.");
        CHECK(error.kind() == core::ErrorKind::DataUnavailable);
    }
}

TEST_CASE("A marker file where a directory is expected does not count")
{
    const test::TempDirectory dir("darksky_test_resolver_file");
    std::filesystem::create_directories(dir.path() / "30770617");
    std::ofstream(dir.path() / "30770617" / "12") << "not a directory";

    const DatasetResolver resolver(config_for(dir.path()));
    CHECK_THROWS_AS((void)resolver.resolve(DatasetKind::Gfs, absl::CivilDay(3077, 6, 17)),
                    core::DataUnavailableError);
}

// =================================================================
// Dates
// =================================================================

TEST_CASE("YYYYMMDD parsing")
{
    CHECK(DatasetResolver::parse_date("20230701") == absl::CivilDay(2023, 7, 1));
    CHECK(DatasetResolver::parse_date("30770617") == absl::CivilDay(3077, 6, 17));
    CHECK_FALSE(DatasetResolver::parse_date("2023071").has_value());
    CHECK_FALSE(DatasetResolver::parse_date("2023-07-01").has_value());
    CHECK_FALSE(DatasetResolver::parse_date("20231301").has_value());
}
