/// @file test_swiss_ephemeris.cpp
/// @brief Integration tests: full chart pipeline on the Swiss Ephemeris library.
///
/// Runs against an empty data directory, so the provider works in Moshier
/// (reduced precision) mode and needs no .se1 files.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "astro/time_system.hpp"
#include "chart/chart_orchestrator.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "ephemeris/swiss_ephemeris.hpp"

extern "C" {
#include <swephexp.h>
}

#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>

using namespace astrochart;
using namespace astrochart::astro;
using namespace astrochart::chart;

// =================================================================
// Custom main: initialize logger before tests
// =================================================================

int main(int argc, char** argv)
{
    core::LoggingConfig logging;
    logging.level = "warn";
    core::Logger::init(logging);
    const int result = doctest::Context(argc, argv).run();
    core::Logger::shutdown();
    return result;
}

// =================================================================
// Helper: scratch directory removed on scope exit
// =================================================================

class TempDirectory
{
public:
    explicit TempDirectory(const std::string& name)
        : m_path(std::filesystem::temp_directory_path() / name)
    {
        std::filesystem::remove_all(m_path);
        std::filesystem::create_directories(m_path);
    }

    ~TempDirectory()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

private:
    std::filesystem::path m_path;
};

static ChartInput reference_input()
{
    ChartInput input;
    input.datetime_utc = "1977-09-05T17:24:00Z";
    input.latitude = 37.82;
    input.longitude = -79.82;
    return input;
}

// =================================================================
// Precision mode detection
// =================================================================

TEST_CASE("Empty data directory selects reduced precision")
{
    const TempDirectory dir("astrochart_ephe_empty");
    const ephemeris::SwissEphemeris provider(core::EphemerisConfig{.data_path = dir.path()});

    CHECK(provider.precision_mode() == ephemeris::PrecisionMode::Reduced);
    CHECK(provider.data_file_count() == 0);
    CHECK(provider.data_path().is_absolute());
}

TEST_CASE("Missing data directory selects reduced precision")
{
    const ephemeris::SwissEphemeris provider(
        core::EphemerisConfig{.data_path = "/nonexistent/astrochart/ephe"});
    CHECK(provider.precision_mode() == ephemeris::PrecisionMode::Reduced);
}

TEST_CASE("Directory with planet files selects high precision")
{
    const TempDirectory dir("astrochart_ephe_files");
    std::ofstream(dir.path() / "sepl_18.se1") << "placeholder";
    std::ofstream(dir.path() / "semo_18.se1") << "placeholder";
    std::ofstream(dir.path() / "readme.txt") << "not a data file";

    const ephemeris::SwissEphemeris provider(core::EphemerisConfig{.data_path = dir.path()});
    CHECK(provider.precision_mode() == ephemeris::PrecisionMode::High);
    CHECK(provider.data_file_count() == 2);
}

TEST_CASE("Asteroid files alone keep reduced precision")
{
    const TempDirectory dir("astrochart_ephe_asteroids");
    std::ofstream(dir.path() / "seas_18.se1") << "placeholder";
    std::ofstream(dir.path() / "se00433.se1") << "placeholder";

    const ephemeris::SwissEphemeris provider(core::EphemerisConfig{.data_path = dir.path()});
    CHECK(provider.precision_mode() == ephemeris::PrecisionMode::Reduced);
    CHECK(provider.data_file_count() == 0);

    const ChartOutput chart = ChartOrchestrator(provider).compute(reference_input());
    CHECK(chart.metadata.precision_mode == ephemeris::PrecisionMode::Reduced);
    CHECK(chart.body(Body::Sun).sign == ZodiacSign::Virgo);
}

// =================================================================
// High precision never degrades silently
// =================================================================

/// Message of the CalculationError thrown by compute(), or empty if none.
static std::string calculation_failure(const ephemeris::SwissEphemeris& provider)
{
    try
    {
        static_cast<void>(ChartOrchestrator(provider).compute(reference_input()));
    }
    catch (const core::CalculationError& e)
    {
        return e.what();
    }
    return {};
}

TEST_CASE("Unreadable planet file fails instead of falling back")
{
    const TempDirectory dir("astrochart_ephe_damaged");
    std::ofstream(dir.path() / "sepl_18.se1") << "placeholder";

    const ephemeris::SwissEphemeris provider(core::EphemerisConfig{.data_path = dir.path()});
    REQUIRE(provider.precision_mode() == ephemeris::PrecisionMode::High);

    CHECK_THROWS_AS(static_cast<void>(ChartOrchestrator(provider).compute(reference_input())),
                    core::CalculationError);

    const std::string message = calculation_failure(provider);
    CHECK(message.find("Sun") != std::string::npos);
}

TEST_CASE("Missing planet file for the date fails instead of using Moshier")
{
    // Only a moon file: the Sun needs sepl_18.se1, which libswe would
    // silently replace with the Moshier model
    const TempDirectory dir("astrochart_ephe_moon_only");
    std::ofstream(dir.path() / "semo_18.se1") << "placeholder";

    const ephemeris::SwissEphemeris provider(core::EphemerisConfig{.data_path = dir.path()});
    REQUIRE(provider.precision_mode() == ephemeris::PrecisionMode::High);

    const std::string message = calculation_failure(provider);
    REQUIRE_FALSE(message.empty());
    CHECK(message.find("Sun") != std::string::npos);
}

TEST_CASE("Library version is reported")
{
    CHECK_FALSE(ephemeris::SwissEphemeris::library_version().empty());
}

// =================================================================
// Time conversion agrees with the library
// =================================================================

TEST_CASE("Julian Day matches swe_julday")
{
    const char* stamps[] = {
        "1977-09-05T17:24:00Z",
        "2000-01-01T12:00:00Z",
        "1582-10-15T00:00:00Z",
        "2024-02-29T23:59:59.999999Z",
        "2150-07-04T06:30:15.25Z",
    };

    for (const char* stamp : stamps)
    {
        const auto dt = TimeSystem::parse_iso8601(stamp);
        REQUIRE(dt.has_value());

        const double reference = swe_julday(dt->year, dt->month, dt->day,
                                            TimeSystem::fractional_hour(*dt), SE_GREG_CAL);
        CHECK(std::abs(TimeSystem::to_julian_day(*dt) - reference) < 1e-8);
    }
}

// =================================================================
// Reference chart: 1977-09-05 17:24 UTC, Roanoke VA
// =================================================================

TEST_CASE("Reference chart")
{
    const TempDirectory dir("astrochart_ephe_reference");
    const ephemeris::SwissEphemeris provider(core::EphemerisConfig{.data_path = dir.path()});
    const ChartOrchestrator orchestrator(provider);

    const ChartOutput chart = orchestrator.compute(reference_input());

    SUBCASE("Julian Day")
    {
        CHECK(std::abs(chart.metadata.julian_day - 2443392.225) < 0.001);
    }

    SUBCASE("Sun in Virgo")
    {
        const BodyPosition& sun = chart.body(Body::Sun);
        CHECK(sun.sign == ZodiacSign::Virgo);
        CHECK(sun.longitude > 150.0);
        CHECK(sun.longitude < 180.0);
        CHECK_FALSE(sun.retrograde);
    }

    SUBCASE("Luminaries are never retrograde")
    {
        CHECK_FALSE(chart.body(Body::Moon).retrograde);
        CHECK_FALSE(chart.body(Body::Sun).retrograde);
    }

    SUBCASE("Ranges")
    {
        for (const Body body : kTrackedBodies)
        {
            const BodyPosition& pos = chart.body(body);
            CHECK(pos.longitude >= 0.0);
            CHECK(pos.longitude < 360.0);
            CHECK(pos.degree >= 0.0);
            CHECK(pos.degree < 30.0);
        }
        for (const Angle angle : kChartAngles)
        {
            CHECK(chart.angle(angle).longitude >= 0.0);
            CHECK(chart.angle(angle).longitude < 360.0);
        }
    }

    SUBCASE("Whole Sign houses start at the Ascendant")
    {
        const i32 asc = sign_index(chart.angle(Angle::Ascendant).sign);
        CHECK(chart.houses.sign_of(1) == chart.angle(Angle::Ascendant).sign);
        for (i32 n = 1; n <= kHouseCount; ++n)
        {
            CHECK(chart.houses.sign_of(n) == sign_at(asc + n - 1));
        }
    }

    SUBCASE("Metadata reports the fallback")
    {
        CHECK(chart.metadata.precision_mode == ephemeris::PrecisionMode::Reduced);
        CHECK(chart.metadata.precision == "2 arcseconds");
        CHECK(chart.metadata.ephemeris == "Swiss Ephemeris");
        CHECK(chart.metadata.calculation_method == "libswe");
    }
}

TEST_CASE("Independent providers do not disturb each other")
{
    const TempDirectory first_dir("astrochart_ephe_first");
    const TempDirectory second_dir("astrochart_ephe_second");

    const ephemeris::SwissEphemeris first(core::EphemerisConfig{.data_path = first_dir.path()});
    const ChartOutput before = ChartOrchestrator(first).compute(reference_input());

    {
        const ephemeris::SwissEphemeris second(core::EphemerisConfig{.data_path = second_dir.path()});
        static_cast<void>(ChartOrchestrator(second).compute(reference_input()));
    }

    const ChartOutput after = ChartOrchestrator(first).compute(reference_input());
    for (const Body body : kTrackedBodies)
    {
        CHECK(before.body(body).longitude == after.body(body).longitude);
    }
}

TEST_CASE("High latitude chart still completes")
{
    const TempDirectory dir("astrochart_ephe_polar");
    const ephemeris::SwissEphemeris provider(core::EphemerisConfig{.data_path = dir.path()});
    const ChartOrchestrator orchestrator(provider);

    ChartInput input = reference_input();
    input.latitude = 78.22;     // Longyearbyen
    input.longitude = 15.65;

    const ChartOutput chart = orchestrator.compute(input);
    CHECK(chart.houses.sign_of(1) == chart.angle(Angle::Ascendant).sign);
}
