/// @file test_logger.cpp
/// @brief Unit tests for astrochart::core::Logger.
///
/// No custom main here: the chart pipeline must run, and report failures as
/// exceptions, in a host that never calls Logger::init().

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "fake_ephemeris.hpp"

#include "astro/house_deriver.hpp"
#include "astro/position_normalizer.hpp"
#include "chart/chart_orchestrator.hpp"
#include "chart/output_validator.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

using namespace astrochart;
using namespace astrochart::astro;
using namespace astrochart::chart;

static ChartInput reference_input()
{
    ChartInput input;
    input.datetime_utc = "1977-09-05T17:24:00Z";
    input.latitude = 37.82;
    input.longitude = -79.82;
    return input;
}

// =================================================================
// Before init()
// =================================================================

TEST_CASE("Loggers are usable before init")
{
    REQUIRE(core::Logger::get_core_logger() != nullptr);
    REQUIRE(core::Logger::get_app_logger() != nullptr);
    CHECK_NOTHROW(ACH_CORE_DEBUG("debug before init {}", 1));
    CHECK_NOTHROW(ACH_INFO("info before init"));
}

TEST_CASE("Chart computes without init")
{
    const test::FakeEphemeris provider;
    const ChartOrchestrator orchestrator(provider);

    const ChartOutput chart = orchestrator.compute(reference_input());
    CHECK(chart.houses.sign_of(1) == chart.angle(Angle::Ascendant).sign);
    CHECK(provider.body_calls == static_cast<int>(kBodyCount));
}

TEST_CASE("Output invariant failure throws without init")
{
    BodyTable bodies{};
    for (const Body body : kTrackedBodies)
    {
        bodies[static_cast<std::size_t>(body)] =
            PositionNormalizer::normalize_body(static_cast<f64>(body) * 20.0, 0.5, body_name(body));
    }

    AngleTable angles{};
    angles[static_cast<std::size_t>(Angle::Ascendant)] =
        PositionNormalizer::normalize_angle(165.5, "Ascendant");
    angles[static_cast<std::size_t>(Angle::Midheaven)] =
        PositionNormalizer::normalize_angle(75.25, "Midheaven");

    // Houses built from a Leo Ascendant while the Ascendant is in Virgo
    const HouseTable houses = HouseDeriver::from_sign(ZodiacSign::Leo);

    CHECK_THROWS_AS(OutputValidator::validate(bodies, angles, houses), core::ValidationError);
}

// =================================================================
// init() / shutdown() cycle
// =================================================================

TEST_CASE("Named loggers replace the fallback and come back after shutdown")
{
    core::LoggingConfig logging;
    logging.level = "off";
    core::Logger::init(logging);

    CHECK(core::Logger::get_core_logger()->name() == "ASTROCHART");
    CHECK(core::Logger::get_app_logger()->name() == "APP");
    CHECK(core::Logger::get_core_logger()->level() == spdlog::level::off);

    // Re-init must not collide with the previous registrations
    logging.level = "debug";
    CHECK_NOTHROW(core::Logger::init(logging));
    CHECK(core::Logger::get_app_logger()->level() == spdlog::level::debug);

    core::Logger::shutdown();
    REQUIRE(core::Logger::get_core_logger() != nullptr);
    CHECK_NOTHROW(ACH_CORE_WARN("warn after shutdown"));
    CHECK_THROWS_AS(OutputValidator::validate(BodyTable{}, AngleTable{}, HouseTable{}),
                    core::ValidationError);
}
