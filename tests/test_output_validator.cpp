/// @file test_output_validator.cpp
/// @brief Unit tests for astrochart::chart::OutputValidator.
///
/// Builds a consistent chart, then corrupts one value at a time and checks
/// that the matching invariant is reported.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "astro/house_deriver.hpp"
#include "astro/position_normalizer.hpp"
#include "chart/output_validator.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <limits>
#include <string>
#include <utility>

using namespace astrochart;
using namespace astrochart::astro;
using namespace astrochart::chart;

// =================================================================
// Custom main: initialize logger before tests
// =================================================================

int main(int argc, char** argv)
{
    core::LoggingConfig logging;
    logging.level = "off";
    core::Logger::init(logging);
    const int result = doctest::Context(argc, argv).run();
    core::Logger::shutdown();
    return result;
}

// =================================================================
// Helper: a consistent chart with a Virgo Ascendant
// =================================================================

struct ChartParts
{
    BodyTable bodies{};
    AngleTable angles{};
    HouseTable houses{};

    ChartParts()
    {
        for (const Body body : kTrackedBodies)
        {
            const f64 lon = static_cast<f64>(body) * 33.3 + 1.5;
            bodies[static_cast<std::size_t>(body)] =
                PositionNormalizer::normalize_body(lon, 0.2, body_name(body));
        }
        angles[static_cast<std::size_t>(Angle::Ascendant)] =
            PositionNormalizer::normalize_angle(165.5, "Ascendant");
        angles[static_cast<std::size_t>(Angle::Midheaven)] =
            PositionNormalizer::normalize_angle(75.25, "Midheaven");
        houses = HouseDeriver::derive(angles[static_cast<std::size_t>(Angle::Ascendant)]);
    }

    BodyPosition& body(Body b) { return bodies[static_cast<std::size_t>(b)]; }
    AnglePosition& angle(Angle a) { return angles[static_cast<std::size_t>(a)]; }
};

/// Message of the ValidationError thrown by validate(), or empty if none.
static std::string validation_message(const ChartParts& parts)
{
    try
    {
        OutputValidator::validate(parts.bodies, parts.angles, parts.houses);
    }
    catch (const core::ValidationError& e)
    {
        return e.what();
    }
    return {};
}

static bool contains(const std::string& haystack, const std::string& needle)
{
    return haystack.find(needle) != std::string::npos;
}

// =================================================================
// Accepting
// =================================================================

TEST_CASE("Consistent chart passes")
{
    const ChartParts parts;
    CHECK_NOTHROW(OutputValidator::validate(parts.bodies, parts.angles, parts.houses));
}

TEST_CASE("Every rising sign passes with its derived houses")
{
    for (i32 i = 0; i < kSignCount; ++i)
    {
        ChartParts parts;
        parts.angle(Angle::Ascendant) =
            PositionNormalizer::normalize_angle(static_cast<f64>(i) * 30.0 + 12.0, "Ascendant");
        parts.houses = HouseDeriver::derive(parts.angle(Angle::Ascendant));
        CHECK(validation_message(parts).empty());
    }
}

// =================================================================
// Range checks
// =================================================================

TEST_CASE("Body longitude of 360 is rejected")
{
    ChartParts parts;
    parts.body(Body::Mars).longitude = 360.0;

    const std::string msg = validation_message(parts);
    CHECK(contains(msg, "Mars"));
    CHECK(contains(msg, "longitude"));
}

TEST_CASE("Negative body longitude is rejected")
{
    ChartParts parts;
    parts.body(Body::Moon).longitude = -0.5;
    CHECK(contains(validation_message(parts), "Moon"));
}

TEST_CASE("Body degree of 30 is rejected")
{
    ChartParts parts;
    parts.body(Body::Venus).degree = 30.0;

    const std::string msg = validation_message(parts);
    CHECK(contains(msg, "Venus"));
    CHECK(contains(msg, "degree"));
}

TEST_CASE("NaN body longitude is rejected")
{
    ChartParts parts;
    parts.body(Body::TrueNode).longitude = std::numeric_limits<f64>::quiet_NaN();
    CHECK(contains(validation_message(parts), "TrueNode"));
}

TEST_CASE("Angle longitude out of range is rejected")
{
    ChartParts parts;
    parts.angle(Angle::Midheaven).longitude = 400.0;
    CHECK(contains(validation_message(parts), "Midheaven"));
}

TEST_CASE("Sign that disagrees with longitude is rejected")
{
    ChartParts parts;
    parts.body(Body::Sun).sign = sign_at(sign_index(parts.body(Body::Sun).sign) + 1);

    const std::string msg = validation_message(parts);
    CHECK(contains(msg, "sign check"));
    CHECK(contains(msg, "Sun"));
}

// =================================================================
// Whole Sign checks
// =================================================================

TEST_CASE("House 1 must match the Ascendant sign")
{
    ChartParts parts;
    parts.houses = HouseDeriver::from_sign(ZodiacSign::Libra);

    const std::string msg = validation_message(parts);
    CHECK(contains(msg, "house 1"));
    CHECK(contains(msg, "Virgo"));
}

TEST_CASE("A single misplaced house is caught")
{
    ChartParts parts;
    parts.houses.signs[6] = ZodiacSign::Aries;   // house 7 should be Pisces

    const std::string msg = validation_message(parts);
    CHECK(contains(msg, "house 7"));
    CHECK(contains(msg, "Pisces"));
}

TEST_CASE("Swapped houses are caught")
{
    ChartParts parts;
    std::swap(parts.houses.signs[2], parts.houses.signs[3]);
    CHECK(contains(validation_message(parts), "house 3"));
}

TEST_CASE("Failures are thrown as ValidationError")
{
    ChartParts parts;
    parts.body(Body::Pluto).degree = -1.0;
    CHECK_THROWS_AS(OutputValidator::validate(parts.bodies, parts.angles, parts.houses),
                    core::ValidationError);
}
