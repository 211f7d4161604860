/// @file output_validator.cpp
/// @brief Implementation of chart self-consistency checks.

#include "chart/output_validator.hpp"

#include "core/errors.hpp"
#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <string>
#include <string_view>

namespace astrochart::chart
{

namespace
{

[[noreturn]] void fail(const std::string& message)
{
    ACH_CORE_CRITICAL("OutputValidator: {}", message);
    throw core::ValidationError(message);
}

// -----------------------------------------------------------------
// Shared range + decomposition check for bodies and angles
// -----------------------------------------------------------------

void check_position(std::string_view kind, std::string_view name,
                    f64 longitude, f64 degree, astro::ZodiacSign sign)
{
    if (!(longitude >= 0.0 && longitude < astro_constants::kFullCircleDeg))
    {
        fail(fmt::format("range check failed: {} {} longitude {} out of range [0, 360)",
                         kind, name, longitude));
    }

    if (!(degree >= 0.0 && degree < astro_constants::kSignWidthDeg))
    {
        fail(fmt::format("range check failed: {} {} degree {} out of range [0, 30)",
                         kind, name, degree));
    }

    const astro::ZodiacSign expected = astro::sign_from_longitude(longitude);
    if (sign != expected)
    {
        fail(fmt::format("sign check failed: {} {} at longitude {} should be {}, got {}",
                         kind, name, longitude,
                         astro::sign_name(expected), astro::sign_name(sign)));
    }
}

} // namespace

void OutputValidator::validate(
    const astro::BodyTable& bodies,
    const astro::AngleTable& angles,
    const astro::HouseTable& houses)
{
    for (const astro::Body body : astro::kTrackedBodies)
    {
        const astro::BodyPosition& pos = astro::position_of(bodies, body);
        check_position("body", astro::body_name(body), pos.longitude, pos.degree, pos.sign);
    }

    for (const astro::Angle angle : astro::kChartAngles)
    {
        const astro::AnglePosition& pos = astro::position_of(angles, angle);
        check_position("angle", astro::angle_name(angle), pos.longitude, pos.degree, pos.sign);
    }

    // -----------------------------------------------------------------
    // Whole Sign: house 1 is the Ascendant's sign
    // -----------------------------------------------------------------
    const astro::ZodiacSign asc_sign = astro::position_of(angles, astro::Angle::Ascendant).sign;
    if (houses.sign_of(1) != asc_sign)
    {
        fail(fmt::format("Whole Sign check failed: Ascendant is in {} but house 1 is {}",
                         astro::sign_name(asc_sign), astro::sign_name(houses.sign_of(1))));
    }

    // -----------------------------------------------------------------
    // Whole Sign: houses follow the zodiac cyclically from the Ascendant
    // -----------------------------------------------------------------
    const i32 asc_index = astro::sign_index(asc_sign);
    for (i32 house = 1; house <= astro::kHouseCount; ++house)
    {
        const i32 expected_index = (asc_index + house - 1) % astro::kSignCount;
        const astro::ZodiacSign expected = astro::kZodiacOrder[static_cast<std::size_t>(expected_index)];
        const astro::ZodiacSign actual = houses.sign_of(house);
        if (actual != expected)
        {
            fail(fmt::format("Whole Sign check failed: house {} should be {}, got {}",
                             house, astro::sign_name(expected), astro::sign_name(actual)));
        }
    }
}

} // namespace astrochart::chart
