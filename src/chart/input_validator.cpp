/// @file input_validator.cpp
/// @brief Implementation of chart request validation.

#include "chart/input_validator.hpp"

#include "core/errors.hpp"

#include <spdlog/fmt/fmt.h>

namespace astrochart::chart
{

ValidatedInput InputValidator::validate(const ChartInput& input)
{
    const auto timestamp = astro::TimeSystem::parse_iso8601(input.datetime_utc);
    if (!timestamp)
    {
        throw core::InputError("datetime_utc", fmt::format(
            "invalid datetime '{}'; use ISO 8601 UTC (e.g. '1977-09-05T17:24:00Z')",
            input.datetime_utc));
    }

    // Written as negated ranges so NaN is rejected too
    if (!(input.latitude >= -90.0 && input.latitude <= 90.0))
    {
        throw core::InputError("latitude", fmt::format(
            "{} is outside [-90, 90]", input.latitude));
    }

    if (!(input.longitude >= -180.0 && input.longitude <= 180.0))
    {
        throw core::InputError("longitude", fmt::format(
            "{} is outside [-180, 180]", input.longitude));
    }

    if (input.house_system != kWholeSignMarker)
    {
        throw core::InputError("house_system", fmt::format(
            "'{}' is not supported; only '{}' (Whole Sign) is accepted",
            input.house_system, kWholeSignMarker));
    }

    if (input.zodiac != kTropicalZodiac)
    {
        throw core::InputError("zodiac", fmt::format(
            "'{}' is not supported; only '{}' is accepted", input.zodiac, kTropicalZodiac));
    }

    if (input.ayanamsa)
    {
        throw core::InputError("ayanamsa", fmt::format(
            "sidereal zodiac not supported; ayanamsa must be null, got '{}'", *input.ayanamsa));
    }

    return ValidatedInput{
        .timestamp = *timestamp,
        .latitude  = input.latitude,
        .longitude = input.longitude,
    };
}

} // namespace astrochart::chart
