/// @file position_normalizer.cpp
/// @brief Implementation of raw position post-processing.

#include "astro/position_normalizer.hpp"

#include "core/errors.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>

namespace astrochart::astro
{

BodyPosition PositionNormalizer::normalize_body(
    f64 raw_longitude_deg,
    f64 raw_speed_deg_per_day,
    std::string_view label)
{
    const Decomposition d = decompose(raw_longitude_deg, label);

    if (!std::isfinite(raw_speed_deg_per_day))
    {
        throw core::CalculationError(fmt::format(
            "non-finite speed {} returned for {}; check ephemeris files and date range",
            raw_speed_deg_per_day, label));
    }

    return BodyPosition{
        .longitude  = d.longitude,
        .sign       = d.sign,
        .degree     = d.degree,
        .retrograde = raw_speed_deg_per_day < 0.0,
    };
}

AnglePosition PositionNormalizer::normalize_angle(f64 raw_longitude_deg, std::string_view label)
{
    const Decomposition d = decompose(raw_longitude_deg, label);

    return AnglePosition{
        .longitude = d.longitude,
        .sign      = d.sign,
        .degree    = d.degree,
    };
}

// -----------------------------------------------------------------
// Range reduction
//
// fmod keeps the sign of the dividend, so negatives need one lift.
// A tiny negative input can land on exactly 360.0 after the lift.
// -----------------------------------------------------------------

f64 PositionNormalizer::reduce_longitude(f64 raw_longitude_deg)
{
    f64 reduced = std::fmod(raw_longitude_deg, astro_constants::kFullCircleDeg);
    if (reduced < 0.0)
    {
        reduced += astro_constants::kFullCircleDeg;
    }
    if (reduced >= astro_constants::kFullCircleDeg)
    {
        reduced -= astro_constants::kFullCircleDeg;
    }
    return reduced;
}

f64 PositionNormalizer::round_output(f64 value)
{
    return std::round(value * astro_constants::kOutputScale) / astro_constants::kOutputScale;
}

PositionNormalizer::Decomposition PositionNormalizer::decompose(
    f64 raw_longitude_deg,
    std::string_view label)
{
    const f64 reduced = reduce_longitude(raw_longitude_deg);

    if (!std::isfinite(reduced))
    {
        throw core::CalculationError(fmt::format(
            "non-finite longitude {} returned for {}; check ephemeris files and date range",
            raw_longitude_deg, label));
    }

    f64 longitude = round_output(reduced);
    if (longitude >= astro_constants::kFullCircleDeg)
    {
        longitude = 0.0;
    }

    const i32 index = static_cast<i32>(std::floor(longitude / astro_constants::kSignWidthDeg));
    const f64 degree = round_output(longitude - static_cast<f64>(index) * astro_constants::kSignWidthDeg);

    return Decomposition{
        .longitude = longitude,
        .sign      = sign_at(index),
        .degree    = degree,
    };
}

} // namespace astrochart::astro
