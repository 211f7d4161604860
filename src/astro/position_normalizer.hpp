#pragma once

/// @file position_normalizer.hpp
/// @brief Raw ephemeris longitude → canonical longitude, sign, degree, retrograde.

#include "astro/positions.hpp"
#include "core/types.hpp"

#include <string_view>

namespace astrochart::astro
{
    /// @brief Static utility class that post-processes raw provider output.
    ///
    /// Pipeline per value:
    ///   1. reduce longitude into [0, 360)
    ///   2. reject non-finite values (never coerced to 0)
    ///   3. round to 6 decimals; a value rounding up to 360 wraps to 0
    ///   4. decompose into sign index floor(L / 30) and degree L - 30 * index
    ///   5. retrograde = speed < 0 (bodies only)
    ///
    /// Sign and degree come from the rounded longitude, so
    /// sign_index * 30 + degree reproduces the output longitude.
    class PositionNormalizer
    {
    public:
        PositionNormalizer() = delete;

        /// @brief Normalize one body position.
        /// @param raw_longitude_deg Provider longitude, any real value.
        /// @param raw_speed_deg_per_day Daily motion in longitude; sign gives direction.
        /// @param label Body name, used in error messages only.
        /// @throws core::CalculationError if longitude or speed is not finite.
        [[nodiscard]] static BodyPosition normalize_body(
            f64 raw_longitude_deg,
            f64 raw_speed_deg_per_day,
            std::string_view label
        );

        /// @brief Normalize a chart angle (Ascendant, Midheaven).
        /// @throws core::CalculationError if longitude is not finite.
        [[nodiscard]] static AnglePosition normalize_angle(
            f64 raw_longitude_deg,
            std::string_view label
        );

        /// @brief ((raw mod 360) + 360) mod 360, guaranteed < 360 for finite input.
        [[nodiscard]] static f64 reduce_longitude(f64 raw_longitude_deg);

        /// @brief Round to the 6-decimal output precision.
        [[nodiscard]] static f64 round_output(f64 value);

    private:
        struct Decomposition
        {
            f64 longitude;
            ZodiacSign sign;
            f64 degree;
        };

        [[nodiscard]] static Decomposition decompose(f64 raw_longitude_deg, std::string_view label);
    };

} // namespace astrochart::astro
