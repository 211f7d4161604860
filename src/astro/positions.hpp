#pragma once

/// @file positions.hpp
/// @brief Normalized chart positions and the Whole-Sign house table.

#include "astro/celestial_body.hpp"
#include "astro/zodiac.hpp"
#include "core/types.hpp"

#include <array>

namespace astrochart::astro
{
    /// @brief Normalized position of one tracked body.
    ///
    /// Produced only by PositionNormalizer; sign and degree are derived from longitude.
    struct BodyPosition
    {
        f64 longitude;      ///< Ecliptic longitude (degrees, 0..360), 6 decimals
        ZodiacSign sign;    ///< Sign containing longitude
        f64 degree;         ///< Degree within sign (0..30), 6 decimals
        bool retrograde;    ///< True iff daily motion in longitude is negative
    };

    /// @brief Normalized position of a chart angle (no retrograde concept).
    struct AnglePosition
    {
        f64 longitude;      ///< Ecliptic longitude (degrees, 0..360), 6 decimals
        ZodiacSign sign;    ///< Sign containing longitude
        f64 degree;         ///< Degree within sign (0..30), 6 decimals
    };

    /// Positions indexed by Body (kTrackedBodies order).
    using BodyTable = std::array<BodyPosition, kBodyCount>;

    /// Positions indexed by Angle (Ascendant, Midheaven).
    using AngleTable = std::array<AnglePosition, kAngleCount>;

    inline constexpr i32 kHouseCount = 12;

    /// @brief House number (1..12) to zodiac sign.
    struct HouseTable
    {
        std::array<ZodiacSign, kHouseCount> signs;  ///< signs[n - 1] is house n

        /// @brief Sign of house @p house.
        /// @throws std::out_of_range if house is not in 1..12.
        [[nodiscard]] ZodiacSign sign_of(i32 house) const
        {
            return signs.at(static_cast<std::size_t>(house - 1));
        }
    };

    [[nodiscard]] inline const BodyPosition& position_of(const BodyTable& table, Body body)
    {
        return table[static_cast<std::size_t>(body)];
    }

    [[nodiscard]] inline const AnglePosition& position_of(const AngleTable& table, Angle angle)
    {
        return table[static_cast<std::size_t>(angle)];
    }

} // namespace astrochart::astro
