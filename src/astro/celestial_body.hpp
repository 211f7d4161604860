#pragma once

/// @file celestial_body.hpp
/// @brief The fixed set of bodies tracked in every chart.

#include "core/types.hpp"

#include <array>
#include <string_view>

namespace astrochart::astro
{
    /// @brief Tracked body; the underlying value is its slot in chart output.
    enum class Body : u8
    {
        Sun,
        Moon,
        Mercury,
        Venus,
        Mars,
        Jupiter,
        Saturn,
        Uranus,
        Neptune,
        Pluto,
        TrueNode,   ///< True (osculating) lunar node
    };

    inline constexpr std::size_t kBodyCount = 11;

    inline constexpr std::array<Body, kBodyCount> kTrackedBodies = {
        Body::Sun,     Body::Moon,    Body::Mercury, Body::Venus,
        Body::Mars,    Body::Jupiter, Body::Saturn,  Body::Uranus,
        Body::Neptune, Body::Pluto,   Body::TrueNode,
    };

    /// @brief Display name used in output and error messages ("Sun", ..., "TrueNode").
    [[nodiscard]] std::string_view body_name(Body body);

    /// @brief The two chart angles.
    enum class Angle : u8
    {
        Ascendant,
        Midheaven,
    };

    inline constexpr std::size_t kAngleCount = 2;

    inline constexpr std::array<Angle, kAngleCount> kChartAngles = {
        Angle::Ascendant,
        Angle::Midheaven,
    };

    /// @brief Display name ("Ascendant", "Midheaven").
    [[nodiscard]] std::string_view angle_name(Angle angle);

} // namespace astrochart::astro
