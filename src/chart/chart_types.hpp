#pragma once

/// @file chart_types.hpp
/// @brief Chart request and result records.

#include "astro/positions.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"
#include "ephemeris/ephemeris_provider.hpp"

#include <optional>
#include <string>

namespace astrochart::chart
{
    /// Only accepted house system marker (Whole Sign).
    inline constexpr std::string_view kWholeSignMarker = "W";

    /// Only accepted zodiac.
    inline constexpr std::string_view kTropicalZodiac = "tropical";

    /// @brief Chart request as received from a caller, not yet validated.
    struct ChartInput
    {
        std::string datetime_utc;                   ///< ISO-8601 UTC, e.g. "1977-09-05T17:24:00Z"
        f64 latitude = 0.0;                         ///< Degrees, -90..90, north positive
        f64 longitude = 0.0;                        ///< Degrees, -180..180, east positive
        std::string house_system{kWholeSignMarker};
        std::string zodiac{kTropicalZodiac};
        std::optional<std::string> ayanamsa;        ///< Must stay empty (no sidereal support)
    };

    /// @brief ChartInput after every field has been checked.
    struct ValidatedInput
    {
        astro::DateTime timestamp;
        f64 latitude;
        f64 longitude;
    };

    /// @brief Provenance of a computed chart.
    struct ChartMetadata
    {
        std::string ephemeris;                      ///< Engine name
        std::string calculation_method;             ///< Engine binding
        f64 julian_day;                             ///< JD (UT) used, 6 decimals
        std::string precision;                      ///< Accuracy label for the mode
        ephemeris::PrecisionMode precision_mode;    ///< As reported by the provider
    };

    /// @brief A complete, validated natal chart.
    struct ChartOutput
    {
        astro::BodyTable bodies;    ///< All eleven tracked bodies, kTrackedBodies order
        astro::AngleTable angles;   ///< Ascendant, Midheaven
        astro::HouseTable houses;
        ChartMetadata metadata;

        [[nodiscard]] const astro::BodyPosition& body(astro::Body b) const
        {
            return astro::position_of(bodies, b);
        }

        [[nodiscard]] const astro::AnglePosition& angle(astro::Angle a) const
        {
            return astro::position_of(angles, a);
        }
    };

} // namespace astrochart::chart
