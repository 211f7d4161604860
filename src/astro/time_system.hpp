#pragma once

/// @file time_system.hpp
/// @brief Astronomical time utilities: ISO-8601 parsing and Julian Day (UT).

#include "core/types.hpp"

#include <optional>
#include <string_view>

namespace astrochart::astro
{
    /// @brief Civil date/time representation (UTC), microsecond resolution.
    struct DateTime
    {
        i32 year;
        i32 month;
        i32 day;
        i32 hour;
        i32 minute;
        i32 second;
        i32 microsecond;
    };

    /// @brief Static utility class for astronomical time computations.
    ///
    /// Provides Julian Day conversion (Meeus algorithm, Astronomical Algorithms Ch. 7)
    /// and strict ISO-8601 parsing of UTC timestamps. No timezone inference is done:
    /// callers hand in UTC.
    class TimeSystem
    {
    public:
        TimeSystem() = delete;

        /// First supported civil date: 1582-10-15, the first Gregorian calendar day.
        static constexpr i32 kFirstYear  = 1582;
        static constexpr i32 kFirstMonth = 10;
        static constexpr i32 kFirstDay   = 15;

        /// Last supported year (inclusive), the end of the Moshier fallback range.
        static constexpr i32 kLastYear = 2999;

        /// @brief Parse an ISO-8601 UTC timestamp.
        ///
        /// Accepts `YYYY-MM-DD`, optionally followed by `T` or a space and
        /// `HH:MM[:SS[.fraction]]`, optionally followed by `Z` or a zero UTC offset
        /// (`+00:00`, `-00:00`, `+0000`, `+00`). A timestamp without suffix is taken
        /// as UTC. Fractions of 1-9 digits are truncated to microseconds.
        ///
        /// @param text Timestamp text.
        /// @return Parsed civil date/time, or std::nullopt if malformed, out of range,
        ///         or carrying a non-zero UTC offset.
        [[nodiscard]] static std::optional<DateTime> parse_iso8601(std::string_view text);

        /// @brief Fractional hour of day, preserving microseconds.
        /// @return hour + minute/60 + second/3600 + microsecond/3.6e9
        [[nodiscard]] static f64 fractional_hour(const DateTime& dt);

        /// @brief Convert civil date/time (UTC) to Julian Day (UT).
        /// @param dt Civil date/time, already validated by parse_iso8601().
        /// @return Julian Day as a double-precision floating-point number.
        /// @throws core::CalculationError if the date lies outside
        ///         [1582-10-15, 2999-12-31].
        [[nodiscard]] static f64 to_julian_day(const DateTime& dt);

        /// @brief True if the date falls inside the supported calendar range.
        [[nodiscard]] static bool in_supported_range(const DateTime& dt);

        /// @brief Number of days in a Gregorian month.
        [[nodiscard]] static i32 days_in_month(i32 year, i32 month);
    };

} // namespace astrochart::astro
