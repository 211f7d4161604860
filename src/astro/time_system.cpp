/// @file time_system.cpp
/// @brief Implementation of astronomical time utilities.

#include "astro/time_system.hpp"

#include "core/errors.hpp"
#include "core/types.hpp"

#include <spdlog/fmt/fmt.h>

#include <charconv>
#include <cmath>
#include <string>

namespace astrochart::astro
{

namespace
{

// -----------------------------------------------------------------
// Fixed-width unsigned decimal field, e.g. "09" or "1977"
// -----------------------------------------------------------------

std::optional<i32> parse_field(std::string_view text, std::size_t pos, std::size_t width)
{
    if (pos + width > text.size())
    {
        return std::nullopt;
    }

    const std::string_view digits = text.substr(pos, width);
    for (const char c : digits)
    {
        if (c < '0' || c > '9')
        {
            return std::nullopt;
        }
    }

    i32 value = 0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size())
    {
        return std::nullopt;
    }
    return value;
}

bool is_digit(char c)
{
    return c >= '0' && c <= '9';
}

// -----------------------------------------------------------------
// UTC designator: "", "Z", "+00:00", "-00:00", "+0000", "+00"
// Any non-zero offset is refused: the caller must normalize to UTC.
// -----------------------------------------------------------------

bool is_utc_designator(std::string_view suffix)
{
    if (suffix.empty() || suffix == "Z" || suffix == "z")
    {
        return true;
    }

    if (suffix.front() != '+' && suffix.front() != '-')
    {
        return false;
    }

    const std::string_view offset = suffix.substr(1);
    return offset == "00:00" || offset == "0000" || offset == "00";
}

} // namespace

// -----------------------------------------------------------------
// ISO-8601 parsing
// -----------------------------------------------------------------

std::optional<DateTime> TimeSystem::parse_iso8601(std::string_view text)
{
    // Date part: YYYY-MM-DD
    if (text.size() < 10 || text[4] != '-' || text[7] != '-')
    {
        return std::nullopt;
    }

    const auto year  = parse_field(text, 0, 4);
    const auto month = parse_field(text, 5, 2);
    const auto day   = parse_field(text, 8, 2);
    if (!year || !month || !day)
    {
        return std::nullopt;
    }

    DateTime dt{
        .year        = *year,
        .month       = *month,
        .day         = *day,
        .hour        = 0,
        .minute      = 0,
        .second      = 0,
        .microsecond = 0,
    };

    std::size_t pos = 10;

    // Optional time part: THH:MM[:SS[.fraction]]
    if (pos < text.size() && (text[pos] == 'T' || text[pos] == 't' || text[pos] == ' '))
    {
        ++pos;

        const auto hour   = parse_field(text, pos, 2);
        const bool colon  = pos + 2 < text.size() && text[pos + 2] == ':';
        const auto minute = parse_field(text, pos + 3, 2);
        if (!hour || !colon || !minute)
        {
            return std::nullopt;
        }
        dt.hour   = *hour;
        dt.minute = *minute;
        pos += 5;

        if (pos < text.size() && text[pos] == ':')
        {
            const auto second = parse_field(text, pos + 1, 2);
            if (!second)
            {
                return std::nullopt;
            }
            dt.second = *second;
            pos += 3;

            if (pos < text.size() && (text[pos] == '.' || text[pos] == ','))
            {
                ++pos;
                i32 micro = 0;
                i32 digits = 0;
                while (pos < text.size() && is_digit(text[pos]))
                {
                    // Truncate beyond microseconds
                    if (digits < 6)
                    {
                        micro = micro * 10 + (text[pos] - '0');
                    }
                    ++digits;
                    ++pos;
                }
                if (digits == 0 || digits > 9)
                {
                    return std::nullopt;
                }
                for (i32 i = digits; i < 6; ++i)
                {
                    micro *= 10;
                }
                dt.microsecond = micro;
            }
        }
    }

    if (!is_utc_designator(text.substr(pos)))
    {
        return std::nullopt;
    }

    // Calendar range checks
    if (dt.month < 1 || dt.month > 12)
    {
        return std::nullopt;
    }
    if (dt.day < 1 || dt.day > days_in_month(dt.year, dt.month))
    {
        return std::nullopt;
    }
    if (dt.hour > 23 || dt.minute > 59 || dt.second > 59)
    {
        return std::nullopt;
    }

    return dt;
}

// -----------------------------------------------------------------
// Fractional hour
// -----------------------------------------------------------------

f64 TimeSystem::fractional_hour(const DateTime& dt)
{
    return static_cast<f64>(dt.hour)
         + static_cast<f64>(dt.minute) / 60.0
         + static_cast<f64>(dt.second) / 3600.0
         + static_cast<f64>(dt.microsecond) / 3600000000.0;
}

// -----------------------------------------------------------------
// Julian Day: Meeus algorithm (Astronomical Algorithms, Ch. 7)
// -----------------------------------------------------------------

f64 TimeSystem::to_julian_day(const DateTime& dt)
{
    if (!in_supported_range(dt))
    {
        throw core::CalculationError(fmt::format(
            "date {:04}-{:02}-{:02} is outside the supported calendar range "
            "[{:04}-{:02}-{:02}, {}-12-31]",
            dt.year, dt.month, dt.day, kFirstYear, kFirstMonth, kFirstDay, kLastYear));
    }

    i32 y = dt.year;
    i32 m = dt.month;

    // Jan and Feb are treated as months 13 and 14 of the previous year
    if (m <= 2)
    {
        y -= 1;
        m += 12;
    }

    // Gregorian calendar correction
    const i32 a = y / 100;
    const i32 b = 2 - a + (a / 4);

    const f64 day_fraction = fractional_hour(dt) / 24.0;

    const f64 jd = std::floor(365.25 * static_cast<f64>(y + 4716))
                 + std::floor(30.6001 * static_cast<f64>(m + 1))
                 + static_cast<f64>(dt.day)
                 + day_fraction
                 + static_cast<f64>(b)
                 - 1524.5;

    return jd;
}

bool TimeSystem::in_supported_range(const DateTime& dt)
{
    if (dt.year > kLastYear)
    {
        return false;
    }
    if (dt.year != kFirstYear)
    {
        return dt.year > kFirstYear;
    }
    if (dt.month != kFirstMonth)
    {
        return dt.month > kFirstMonth;
    }
    return dt.day >= kFirstDay;
}

i32 TimeSystem::days_in_month(i32 year, i32 month)
{
    switch (month)
    {
        case 2:
        {
            const bool leap = (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
            return leap ? 29 : 28;
        }
        case 4:
        case 6:
        case 9:
        case 11:
            return 30;
        default:
            return 31;
    }
}

} // namespace astrochart::astro
