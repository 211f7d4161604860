/// @file zodiac.cpp
/// @brief Zodiac sign names and longitude lookup.

#include "astro/zodiac.hpp"

#include <cmath>

namespace astrochart::astro
{

namespace
{

constexpr std::array<std::string_view, kSignCount> kSignNames = {
    "Aries", "Taurus", "Gemini", "Cancer",
    "Leo", "Virgo", "Libra", "Scorpio",
    "Sagittarius", "Capricorn", "Aquarius", "Pisces",
};

} // namespace

std::string_view sign_name(ZodiacSign sign)
{
    return kSignNames[static_cast<std::size_t>(sign_index(sign))];
}

std::optional<ZodiacSign> sign_from_name(std::string_view name)
{
    for (i32 i = 0; i < kSignCount; ++i)
    {
        if (kSignNames[static_cast<std::size_t>(i)] == name)
        {
            return sign_at(i);
        }
    }
    return std::nullopt;
}

ZodiacSign sign_from_longitude(f64 longitude_deg)
{
    return sign_at(static_cast<i32>(std::floor(longitude_deg / astro_constants::kSignWidthDeg)));
}

} // namespace astrochart::astro
