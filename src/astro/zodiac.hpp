#pragma once

/// @file zodiac.hpp
/// @brief The twelve tropical zodiac signs in cyclic order.

#include "core/types.hpp"

#include <array>
#include <optional>
#include <string_view>

namespace astrochart::astro
{
    /// @brief Zodiac sign; the underlying value is the 0-based cyclic index (Aries = 0).
    enum class ZodiacSign : u8
    {
        Aries,
        Taurus,
        Gemini,
        Cancer,
        Leo,
        Virgo,
        Libra,
        Scorpio,
        Sagittarius,
        Capricorn,
        Aquarius,
        Pisces,
    };

    inline constexpr i32 kSignCount = 12;

    inline constexpr std::array<ZodiacSign, kSignCount> kZodiacOrder = {
        ZodiacSign::Aries,       ZodiacSign::Taurus,    ZodiacSign::Gemini,
        ZodiacSign::Cancer,      ZodiacSign::Leo,       ZodiacSign::Virgo,
        ZodiacSign::Libra,       ZodiacSign::Scorpio,   ZodiacSign::Sagittarius,
        ZodiacSign::Capricorn,   ZodiacSign::Aquarius,  ZodiacSign::Pisces,
    };

    /// @brief 0-based index of a sign in kZodiacOrder.
    [[nodiscard]] constexpr i32 sign_index(ZodiacSign sign)
    {
        return static_cast<i32>(sign);
    }

    /// @brief Sign at a cyclic offset; any integer is reduced modulo 12.
    [[nodiscard]] constexpr ZodiacSign sign_at(i32 index)
    {
        const i32 wrapped = ((index % kSignCount) + kSignCount) % kSignCount;
        return kZodiacOrder[static_cast<std::size_t>(wrapped)];
    }

    /// @brief Display name ("Aries" ... "Pisces").
    [[nodiscard]] std::string_view sign_name(ZodiacSign sign);

    /// @brief Reverse lookup of sign_name(); exact, case-sensitive.
    [[nodiscard]] std::optional<ZodiacSign> sign_from_name(std::string_view name);

    /// @brief Sign containing a normalized longitude.
    /// @param longitude_deg Ecliptic longitude, must be in [0, 360).
    [[nodiscard]] ZodiacSign sign_from_longitude(f64 longitude_deg);

} // namespace astrochart::astro
