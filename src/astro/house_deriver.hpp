#pragma once

/// @file house_deriver.hpp
/// @brief Whole-Sign house derivation from the Ascendant.

#include "astro/positions.hpp"
#include "astro/zodiac.hpp"

namespace astrochart::astro
{
    /// @brief Static utility class for Whole-Sign houses.
    ///
    /// Each house occupies one entire sign: house 1 is the Ascendant's sign and
    /// house n is the sign at (ascendant_index + n - 1) mod 12. Cusp degrees play
    /// no part. No I/O and no failure path.
    class HouseDeriver
    {
    public:
        HouseDeriver() = delete;

        /// @brief Derive the house table from a normalized Ascendant.
        [[nodiscard]] static HouseTable derive(const AnglePosition& ascendant);

        /// @brief Derive the house table from the Ascendant's sign.
        [[nodiscard]] static HouseTable from_sign(ZodiacSign ascendant_sign);
    };

} // namespace astrochart::astro
