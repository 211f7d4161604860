/// @file house_deriver.cpp
/// @brief Implementation of Whole-Sign house derivation.

#include "astro/house_deriver.hpp"

namespace astrochart::astro
{

HouseTable HouseDeriver::derive(const AnglePosition& ascendant)
{
    return from_sign(ascendant.sign);
}

HouseTable HouseDeriver::from_sign(ZodiacSign ascendant_sign)
{
    const i32 first = sign_index(ascendant_sign);

    HouseTable table{};
    for (i32 house = 1; house <= kHouseCount; ++house)
    {
        table.signs[static_cast<std::size_t>(house - 1)] = sign_at(first + house - 1);
    }
    return table;
}

} // namespace astrochart::astro
