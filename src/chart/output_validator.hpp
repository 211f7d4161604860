#pragma once

/// @file output_validator.hpp
/// @brief Last gate before a chart leaves the core.

#include "astro/positions.hpp"

namespace astrochart::chart
{
    /// @brief Static utility class that re-checks every derived value.
    ///
    /// Checks, in order:
    ///   1. body longitude in [0, 360), degree in [0, 30), sign = floor(longitude / 30)
    ///   2. angle longitude in [0, 360), degree in [0, 30), sign = floor(longitude / 30)
    ///   3. house 1 sign == Ascendant sign
    ///   4. house n sign == sign at (ascendant_index + n - 1) mod 12, for n in 1..12
    ///
    /// Check 4 recomputes the cyclic law on its own rather than calling
    /// HouseDeriver, so drift between the two is caught. A failure is an internal
    /// defect; it is logged at critical level and thrown.
    class OutputValidator
    {
    public:
        OutputValidator() = delete;

        /// @throws core::ValidationError naming the failed check and entity.
        static void validate(
            const astro::BodyTable& bodies,
            const astro::AngleTable& angles,
            const astro::HouseTable& houses
        );
    };

} // namespace astrochart::chart
