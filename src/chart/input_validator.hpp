#pragma once

/// @file input_validator.hpp
/// @brief Rejects malformed chart requests before any computation.

#include "chart/chart_types.hpp"

namespace astrochart::chart
{
    /// @brief Static utility class validating ChartInput.
    class InputValidator
    {
    public:
        InputValidator() = delete;

        /// @brief Check every field and parse the timestamp.
        ///
        /// Rejects: unparseable or non-UTC datetime_utc, latitude outside [-90, 90],
        /// longitude outside [-180, 180] (NaN included), a house system other than
        /// "W", a zodiac other than "tropical", and any ayanamsa value.
        ///
        /// @throws core::InputError naming the first offending field.
        [[nodiscard]] static ValidatedInput validate(const ChartInput& input);
    };

} // namespace astrochart::chart
