#pragma once

/// @file chart_json.hpp
/// @brief JSON encoding of charts and decoding of chart requests (nlohmann/json).

#include "chart/chart_types.hpp"

#include <nlohmann/json.hpp>

#include <string_view>

namespace astrochart::chart
{
    /// @brief Static utility class mapping chart records to and from JSON.
    ///
    /// Output layout (keys in this order):
    /// @code
    /// {
    ///   "planets":  { "Sun": {"longitude", "sign", "degree", "retrograde"}, ... },
    ///   "angles":   { "Ascendant": {"longitude", "sign", "degree"}, "Midheaven": {...} },
    ///   "houses":   { "1": "Virgo", ..., "12": "Leo" },
    ///   "metadata": { "ephemeris", "calculation_method", "julian_day",
    ///                 "precision", "ephemeris_mode" }
    /// }
    /// @endcode
    class ChartJson
    {
    public:
        ChartJson() = delete;

        [[nodiscard]] static nlohmann::ordered_json to_json(const ChartOutput& chart);

        /// @brief Decode a request object.
        ///
        /// Required: datetime_utc (string), latitude, longitude (numbers).
        /// Optional: house_system, zodiac (strings), ayanamsa (string or null).
        /// Only types are checked here; values are checked by InputValidator.
        ///
        /// @throws core::InputError naming the missing or mistyped field.
        [[nodiscard]] static ChartInput input_from_json(const nlohmann::json& j);

        /// @brief Parse request text, then decode it.
        /// @throws nlohmann::json::parse_error on malformed JSON.
        /// @throws core::InputError as input_from_json().
        [[nodiscard]] static ChartInput input_from_string(std::string_view text);
    };

} // namespace astrochart::chart
