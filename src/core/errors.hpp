#pragma once

/// @file errors.hpp
/// @brief Exception hierarchy for chart computation failures.

#include <stdexcept>
#include <string>
#include <utility>

namespace astrochart::core
{
    /// @brief Base class of every error raised by astrochart.
    class AstroChartError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /// @brief A ChartInput field was rejected before any computation ran.
    class InputError : public AstroChartError
    {
    public:
        InputError(std::string field, const std::string& message)
            : AstroChartError(field + ": " + message)
            , m_field(std::move(field))
        {
        }

        /// @brief Name of the offending input field (e.g. "latitude").
        [[nodiscard]] const std::string& field() const noexcept { return m_field; }

    private:
        std::string m_field;
    };

    /// @brief The ephemeris provider failed or produced a non-finite value.
    class CalculationError : public AstroChartError
    {
    public:
        using AstroChartError::AstroChartError;
    };

    /// @brief An assembled chart violated an output invariant.
    ///
    /// Signals an internal defect, never bad input.
    class ValidationError : public AstroChartError
    {
    public:
        using AstroChartError::AstroChartError;
    };

    /// @brief A configuration file could not be read or was malformed.
    class ConfigError : public AstroChartError
    {
    public:
        using AstroChartError::AstroChartError;
    };

} // namespace astrochart::core
