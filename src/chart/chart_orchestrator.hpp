#pragma once

/// @file chart_orchestrator.hpp
/// @brief Composes time conversion, ephemeris lookups, normalization, houses, validation.

#include "chart/chart_types.hpp"
#include "ephemeris/ephemeris_provider.hpp"

namespace astrochart::chart
{
    /// @brief Computes complete natal charts.
    ///
    /// Per request, strictly in order:
    ///   InputValidator → TimeSystem::to_julian_day → provider body_position (×11)
    ///   → PositionNormalizer → provider houses_and_angles → PositionNormalizer
    ///   → HouseDeriver → OutputValidator → ChartOutput
    ///
    /// The provider is opened once by the host and injected by reference; it must
    /// outlive the orchestrator. The orchestrator holds no other state, so one
    /// instance may serve concurrent requests.
    class ChartOrchestrator
    {
    public:
        explicit ChartOrchestrator(const ephemeris::EphemerisProvider& provider);

        /// @brief Compute a chart. Either every body, both angles and all twelve
        /// houses are valid, or the call throws; there is no partial result.
        /// @throws core::InputError        input rejected, nothing computed
        /// @throws core::CalculationError  provider failure or non-finite value
        /// @throws core::ValidationError   output invariant violated (internal defect)
        [[nodiscard]] ChartOutput compute(const ChartInput& input) const;

        [[nodiscard]] const ephemeris::EphemerisProvider& provider() const noexcept { return m_provider; }

    private:
        [[nodiscard]] astro::BodyTable compute_bodies(f64 jd_ut) const;

        [[nodiscard]] astro::AngleTable compute_angles(f64 jd_ut, const ValidatedInput& input) const;

        [[nodiscard]] ChartMetadata make_metadata(f64 jd_ut) const;

        const ephemeris::EphemerisProvider& m_provider;
    };

} // namespace astrochart::chart
