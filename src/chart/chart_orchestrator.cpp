/// @file chart_orchestrator.cpp
/// @brief Implementation of the chart pipeline.

#include "chart/chart_orchestrator.hpp"

#include "astro/house_deriver.hpp"
#include "astro/position_normalizer.hpp"
#include "astro/time_system.hpp"
#include "chart/input_validator.hpp"
#include "chart/output_validator.hpp"
#include "core/logger.hpp"

#include <string>

namespace astrochart::chart
{

ChartOrchestrator::ChartOrchestrator(const ephemeris::EphemerisProvider& provider)
    : m_provider(provider)
{
}

ChartOutput ChartOrchestrator::compute(const ChartInput& input) const
{
    const ValidatedInput validated = InputValidator::validate(input);

    const f64 jd_ut = astro::TimeSystem::to_julian_day(validated.timestamp);
    ACH_CORE_DEBUG("ChartOrchestrator: {} -> JD {:.6f} at ({}, {})",
                   input.datetime_utc, jd_ut, validated.latitude, validated.longitude);

    const astro::BodyTable bodies = compute_bodies(jd_ut);
    const astro::AngleTable angles = compute_angles(jd_ut, validated);

    // Whole Sign houses start only once the Ascendant has resolved
    const astro::HouseTable houses =
        astro::HouseDeriver::derive(astro::position_of(angles, astro::Angle::Ascendant));

    OutputValidator::validate(bodies, angles, houses);

    ChartOutput output{
        .bodies   = bodies,
        .angles   = angles,
        .houses   = houses,
        .metadata = make_metadata(jd_ut),
    };

    ACH_CORE_DEBUG("ChartOrchestrator: Chart complete, Sun in {}, Ascendant in {} ({})",
                   astro::sign_name(output.body(astro::Body::Sun).sign),
                   astro::sign_name(output.angle(astro::Angle::Ascendant).sign),
                   ephemeris::precision_mode_name(output.metadata.precision_mode));

    return output;
}

// -----------------------------------------------------------------
// Bodies, one at a time in kTrackedBodies order
// -----------------------------------------------------------------

astro::BodyTable ChartOrchestrator::compute_bodies(f64 jd_ut) const
{
    astro::BodyTable bodies{};
    for (const astro::Body body : astro::kTrackedBodies)
    {
        const ephemeris::RawBodyReading raw = m_provider.body_position(jd_ut, body);
        bodies[static_cast<std::size_t>(body)] = astro::PositionNormalizer::normalize_body(
            raw.longitude_deg, raw.speed_deg_per_day, astro::body_name(body));
    }
    return bodies;
}

// -----------------------------------------------------------------
// Angles: same reduction and finiteness checks as bodies
// -----------------------------------------------------------------

astro::AngleTable ChartOrchestrator::compute_angles(f64 jd_ut, const ValidatedInput& input) const
{
    const ephemeris::RawAngles raw =
        m_provider.houses_and_angles(jd_ut, input.latitude, input.longitude);

    astro::AngleTable angles{};
    angles[static_cast<std::size_t>(astro::Angle::Ascendant)] =
        astro::PositionNormalizer::normalize_angle(
            raw.ascendant_deg, astro::angle_name(astro::Angle::Ascendant));
    angles[static_cast<std::size_t>(astro::Angle::Midheaven)] =
        astro::PositionNormalizer::normalize_angle(
            raw.midheaven_deg, astro::angle_name(astro::Angle::Midheaven));
    return angles;
}

ChartMetadata ChartOrchestrator::make_metadata(f64 jd_ut) const
{
    const ephemeris::PrecisionMode mode = m_provider.precision_mode();

    return ChartMetadata{
        .ephemeris          = std::string(m_provider.engine_name()),
        .calculation_method = std::string(m_provider.calculation_method()),
        .julian_day         = astro::PositionNormalizer::round_output(jd_ut),
        .precision          = std::string(ephemeris::precision_label(mode)),
        .precision_mode     = mode,
    };
}

} // namespace astrochart::chart
