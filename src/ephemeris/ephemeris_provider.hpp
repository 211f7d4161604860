#pragma once

/// @file ephemeris_provider.hpp
/// @brief Abstract source of raw body positions and chart angles.

#include "astro/celestial_body.hpp"
#include "core/types.hpp"

#include <string_view>

namespace astrochart::ephemeris
{
    /// @brief Raw (un-normalized) body reading.
    struct RawBodyReading
    {
        f64 longitude_deg;          ///< Ecliptic longitude, any real value
        f64 speed_deg_per_day;      ///< Daily motion in longitude (negative = retrograde)
    };

    /// @brief Raw Ascendant and Midheaven for a time and place.
    struct RawAngles
    {
        f64 ascendant_deg;
        f64 midheaven_deg;
    };

    /// @brief Provider precision mode, fixed when the provider is constructed.
    enum class PrecisionMode
    {
        High,       ///< Full ephemeris data files
        Reduced,    ///< Analytical fallback, no data files
    };

    /// @brief "high-precision" / "reduced-precision".
    [[nodiscard]] std::string_view precision_mode_name(PrecisionMode mode);

    /// @brief Accuracy label carried in chart metadata for a mode.
    [[nodiscard]] std::string_view precision_label(PrecisionMode mode);

    /// @brief Capability interface over an external ephemeris engine.
    ///
    /// Implementations are constructed once per process (or per test) and injected
    /// by reference into ChartOrchestrator. All methods must be safe to call
    /// concurrently.
    class EphemerisProvider
    {
    public:
        virtual ~EphemerisProvider() = default;

        /// @brief Tropical geocentric longitude and speed of @p body at @p jd_ut.
        /// @throws core::CalculationError naming the body on failure.
        [[nodiscard]] virtual RawBodyReading body_position(f64 jd_ut, astro::Body body) const = 0;

        /// @brief Ascendant and Midheaven under the Whole-Sign house system.
        /// @param latitude_deg Geographic latitude (north positive).
        /// @param longitude_deg Geographic longitude (east positive).
        /// @throws core::CalculationError on failure.
        [[nodiscard]] virtual RawAngles houses_and_angles(
            f64 jd_ut,
            f64 latitude_deg,
            f64 longitude_deg
        ) const = 0;

        /// @brief Mode decided at construction; never changes afterwards.
        [[nodiscard]] virtual PrecisionMode precision_mode() const noexcept = 0;

        /// @brief Engine name recorded in metadata (e.g. "Swiss Ephemeris").
        [[nodiscard]] virtual std::string_view engine_name() const noexcept = 0;

        /// @brief Calculation method recorded in metadata (e.g. "libswe").
        [[nodiscard]] virtual std::string_view calculation_method() const noexcept = 0;
    };

} // namespace astrochart::ephemeris
