#pragma once

/// @file swiss_ephemeris.hpp
/// @brief EphemerisProvider backed by the Swiss Ephemeris C library.

#include "core/config.hpp"
#include "ephemeris/ephemeris_provider.hpp"

#include <filesystem>
#include <string>

namespace astrochart::ephemeris
{
    /// @brief Swiss Ephemeris provider (libswe).
    ///
    /// The data directory is fixed at construction. Precision mode is decided once,
    /// by probing that directory for planet and moon `.se1` files (`sepl*`, `semo*`):
    /// - files present → PrecisionMode::High, every call requests SEFLG_SWIEPH and a
    ///   silent library fallback to another ephemeris is reported as an error
    /// - no files      → PrecisionMode::Reduced, every call requests SEFLG_MOSEPH
    ///
    /// libswe keeps process-global state, so every library call is serialized behind
    /// one process-wide mutex, and the instance's own data path is re-applied under
    /// that lock whenever another instance changed it.
    class SwissEphemeris final : public EphemerisProvider
    {
    public:
        /// @brief Configure the library data path and decide the precision mode.
        explicit SwissEphemeris(const core::EphemerisConfig& config);

        /// @brief Release library file handles.
        ~SwissEphemeris() override;

        SwissEphemeris(const SwissEphemeris&) = delete;
        SwissEphemeris& operator=(const SwissEphemeris&) = delete;
        SwissEphemeris(SwissEphemeris&&) = delete;
        SwissEphemeris& operator=(SwissEphemeris&&) = delete;

        [[nodiscard]] RawBodyReading body_position(f64 jd_ut, astro::Body body) const override;

        [[nodiscard]] RawAngles houses_and_angles(
            f64 jd_ut,
            f64 latitude_deg,
            f64 longitude_deg
        ) const override;

        [[nodiscard]] PrecisionMode precision_mode() const noexcept override { return m_mode; }

        [[nodiscard]] std::string_view engine_name() const noexcept override
        {
            return "Swiss Ephemeris";
        }

        [[nodiscard]] std::string_view calculation_method() const noexcept override
        {
            return "libswe";
        }

        /// @brief Absolute data directory handed to the library.
        [[nodiscard]] const std::filesystem::path& data_path() const noexcept { return m_data_path; }

        /// @brief Number of planet and moon `.se1` files found at construction.
        [[nodiscard]] std::size_t data_file_count() const noexcept { return m_data_file_count; }

        /// @brief Library version string, e.g. "2.10.03".
        [[nodiscard]] static std::string library_version();

    private:
        /// @brief Point the library at this instance's data path. Caller holds the lock.
        void activate() const;

        /// @brief SEFLG_SWIEPH or SEFLG_MOSEPH according to the mode.
        [[nodiscard]] int ephemeris_flag() const noexcept;

        std::filesystem::path m_data_path;
        std::string m_data_path_string;     ///< Kept alive for the C API
        std::size_t m_data_file_count = 0;
        PrecisionMode m_mode = PrecisionMode::Reduced;
    };

} // namespace astrochart::ephemeris
