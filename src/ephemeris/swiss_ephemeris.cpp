/// @file swiss_ephemeris.cpp
/// @brief Swiss Ephemeris provider implementation.

#include "ephemeris/swiss_ephemeris.hpp"

#include "core/errors.hpp"
#include "core/logger.hpp"

extern "C" {
#include <swephexp.h>
}

#include <spdlog/fmt/fmt.h>

#include <array>
#include <mutex>
#include <string_view>
#include <system_error>

namespace astrochart::ephemeris
{

namespace
{

// -----------------------------------------------------------------
// Process-wide library state
// -----------------------------------------------------------------
std::mutex g_swe_mutex;
std::string g_active_path;      ///< Path last handed to swe_set_ephe_path

constexpr const char* kDataFileExtension = ".se1";

// Planet (sepl*) and moon (semo*) files; asteroid files (seas*) alone cannot serve a chart
constexpr std::array<std::string_view, 2> kChartFilePrefixes = {"sepl", "semo"};

constexpr int kWholeSignHouses = 'W';

int to_swe_body(astro::Body body)
{
    switch (body)
    {
        case astro::Body::Sun:      return SE_SUN;
        case astro::Body::Moon:     return SE_MOON;
        case astro::Body::Mercury:  return SE_MERCURY;
        case astro::Body::Venus:    return SE_VENUS;
        case astro::Body::Mars:     return SE_MARS;
        case astro::Body::Jupiter:  return SE_JUPITER;
        case astro::Body::Saturn:   return SE_SATURN;
        case astro::Body::Uranus:   return SE_URANUS;
        case astro::Body::Neptune:  return SE_NEPTUNE;
        case astro::Body::Pluto:    return SE_PLUTO;
        case astro::Body::TrueNode: return SE_TRUE_NODE;
    }
    throw core::CalculationError(fmt::format(
        "no Swiss Ephemeris id for body {}", static_cast<int>(body)));
}

// -----------------------------------------------------------------
// Count planet and moon *.se1 files; a missing or unreadable directory
// counts as none
// -----------------------------------------------------------------
bool is_chart_data_file(const std::filesystem::path& file)
{
    if (file.extension() != kDataFileExtension)
    {
        return false;
    }

    const std::string stem = file.stem().string();
    for (const std::string_view prefix : kChartFilePrefixes)
    {
        if (stem.starts_with(prefix))
        {
            return true;
        }
    }
    return false;
}

std::size_t count_data_files(const std::filesystem::path& dir)
{
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec))
    {
        return 0;
    }

    std::size_t count = 0;
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
    {
        if (it->is_regular_file(ec) && is_chart_data_file(it->path()))
        {
            ++count;
        }
    }

    if (ec)
    {
        ACH_CORE_WARN("SwissEphemeris: Error scanning {}: {}", dir.string(), ec.message());
    }
    return count;
}

} // namespace

// -----------------------------------------------------------------
// Construction: fix the data path, decide the precision mode once
// -----------------------------------------------------------------

SwissEphemeris::SwissEphemeris(const core::EphemerisConfig& config)
{
    std::error_code ec;
    m_data_path = std::filesystem::absolute(config.data_path, ec);
    if (ec)
    {
        m_data_path = config.data_path;
    }
    m_data_path_string = m_data_path.string();

    m_data_file_count = count_data_files(m_data_path);
    m_mode = (m_data_file_count > 0) ? PrecisionMode::High : PrecisionMode::Reduced;

    {
        std::lock_guard lock(g_swe_mutex);
        activate();
    }

    if (m_mode == PrecisionMode::High)
    {
        ACH_CORE_INFO("SwissEphemeris: Initialized with {} data files from {}",
                      m_data_file_count, m_data_path_string);
    }
    else
    {
        ACH_CORE_WARN("SwissEphemeris: No planetary {} files found in {}. Using Moshier ephemeris "
                      "(reduced precision, {})",
                      kDataFileExtension, m_data_path_string, precision_label(m_mode));
    }
}

SwissEphemeris::~SwissEphemeris()
{
    std::lock_guard lock(g_swe_mutex);
    swe_close();
    // swe_close forgets the path; the next caller must set it again
    g_active_path.clear();
}

// -----------------------------------------------------------------
// Body position: longitude + daily speed
// -----------------------------------------------------------------

RawBodyReading SwissEphemeris::body_position(f64 jd_ut, astro::Body body) const
{
    const std::string_view name = astro::body_name(body);
    const int swe_body = to_swe_body(body);

    std::array<double, 6> xx{};
    std::array<char, AS_MAXCH> serr{};
    int returned_flags = 0;

    {
        std::lock_guard lock(g_swe_mutex);
        activate();
        returned_flags = swe_calc_ut(jd_ut, swe_body, ephemeris_flag() | SEFLG_SPEED,
                                     xx.data(), serr.data());
    }

    if (returned_flags < 0)
    {
        throw core::CalculationError(fmt::format(
            "failed to calculate position for {}: {}", name, serr.data()));
    }

    if (m_mode == PrecisionMode::High && (returned_flags & SEFLG_SWIEPH) == 0)
    {
        throw core::CalculationError(fmt::format(
            "ephemeris data files in {} do not cover JD {:.6f} for {}; "
            "refusing a reduced-precision result in high-precision mode: {}",
            m_data_path_string, jd_ut, name, serr.data()));
    }

    if (serr[0] != '\0')
    {
        ACH_CORE_WARN("SwissEphemeris: {} at JD {:.6f}: {}", name, jd_ut, serr.data());
    }

    ACH_CORE_TRACE("SwissEphemeris: {} lon={:.6f} speed={:.6f}", name, xx[0], xx[3]);

    return RawBodyReading{
        .longitude_deg     = xx[0],
        .speed_deg_per_day = xx[3],
    };
}

// -----------------------------------------------------------------
// Houses: only the angles are needed, cusps are implied by Whole Sign
// -----------------------------------------------------------------

RawAngles SwissEphemeris::houses_and_angles(f64 jd_ut, f64 latitude_deg, f64 longitude_deg) const
{
    std::array<double, 13> cusps{};
    std::array<double, 10> ascmc{};
    int result = ERR;

    {
        std::lock_guard lock(g_swe_mutex);
        activate();
        result = swe_houses_ex(jd_ut, ephemeris_flag(), latitude_deg, longitude_deg,
                               kWholeSignHouses, cusps.data(), ascmc.data());
    }

    if (result == ERR)
    {
        throw core::CalculationError(fmt::format(
            "failed to calculate houses at JD {:.6f}, lat {}, lon {}",
            jd_ut, latitude_deg, longitude_deg));
    }

    ACH_CORE_TRACE("SwissEphemeris: ASC={:.6f} MC={:.6f}", ascmc[SE_ASC], ascmc[SE_MC]);

    return RawAngles{
        .ascendant_deg = ascmc[SE_ASC],
        .midheaven_deg = ascmc[SE_MC],
    };
}

std::string SwissEphemeris::library_version()
{
    std::array<char, AS_MAXCH> buffer{};
    std::lock_guard lock(g_swe_mutex);
    swe_version(buffer.data());
    return std::string(buffer.data());
}

void SwissEphemeris::activate() const
{
    if (g_active_path != m_data_path_string)
    {
        swe_set_ephe_path(m_data_path_string.c_str());
        g_active_path = m_data_path_string;
    }
}

int SwissEphemeris::ephemeris_flag() const noexcept
{
    return (m_mode == PrecisionMode::High) ? SEFLG_SWIEPH : SEFLG_MOSEPH;
}

} // namespace astrochart::ephemeris
