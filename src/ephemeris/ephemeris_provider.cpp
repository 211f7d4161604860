/// @file ephemeris_provider.cpp
/// @brief Precision mode names and labels.

#include "ephemeris/ephemeris_provider.hpp"

namespace astrochart::ephemeris
{

std::string_view precision_mode_name(PrecisionMode mode)
{
    switch (mode)
    {
        case PrecisionMode::High:    return "high-precision";
        case PrecisionMode::Reduced: return "reduced-precision";
    }
    return "unknown";
}

// Reduced mode (Moshier) is held to 2 arcseconds for 1800-2400 AD
std::string_view precision_label(PrecisionMode mode)
{
    switch (mode)
    {
        case PrecisionMode::High:    return "arcsecond";
        case PrecisionMode::Reduced: return "2 arcseconds";
    }
    return "unknown";
}

} // namespace astrochart::ephemeris
