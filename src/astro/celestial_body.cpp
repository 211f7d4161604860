/// @file celestial_body.cpp
/// @brief Body and angle display names.

#include "astro/celestial_body.hpp"

namespace astrochart::astro
{

std::string_view body_name(Body body)
{
    switch (body)
    {
        case Body::Sun:      return "Sun";
        case Body::Moon:     return "Moon";
        case Body::Mercury:  return "Mercury";
        case Body::Venus:    return "Venus";
        case Body::Mars:     return "Mars";
        case Body::Jupiter:  return "Jupiter";
        case Body::Saturn:   return "Saturn";
        case Body::Uranus:   return "Uranus";
        case Body::Neptune:  return "Neptune";
        case Body::Pluto:    return "Pluto";
        case Body::TrueNode: return "TrueNode";
    }
    return "Unknown";
}

std::string_view angle_name(Angle angle)
{
    switch (angle)
    {
        case Angle::Ascendant: return "Ascendant";
        case Angle::Midheaven: return "Midheaven";
    }
    return "Unknown";
}

} // namespace astrochart::astro
