#pragma once

#include <cstdint>

namespace astrochart
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u8  = uint8_t;
    using u16 = uint16_t;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // Astronomical constants
    namespace astro_constants
    {
        constexpr f64 kFullCircleDeg = 360.0;
        constexpr f64 kSignWidthDeg  = 30.0;
        constexpr f64 kArcSecDeg     = 1.0 / 3600.0;

        /// Output rounding for longitudes and degrees (6 decimals, sub-arcsecond)
        constexpr f64 kOutputScale   = 1.0e6;
    }
}
