#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cstddef>
#include <cstdint>

namespace skymatch
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;
    using i64 = int64_t;
    using usize = std::size_t;

    // Vector type (double precision for astrometry)
    using Vec3d = glm::dvec3;

    // Astronomical constants
    namespace astro_constants
    {
        constexpr f64 kPi           = glm::pi<f64>();
        constexpr f64 kTwoPi        = 2.0 * kPi;
        constexpr f64 kHalfPi       = kPi / 2.0;
        constexpr f64 kDegToRad     = kPi / 180.0;
        constexpr f64 kRadToDeg     = 180.0 / kPi;
        constexpr f64 kArcSecPerDeg = 3600.0;
        constexpr f64 kArcSecToRad  = kPi / (180.0 * 3600.0);
        constexpr f64 kRadToArcSec  = (180.0 * 3600.0) / kPi;
    }
}
