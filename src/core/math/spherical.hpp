#pragma once
// core/math/spherical.hpp - Great-circle geometry on the celestial sphere
// All public inputs are in degrees; separations are returned in arcseconds.

#include "core/types.hpp"

#include <algorithm>
#include <cmath>

namespace skymatch {

// -----------------------------------------------------------------------
// Angle helpers
// -----------------------------------------------------------------------

/// Normalise an angle to [0, 360)
inline f64 normDeg(f64 deg) {
    deg = std::fmod(deg, 360.0);
    if (deg < 0.0) deg += 360.0;
    // fmod of a tiny negative value can round up to exactly 360
    return (deg >= 360.0) ? 0.0 : deg;
}

/// Wrap an angular difference to (-180, 180]
inline f64 wrapDeltaDeg(f64 delta) {
    delta = std::fmod(delta, 360.0);
    if (delta > 180.0)   delta -= 360.0;
    if (delta <= -180.0) delta += 360.0;
    return delta;
}

// -----------------------------------------------------------------------
// Separation
// -----------------------------------------------------------------------

/// Great-circle separation [arcsec] between (ra1, dec1) and (ra2, dec2) [degrees].
///
/// Haversine form, accurate down to sub-milliarcsecond separations.
inline f64 haversineArcsec(f64 ra1_deg, f64 dec1_deg, f64 ra2_deg, f64 dec2_deg) {
    using namespace astro_constants;

    const f64 dec1 = dec1_deg * kDegToRad;
    const f64 dec2 = dec2_deg * kDegToRad;
    const f64 half_dra  = 0.5 * (ra2_deg - ra1_deg) * kDegToRad;
    const f64 half_ddec = 0.5 * (dec2 - dec1);

    const f64 s_ddec = std::sin(half_ddec);
    const f64 s_dra  = std::sin(half_dra);
    const f64 h = s_ddec * s_ddec + std::cos(dec1) * std::cos(dec2) * s_dra * s_dra;

    return 2.0 * std::asin(std::sqrt(std::clamp(h, 0.0, 1.0))) * kRadToArcSec;
}

// -----------------------------------------------------------------------
// Cartesian embedding
// -----------------------------------------------------------------------

/// Unit vector on the celestial sphere for (ra, dec) [degrees].
inline Vec3d unitVector(f64 ra_deg, f64 dec_deg) {
    using namespace astro_constants;

    const f64 ra  = ra_deg  * kDegToRad;
    const f64 dec = dec_deg * kDegToRad;
    const f64 cos_dec = std::cos(dec);
    return Vec3d{cos_dec * std::cos(ra), cos_dec * std::sin(ra), std::sin(dec)};
}

/// Lower bound on dot(u, v) for any pair of unit vectors within radius_arcsec.
///
/// Taken at twice the radius and lowered by 1e-12, well beyond the rounding
/// error of the dot product.
inline f64 dotPrescreenLimit(f64 radius_arcsec) {
    using namespace astro_constants;

    const f64 angle = std::min(kPi, 2.0 * radius_arcsec * kArcSecToRad);
    return std::cos(angle) - 1e-12;
}

} // namespace skymatch
