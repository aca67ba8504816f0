// match/declination_index.cpp
#include "declination_index.hpp"

#include <algorithm>
#include <cmath>

namespace skymatch::match {

// -----------------------------------------------------------------------
// construction
// -----------------------------------------------------------------------
DeclinationIndex::DeclinationIndex(std::span<const SkyPosition> catalog,
                                   f64 band_width_deg)
    : m_band_width_deg(std::max(band_width_deg, kMinBandWidthDeg)) {
    for (usize i = 0; i < catalog.size(); ++i) {
        m_bands[bandFor(catalog[i].dec_deg)].push_back(i);
    }
}

// -----------------------------------------------------------------------
// bandFor
// -----------------------------------------------------------------------
i64 DeclinationIndex::bandFor(f64 dec_deg) const {
    return static_cast<i64>(std::floor((dec_deg + 90.0) / m_band_width_deg));
}

} // namespace skymatch::match
