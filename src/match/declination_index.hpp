#pragma once
// match/declination_index.hpp - Declination-band bucketing of a catalog
//
// Sources are grouped into bands of fixed declination width. Any source
// within `band_width_deg` of a query position lies in the query's band or
// in one of its two neighbours, because the declination difference of two
// points never exceeds their great-circle separation. Only declination is
// bucketed, so there is no RA wrap-around or polar special case.

#include "match/match_types.hpp"

#include <span>
#include <unordered_map>
#include <vector>

namespace skymatch::match {

class DeclinationIndex {
public:
    /// Bucket `catalog` into bands of at least `band_width_deg` degrees.
    DeclinationIndex(std::span<const SkyPosition> catalog, f64 band_width_deg);

    /// Invoke `visit(index)` for every source in the band of `dec_deg` and
    /// its two neighbours. Order of visits is unspecified.
    template <typename Visitor>
    void forEachCandidate(f64 dec_deg, Visitor&& visit) const {
        const i64 band = bandFor(dec_deg);
        for (i64 b = band - 1; b <= band + 1; ++b) {
            auto it = m_bands.find(b);
            if (it == m_bands.end()) continue;
            for (usize idx : it->second) visit(idx);
        }
    }

    f64 bandWidth() const { return m_band_width_deg; }
    usize bandCount() const { return m_bands.size(); }

private:
    // Narrowest band allowed; keeps the band count bounded for tiny radii.
    static constexpr f64 kMinBandWidthDeg = 1.0 / 3600.0;

    f64 m_band_width_deg;
    std::unordered_map<i64, std::vector<usize>> m_bands;

    i64 bandFor(f64 dec_deg) const;
};

} // namespace skymatch::match
