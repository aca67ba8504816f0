/// @file matcher.cpp
/// @brief Cross-matcher implementation: nearest-neighbour search and policy resolution.

#include "match/matcher.hpp"

#include "core/logger.hpp"
#include "core/math/spherical.hpp"
#include "match/catalog.hpp"
#include "match/declination_index.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

namespace skymatch::match
{

namespace
{
    /// @brief Best in-radius neighbour found so far for one query source.
    struct Candidate
    {
        usize index;
        f64 separation_arcsec;
    };

    using NearestList = std::vector<std::optional<Candidate>>;

    /// Smaller separation wins; equal separations go to the smaller index.
    bool is_better(f64 separation, usize index, const std::optional<Candidate>& best)
    {
        if (!best)
        {
            return true;
        }
        if (separation != best->separation_arcsec)
        {
            return separation < best->separation_arcsec;
        }
        return index < best->index;
    }

    u32 resolve_worker_count(u32 requested, usize work_items)
    {
        u32 workers = requested;
        if (workers == 0)
        {
            workers = std::clamp(std::thread::hardware_concurrency(), 1u, kMaxWorkerThreads);
        }
        if (work_items < workers)
        {
            workers = static_cast<u32>(std::max<usize>(1, work_items));
        }
        return workers;
    }

    // -----------------------------------------------------------------
    // Nearest in-radius target for every query source.
    //
    // Each worker owns a disjoint contiguous slice of `queries` and writes
    // only the matching slice of the output, so no locking is needed.
    // -----------------------------------------------------------------

    NearestList find_nearest(std::span<const SkyPosition> queries,
                             std::span<const SkyPosition> targets,
                             const MatchConfig& config)
    {
        const f64 radius = config.radius_arcsec;
        const f64 dot_limit = dotPrescreenLimit(radius);

        std::vector<Vec3d> target_vectors;
        target_vectors.reserve(targets.size());
        for (const auto& t : targets)
        {
            target_vectors.push_back(unitVector(t.ra_deg, t.dec_deg));
        }

        // Band width padded by 0.1% so rounding at band edges cannot drop
        // a candidate lying exactly on the radius.
        std::optional<DeclinationIndex> index;
        if (config.use_index)
        {
            const f64 band_width_deg = 1.001 * radius / astro_constants::kArcSecPerDeg;
            index.emplace(targets, band_width_deg);
        }

        NearestList nearest(queries.size());

        auto process_slice = [&](usize begin, usize end)
        {
            for (usize q = begin; q < end; ++q)
            {
                const SkyPosition& query = queries[q];
                const Vec3d query_vector = unitVector(query.ra_deg, query.dec_deg);
                std::optional<Candidate>& best = nearest[q];

                auto score = [&](usize t)
                {
                    if (glm::dot(query_vector, target_vectors[t]) < dot_limit)
                    {
                        return;
                    }
                    const SkyPosition& target = targets[t];
                    const f64 separation = haversineArcsec(query.ra_deg, query.dec_deg,
                                                           target.ra_deg, target.dec_deg);
                    if (separation > radius)
                    {
                        return;
                    }
                    if (is_better(separation, t, best))
                    {
                        best = Candidate{.index = t, .separation_arcsec = separation};
                    }
                };

                if (index)
                {
                    index->forEachCandidate(query.dec_deg, score);
                }
                else
                {
                    for (usize t = 0; t < targets.size(); ++t)
                    {
                        score(t);
                    }
                }
            }
        };

        const u32 workers = resolve_worker_count(config.worker_threads, queries.size());
        if (workers <= 1)
        {
            process_slice(0, queries.size());
            return nearest;
        }

        const usize chunk = (queries.size() + workers - 1) / workers;
        std::vector<std::future<void>> tasks;
        tasks.reserve(workers);
        for (usize begin = 0; begin < queries.size(); begin += chunk)
        {
            const usize end = std::min(begin + chunk, queries.size());
            tasks.push_back(std::async(std::launch::async, process_slice, begin, end));
        }
        for (auto& task : tasks)
        {
            task.get();
        }

        return nearest;
    }

    // -----------------------------------------------------------------
    // Policy resolution
    // -----------------------------------------------------------------

    std::vector<MatchPair> resolve_greedy(const NearestList& a_to_b)
    {
        std::vector<MatchPair> pairs;
        for (usize i = 0; i < a_to_b.size(); ++i)
        {
            if (a_to_b[i])
            {
                pairs.push_back(MatchPair{
                    .index_a           = i,
                    .index_b           = a_to_b[i]->index,
                    .separation_arcsec = a_to_b[i]->separation_arcsec,
                });
            }
        }
        return pairs;
    }

    std::vector<MatchPair> resolve_mutual(const NearestList& a_to_b, const NearestList& b_to_a)
    {
        std::vector<MatchPair> pairs;
        for (usize i = 0; i < a_to_b.size(); ++i)
        {
            if (!a_to_b[i])
            {
                continue;
            }
            const usize j = a_to_b[i]->index;
            if (b_to_a[j] && b_to_a[j]->index == i)
            {
                pairs.push_back(MatchPair{
                    .index_a           = i,
                    .index_b           = j,
                    .separation_arcsec = a_to_b[i]->separation_arcsec,
                });
            }
        }
        return pairs;
    }

    std::vector<MatchPair> resolve_unique(const NearestList& a_to_b, usize size_b)
    {
        // Nearest claimant for every B source that was claimed at least once
        NearestList claimant(size_b);
        for (usize i = 0; i < a_to_b.size(); ++i)
        {
            if (!a_to_b[i])
            {
                continue;
            }
            auto& current = claimant[a_to_b[i]->index];
            if (is_better(a_to_b[i]->separation_arcsec, i, current))
            {
                current = Candidate{.index = i, .separation_arcsec = a_to_b[i]->separation_arcsec};
            }
        }

        std::vector<MatchPair> pairs;
        for (usize i = 0; i < a_to_b.size(); ++i)
        {
            if (!a_to_b[i])
            {
                continue;
            }
            const usize j = a_to_b[i]->index;
            if (claimant[j]->index == i)
            {
                pairs.push_back(MatchPair{
                    .index_a           = i,
                    .index_b           = j,
                    .separation_arcsec = a_to_b[i]->separation_arcsec,
                });
            }
        }
        return pairs;
    }

    MatchResult match_validated(std::span<const SkyPosition> catalog_a,
                                std::span<const SkyPosition> catalog_b,
                                const MatchConfig& config)
    {
        if (catalog_a.empty() || catalog_b.empty())
        {
            SKM_CORE_DEBUG("Matcher: empty input (|A|={}, |B|={}), no matches",
                           catalog_a.size(), catalog_b.size());
            return {};
        }

        const NearestList a_to_b = find_nearest(catalog_a, catalog_b, config);

        MatchResult result;
        switch (config.policy)
        {
            case MatchPolicy::GreedyNearest:
                result.pairs = resolve_greedy(a_to_b);
                break;
            case MatchPolicy::MutualNearest:
            {
                const NearestList b_to_a = find_nearest(catalog_b, catalog_a, config);
                result.pairs = resolve_mutual(a_to_b, b_to_a);
                break;
            }
            case MatchPolicy::UniqueNearest:
                result.pairs = resolve_unique(a_to_b, catalog_b.size());
                break;
        }

        std::sort(result.pairs.begin(), result.pairs.end(),
                  [](const MatchPair& lhs, const MatchPair& rhs)
                  {
                      if (lhs.index_a != rhs.index_a)
                      {
                          return lhs.index_a < rhs.index_a;
                      }
                      return lhs.index_b < rhs.index_b;
                  });

        SKM_CORE_DEBUG("Matcher: |A|={} |B|={} radius={}\" policy={} -> {} pairs",
                       catalog_a.size(), catalog_b.size(), config.radius_arcsec,
                       policy_name(config.policy), result.size());

        return result;
    }

    /// Median of a non-empty sample (mean of the two middle values for even sizes).
    f64 median(std::vector<f64> values)
    {
        const usize mid = values.size() / 2;
        std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid), values.end());
        const f64 upper = values[mid];
        if (values.size() % 2 == 1)
        {
            return upper;
        }
        const f64 lower = *std::max_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid));
        return 0.5 * (lower + upper);
    }

    void log_summary(const MatchConfig& config, const char* label, usize count)
    {
        if (config.verbose)
        {
            SKM_CORE_INFO("Matcher: {} ({}): {} sources", label, policy_name(config.policy), count);
        }
    }

} // namespace

// -----------------------------------------------------------------
// OffsetCorrectedResult
// -----------------------------------------------------------------

f64 OffsetCorrectedResult::ra_offset_arcsec() const
{
    return ra_offset_deg * astro_constants::kArcSecPerDeg *
           std::cos(reference_dec_deg * astro_constants::kDegToRad);
}

f64 OffsetCorrectedResult::dec_offset_arcsec() const
{
    return dec_offset_deg * astro_constants::kArcSecPerDeg;
}

// -----------------------------------------------------------------
// Matcher
// -----------------------------------------------------------------

MatchResult Matcher::match(std::span<const SkyPosition> catalog_a,
                           std::span<const SkyPosition> catalog_b,
                           const MatchConfig& config)
{
    validate_config(config);
    const Catalog checked_a = validate_catalog(catalog_a, "A", config.normalize_ra);
    const Catalog checked_b = validate_catalog(catalog_b, "B", config.normalize_ra);

    MatchResult result = match_validated(checked_a, checked_b, config);
    log_summary(config, "match", result.size());
    return result;
}

MatchResult Matcher::match(std::span<const SkyPosition> catalog_a,
                           std::span<const SkyPosition> catalog_b,
                           f64 radius_arcsec,
                           MatchPolicy policy)
{
    return match(catalog_a, catalog_b, MatchConfig{.radius_arcsec = radius_arcsec, .policy = policy});
}

OffsetCorrectedResult Matcher::match_offset_corrected(std::span<const SkyPosition> catalog_a,
                                                      std::span<const SkyPosition> catalog_b,
                                                      const MatchConfig& config)
{
    validate_config(config);
    const Catalog checked_a = validate_catalog(catalog_a, "A", config.normalize_ra);
    const Catalog checked_b = validate_catalog(catalog_b, "B", config.normalize_ra);

    OffsetCorrectedResult out;

    const MatchResult first = match_validated(checked_a, checked_b, config);
    out.first_pass_matches = first.size();
    log_summary(config, "first pass", first.size());

    if (first.empty())
    {
        if (!checked_a.empty() && !checked_b.empty())
        {
            SKM_CORE_WARN("Matcher: first pass found no pairs, offset correction skipped");
        }
        out.result = first;
        return out;
    }

    // -----------------------------------------------------------------
    // Systematic offset from the first-pass pairs
    // -----------------------------------------------------------------
    std::vector<f64> d_ra;
    std::vector<f64> d_dec;
    d_ra.reserve(first.size());
    d_dec.reserve(first.size());
    for (const auto& pair : first)
    {
        const SkyPosition& a = checked_a[pair.index_a];
        const SkyPosition& b = checked_b[pair.index_b];
        d_ra.push_back(wrapDeltaDeg(a.ra_deg - b.ra_deg));
        d_dec.push_back(a.dec_deg - b.dec_deg);
    }
    out.ra_offset_deg = median(std::move(d_ra));
    out.dec_offset_deg = median(std::move(d_dec));

    std::vector<f64> dec_a;
    dec_a.reserve(checked_a.size());
    for (const auto& a : checked_a)
    {
        dec_a.push_back(a.dec_deg);
    }
    out.reference_dec_deg = median(std::move(dec_a));

    if (config.verbose)
    {
        SKM_CORE_INFO("Matcher: RA offset {:.4f} arcsec, Dec offset {:.4f} arcsec",
                      out.ra_offset_arcsec(), out.dec_offset_arcsec());
    }

    // -----------------------------------------------------------------
    // Second pass against the shifted copy of B
    // -----------------------------------------------------------------
    Catalog shifted_b;
    shifted_b.reserve(checked_b.size());
    for (const auto& b : checked_b)
    {
        shifted_b.push_back(SkyPosition{
            .ra_deg  = normDeg(b.ra_deg + out.ra_offset_deg),
            .dec_deg = std::clamp(b.dec_deg + out.dec_offset_deg, -90.0, 90.0),
        });
    }

    out.result = match_validated(checked_a, shifted_b, config);
    log_summary(config, "second pass", out.result.size());

    return out;
}

f64 Matcher::angular_separation_arcsec(const SkyPosition& a, const SkyPosition& b)
{
    return haversineArcsec(a.ra_deg, a.dec_deg, b.ra_deg, b.dec_deg);
}

} // namespace skymatch::match
