// src/main.cpp - SkyMatch demo
//
// Demonstrates the cross-matcher on a synthetic field:
//  1. Generate a reference catalog (A)
//  2. Derive a second epoch (B): jittered, shifted, with drop-outs and spurious entries
//  3. Match under every policy
//  4. Run the offset-corrected two-pass match

#include "core/logger.hpp"
#include "match/match_types.hpp"
#include "match/matcher.hpp"

#include <exception>
#include <random>

using namespace skymatch;
using namespace skymatch::match;

namespace {

constexpr u64 kSeed = 0x5EED5EEDULL;
constexpr usize kSourceCount = 20000;
constexpr f64 kFieldRa = 83.8;
constexpr f64 kFieldDec = -5.4;
constexpr f64 kFieldSizeDeg = 2.0;

Catalog makeReference(std::mt19937_64& rng) {
    std::uniform_real_distribution<f64> ra(kFieldRa - kFieldSizeDeg / 2, kFieldRa + kFieldSizeDeg / 2);
    std::uniform_real_distribution<f64> dec(kFieldDec - kFieldSizeDeg / 2, kFieldDec + kFieldSizeDeg / 2);

    Catalog cat;
    cat.reserve(kSourceCount);
    for (usize i = 0; i < kSourceCount; ++i) cat.push_back({ra(rng), dec(rng)});
    return cat;
}

// Second epoch: 0.15" jitter, a 0.8" / -0.5" systematic shift, 5% drop-outs
// and 5% spurious detections.
Catalog makeSecondEpoch(const Catalog& reference, std::mt19937_64& rng) {
    constexpr f64 kJitterArcsec = 0.15;
    constexpr f64 kShiftRaArcsec = 0.8;
    constexpr f64 kShiftDecArcsec = -0.5;

    std::normal_distribution<f64> jitter(0.0, kJitterArcsec / 3600.0);
    std::uniform_real_distribution<f64> unit(0.0, 1.0);

    Catalog cat;
    cat.reserve(reference.size());
    for (const auto& p : reference) {
        if (unit(rng) < 0.05) continue;
        cat.push_back({p.ra_deg + kShiftRaArcsec / 3600.0 + jitter(rng),
                       p.dec_deg + kShiftDecArcsec / 3600.0 + jitter(rng)});
    }

    std::uniform_real_distribution<f64> ra(kFieldRa - kFieldSizeDeg / 2, kFieldRa + kFieldSizeDeg / 2);
    std::uniform_real_distribution<f64> dec(kFieldDec - kFieldSizeDeg / 2, kFieldDec + kFieldSizeDeg / 2);
    for (usize i = 0; i < reference.size() / 20; ++i) cat.push_back({ra(rng), dec(rng)});
    return cat;
}

} // namespace

int main() {
    core::Logger::init({.log_file = "skymatch.log"});

    SKM_INFO("SkyMatch demo: synthetic field at RA={} Dec={}", kFieldRa, kFieldDec);

    std::mt19937_64 rng(kSeed);
    const Catalog a = makeReference(rng);
    const Catalog b = makeSecondEpoch(a, rng);
    SKM_INFO("Catalog A: {} sources, catalog B: {} sources", a.size(), b.size());

    int status = 0;
    try {
        // -------------------------------------------------------------------
        // Single-pass matches under each policy
        // -------------------------------------------------------------------
        for (MatchPolicy policy : {MatchPolicy::GreedyNearest,
                                   MatchPolicy::UniqueNearest,
                                   MatchPolicy::MutualNearest}) {
            const MatchResult result = Matcher::match(a, b, {
                .radius_arcsec  = 1.5,
                .policy         = policy,
                .worker_threads = 0,
                .verbose        = true,
            });

            f64 mean_sep = 0.0;
            for (const auto& p : result) mean_sep += p.separation_arcsec;
            if (!result.empty()) mean_sep /= static_cast<f64>(result.size());
            SKM_INFO("  {:<15} {:>6} pairs, mean separation {:.3f}\"",
                     policy_name(policy), result.size(), mean_sep);
        }

        // -------------------------------------------------------------------
        // Offset-corrected two-pass match
        // -------------------------------------------------------------------
        const OffsetCorrectedResult corrected = Matcher::match_offset_corrected(a, b, {
            .radius_arcsec  = 1.5,
            .policy         = MatchPolicy::UniqueNearest,
            .worker_threads = 0,
            .verbose        = true,
        });
        SKM_INFO("Offset-corrected: {} -> {} pairs, offset RA {:.3f}\" Dec {:.3f}\"",
                 corrected.first_pass_matches, corrected.result.size(),
                 corrected.ra_offset_arcsec(), corrected.dec_offset_arcsec());
    } catch (const MatchError& e) {
        SKM_ERROR("Match failed: {}", e.what());
        status = 1;
    } catch (const std::exception& e) {
        SKM_ERROR("Unexpected failure: {}", e.what());
        status = 1;
    }

    core::Logger::shutdown();
    return status;
}
