/// @file test_offset_correction.cpp
/// @brief Unit tests for Matcher::match_offset_corrected.
///
/// An injected systematic shift between two epochs must be measured from the
/// first pass and removed before the second.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "core/logger.hpp"
#include "core/types.hpp"
#include "match/match_types.hpp"
#include "match/matcher.hpp"

#include <cmath>
#include <random>

using namespace skymatch;
using namespace skymatch::match;

// =================================================================
// Custom main: initialize logger before tests
// =================================================================

int main(int argc, char** argv)
{
    skymatch::core::Logger::init({.level = spdlog::level::warn});
    const int result = doctest::Context(argc, argv).run();
    skymatch::core::Logger::shutdown();
    return result;
}

// =================================================================
// Fixture: sparse field at dec = +30 and a shifted, jittered second epoch
// =================================================================

static constexpr f64 kFieldDec = 30.0;
static constexpr f64 kShiftRaArcsec = 3.0;     // on the sky
static constexpr f64 kShiftDecArcsec = 2.0;
static constexpr f64 kJitterArcsec = 0.05;

static Catalog make_field()
{
    std::mt19937_64 rng(42);
    std::uniform_real_distribution<f64> ra(40.0, 40.2);
    std::uniform_real_distribution<f64> dec(kFieldDec - 0.1, kFieldDec + 0.1);

    Catalog cat;
    for (int i = 0; i < 300; ++i)
    {
        cat.push_back({ra(rng), dec(rng)});
    }
    return cat;
}

static Catalog shift(const Catalog& cat)
{
    std::mt19937_64 rng(43);
    std::normal_distribution<f64> noise(0.0, kJitterArcsec / 3600.0);

    const f64 d_ra = kShiftRaArcsec / 3600.0 / std::cos(kFieldDec * astro_constants::kDegToRad);
    const f64 d_dec = kShiftDecArcsec / 3600.0;

    Catalog out;
    for (const auto& p : cat)
    {
        out.push_back({p.ra_deg + d_ra + noise(rng), p.dec_deg + d_dec + noise(rng)});
    }
    return out;
}

// =================================================================
// Tests
// =================================================================

TEST_CASE("Offset correction measures and removes a systematic shift")
{
    const Catalog a = make_field();
    const Catalog b = shift(a);

    const OffsetCorrectedResult out = Matcher::match_offset_corrected(a, b, {
        .radius_arcsec = 5.0,
        .policy        = MatchPolicy::UniqueNearest,
    });

    CHECK(out.first_pass_matches > a.size() / 2);

    // Offsets are A - B, so opposite to the injected shift
    CHECK(out.ra_offset_arcsec() == doctest::Approx(-kShiftRaArcsec).epsilon(0.02));
    CHECK(out.dec_offset_arcsec() == doctest::Approx(-kShiftDecArcsec).epsilon(0.02));
    CHECK(out.reference_dec_deg == doctest::Approx(kFieldDec).epsilon(0.01));

    // After correction only the jitter remains
    CHECK(out.result.size() >= out.first_pass_matches);
    for (const auto& p : out.result)
    {
        CHECK(p.separation_arcsec < 0.5);
        CHECK(p.index_a == p.index_b);
    }
}

TEST_CASE("Offset correction leaves the caller's catalog B untouched")
{
    const Catalog a = make_field();
    const Catalog b = shift(a);
    const Catalog b_before = b;

    (void)Matcher::match_offset_corrected(a, b, {.radius_arcsec = 5.0});

    REQUIRE(b.size() == b_before.size());
    for (usize i = 0; i < b.size(); ++i)
    {
        CHECK(b[i].ra_deg == b_before[i].ra_deg);
        CHECK(b[i].dec_deg == b_before[i].dec_deg);
    }
}

TEST_CASE("Aligned catalogs give a near-zero offset and the plain result")
{
    const Catalog a = {{10.0, 10.0}, {10.1, 10.1}, {10.2, 10.2}};

    const OffsetCorrectedResult out = Matcher::match_offset_corrected(a, a, {.radius_arcsec = 1.0});

    CHECK(out.first_pass_matches == 3);
    CHECK(out.ra_offset_deg == 0.0);
    CHECK(out.dec_offset_deg == 0.0);
    CHECK(out.result == Matcher::match(a, a, {.radius_arcsec = 1.0}));
}

TEST_CASE("No first-pass pairs means no correction")
{
    const Catalog a = {{10.0, 10.0}};
    const Catalog b = {{20.0, 10.0}};

    const OffsetCorrectedResult out = Matcher::match_offset_corrected(a, b, {.radius_arcsec = 1.0});

    CHECK(out.first_pass_matches == 0);
    CHECK(out.result.empty());
    CHECK(out.ra_offset_deg == 0.0);
    CHECK(out.dec_offset_deg == 0.0);
}

TEST_CASE("Offset across RA = 0 is measured the short way round")
{
    // B sits 0.5" east of A across the RA origin
    const f64 d = 0.5 / 3600.0;
    const Catalog a = {{359.9999, 0.0}, {0.0001, 0.5}};
    const Catalog b = {{0.0001 - 0.0002 + d, 0.0}, {0.0001 + d, 0.5}};

    const OffsetCorrectedResult out = Matcher::match_offset_corrected(a, b, {
        .radius_arcsec = 2.0,
        .normalize_ra  = true,
    });

    CHECK(out.first_pass_matches == 2);
    CHECK(out.ra_offset_deg == doctest::Approx(-d).epsilon(1e-6));
    REQUIRE(out.result.size() == 2);
    for (const auto& p : out.result)
    {
        CHECK(p.separation_arcsec < 1e-3);
    }
}

TEST_CASE("Even number of pairs uses the mean of the two middle offsets")
{
    // Dec offsets (A - B) of -1" and -3": median -2"
    const Catalog a = {{10.0, 0.0}, {10.0, 0.1}};
    const Catalog b = {{10.0, 1.0 / 3600.0}, {10.0, 0.1 + 3.0 / 3600.0}};

    const OffsetCorrectedResult out = Matcher::match_offset_corrected(a, b, {.radius_arcsec = 5.0});

    REQUIRE(out.first_pass_matches == 2);
    CHECK(out.dec_offset_arcsec() == doctest::Approx(-2.0).epsilon(1e-6));
}

TEST_CASE("Offset correction validates its inputs")
{
    const Catalog a = {{10.0, 10.0}};
    const Catalog bad = {{10.0, 100.0}};

    CHECK_THROWS_AS((void)Matcher::match_offset_corrected(a, a, {.radius_arcsec = -1.0}), MatchError);
    CHECK_THROWS_AS((void)Matcher::match_offset_corrected(a, bad, {.radius_arcsec = 1.0}), MatchError);
}
