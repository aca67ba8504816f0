#pragma once

/// @file matcher.hpp
/// @brief Positional cross-identification of two sky catalogs.

#include "match/match_types.hpp"

#include <span>

namespace skymatch::match
{
    /// @brief Outcome of a two-pass, offset-corrected match.
    struct OffsetCorrectedResult
    {
        MatchResult result;             ///< Second-pass matches (against shifted catalog B)
        f64 ra_offset_deg = 0.0;        ///< Median RA(A) - RA(B), wrapped to (-180, 180]
        f64 dec_offset_deg = 0.0;       ///< Median Dec(A) - Dec(B)
        f64 reference_dec_deg = 0.0;    ///< Median declination of catalog A
        usize first_pass_matches = 0;   ///< Number of pairs the offset was measured from

        /// @brief RA offset projected on the sky (arcsec), scaled by cos(reference_dec).
        [[nodiscard]] f64 ra_offset_arcsec() const;

        /// @brief Dec offset in arcsec.
        [[nodiscard]] f64 dec_offset_arcsec() const;
    };

    /// @brief Stateless cross-matcher.
    ///
    /// For every pair of sources (one from each catalog) the great-circle
    /// separation is computed with the haversine formula; pairs farther apart
    /// than the search radius are discarded (a pair exactly at the radius is
    /// kept) and the survivors are resolved according to MatchPolicy:
    ///
    /// - GreedyNearest: each A source keeps its nearest B source, ties going to
    ///   the smallest B index. A B source may be matched by several A sources.
    /// - MutualNearest: nearest neighbours are computed A->B and B->A (ties to
    ///   the smallest index on each side); (i, j) is kept only when both agree.
    /// - UniqueNearest: greedy A->B, then a B source claimed several times keeps
    ///   only its nearest claimant (ties to the smallest A index).
    ///
    /// Results are sorted by index_a, then index_b. Calls hold no state, do
    /// not modify their inputs, and are deterministic; the optional index and
    /// worker threads never change the result.
    class Matcher
    {
    public:
        Matcher() = delete;

        /// @brief Cross-match catalog A against catalog B.
        /// @param catalog_a Positions (degrees). Output index_a refers to this order.
        /// @param catalog_b Positions (degrees). Output index_b refers to this order.
        /// @param config Radius, policy and execution options.
        /// @return Accepted matches; empty if either catalog is empty.
        /// @throws MatchError (InvalidParameter) for a non-positive or non-finite radius,
        ///         non-finite coordinates, Dec outside [-90, 90], or RA outside [0, 360)
        ///         without config.normalize_ra.
        [[nodiscard]] static MatchResult match(std::span<const SkyPosition> catalog_a,
                                               std::span<const SkyPosition> catalog_b,
                                               const MatchConfig& config);

        /// @brief Convenience overload with default execution options.
        [[nodiscard]] static MatchResult match(std::span<const SkyPosition> catalog_a,
                                               std::span<const SkyPosition> catalog_b,
                                               f64 radius_arcsec,
                                               MatchPolicy policy);

        /// @brief Two-pass match that removes a systematic offset between the catalogs.
        ///
        /// The first pass matches with `config`; the median coordinate difference of
        /// its pairs is added to every position of a private copy of catalog B
        /// (RA wrapped, Dec clamped to the poles), and the second pass matches A
        /// against the shifted copy. Reported separations are those of the second pass.
        ///
        /// @throws MatchError under the same conditions as match().
        [[nodiscard]] static OffsetCorrectedResult match_offset_corrected(
            std::span<const SkyPosition> catalog_a,
            std::span<const SkyPosition> catalog_b,
            const MatchConfig& config);

        /// @brief Haversine separation between two positions (arcsec).
        [[nodiscard]] static f64 angular_separation_arcsec(const SkyPosition& a,
                                                           const SkyPosition& b);
    };

} // namespace skymatch::match
