#pragma once

/// @file match_types.hpp
/// @brief Value types shared by the cross-matcher: positions, policies, results, errors.

#include "core/types.hpp"

#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace skymatch::match
{
    /// @brief A single catalog entry position (ICRS-like, degrees).
    struct SkyPosition
    {
        f64 ra_deg;     ///< Right ascension (degrees, 0..360)
        f64 dec_deg;    ///< Declination (degrees, -90..+90)
    };

    /// @brief Ordered list of positions. Indices into it are the catalog identity.
    using Catalog = std::vector<SkyPosition>;

    /// @brief Ambiguity resolution rule applied to in-radius candidates.
    enum class MatchPolicy
    {
        GreedyNearest,  ///< Each A source takes its nearest B source; B may be shared (many-to-one)
        MutualNearest,  ///< Keep (i, j) only if each is the other's nearest (one-to-one)
        UniqueNearest,  ///< Greedy A->B, then each claimed B keeps its nearest claimant (one-to-one)
    };

    /// @brief Human-readable policy name, for log output.
    inline const char* policy_name(MatchPolicy policy)
    {
        switch (policy)
        {
            case MatchPolicy::GreedyNearest: return "greedy-nearest";
            case MatchPolicy::MutualNearest: return "mutual-nearest";
            case MatchPolicy::UniqueNearest: return "unique-nearest";
            default:                         return "unknown";
        }
    }

    /// @brief One accepted correspondence.
    struct MatchPair
    {
        usize index_a;          ///< Offset into catalog A
        usize index_b;          ///< Offset into catalog B
        f64 separation_arcsec;  ///< Great-circle separation (arcsec)

        bool operator==(const MatchPair&) const = default;
    };

    /// @brief Matches sorted by index_a, then index_b.
    ///
    /// Holds only indices and distances; never refers back into catalog storage.
    struct MatchResult
    {
        std::vector<MatchPair> pairs;

        [[nodiscard]] usize size() const { return pairs.size(); }
        [[nodiscard]] bool empty() const { return pairs.empty(); }

        [[nodiscard]] auto begin() const { return pairs.begin(); }
        [[nodiscard]] auto end() const { return pairs.end(); }

        [[nodiscard]] const MatchPair& operator[](usize i) const { return pairs[i]; }

        /// @brief Column views, for joining catalog rows downstream.
        [[nodiscard]] std::vector<usize> indices_a() const;
        [[nodiscard]] std::vector<usize> indices_b() const;
        [[nodiscard]] std::vector<f64> separations_arcsec() const;

        bool operator==(const MatchResult&) const = default;
    };

    /// @brief Upper bound accepted for MatchConfig::worker_threads.
    inline constexpr u32 kMaxWorkerThreads = 256;

    /// @brief Configuration for a match call.
    /// Use designated initializers: Matcher::match(a, b, {.radius_arcsec = 1.0});
    struct MatchConfig
    {
        f64 radius_arcsec = 1.0;                          ///< Search radius (arcsec, > 0)
        MatchPolicy policy = MatchPolicy::MutualNearest;
        bool normalize_ra = false;   ///< Wrap finite RA into [0, 360) instead of rejecting it
        bool use_index = true;       ///< Declination-band prefilter over catalog B
        u32 worker_threads = 1;      ///< Parallel slices of the outer loop (0 = hardware concurrency, at most kMaxWorkerThreads)
        bool verbose = false;        ///< Log a one-line summary at info level
    };

    /// @brief Error categories reported by the matcher.
    enum class ErrorCode
    {
        InvalidParameter,   ///< Non-positive radius, bad coordinates, mismatched column lengths, worker count out of range
    };

    /// @brief Exception raised on precondition failures, before any computation.
    class MatchError : public std::exception
    {
    public:
        MatchError(ErrorCode code, std::string message)
            : m_code(code), m_message(std::move(message)) {}

        [[nodiscard]] const char* what() const noexcept override { return m_message.c_str(); }
        [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    private:
        ErrorCode m_code;
        std::string m_message;
    };

} // namespace skymatch::match
