#pragma once

/// @file catalog.hpp
/// @brief Catalog construction from column data and precondition checks.

#include "match/match_types.hpp"

#include <span>
#include <string_view>

namespace skymatch::match
{
    /// @brief Zip separate RA and Dec columns (degrees) into a Catalog.
    ///
    /// Values are copied as given; range checks happen when the catalog is matched.
    ///
    /// @throws MatchError (InvalidParameter) if the columns differ in length.
    [[nodiscard]] Catalog make_catalog(std::span<const f64> ra_deg,
                                       std::span<const f64> dec_deg);

    /// @brief Check every position of a catalog against the matcher's input domain.
    ///
    /// RA must be finite and in [0, 360) and Dec finite and in [-90, 90].
    /// With normalize_ra, a finite RA outside [0, 360) is wrapped instead of rejected;
    /// Dec is never wrapped.
    ///
    /// @param catalog Positions to check.
    /// @param name Catalog label used in error messages ("A" or "B").
    /// @param normalize_ra Wrap RA rather than rejecting it.
    /// @return The positions, RA-normalized when requested.
    /// @throws MatchError (InvalidParameter) on the first offending entry.
    [[nodiscard]] Catalog validate_catalog(std::span<const SkyPosition> catalog,
                                           std::string_view name,
                                           bool normalize_ra);

    /// @brief Check a search radius (arcsec): finite and strictly positive.
    /// @throws MatchError (InvalidParameter) otherwise.
    void validate_radius(f64 radius_arcsec);

    /// @brief Check the scalar settings of a match call: radius and worker count.
    /// @throws MatchError (InvalidParameter) if the radius is invalid or
    ///         worker_threads exceeds kMaxWorkerThreads.
    void validate_config(const MatchConfig& config);

} // namespace skymatch::match
