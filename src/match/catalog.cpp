/// @file catalog.cpp
/// @brief Catalog construction and input-domain validation.

#include "match/catalog.hpp"

#include "core/logger.hpp"
#include "core/math/spherical.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <string>

namespace skymatch::match
{

namespace
{
    [[noreturn]] void fail(const std::string& message)
    {
        SKM_CORE_ERROR("Matcher: {}", message);
        throw MatchError(ErrorCode::InvalidParameter, message);
    }
}

// -----------------------------------------------------------------
// make_catalog
// -----------------------------------------------------------------

Catalog make_catalog(std::span<const f64> ra_deg, std::span<const f64> dec_deg)
{
    if (ra_deg.size() != dec_deg.size())
    {
        fail(fmt::format("RA and Dec columns differ in length ({} vs {})",
                         ra_deg.size(), dec_deg.size()));
    }

    Catalog catalog;
    catalog.reserve(ra_deg.size());
    for (usize i = 0; i < ra_deg.size(); ++i)
    {
        catalog.push_back(SkyPosition{.ra_deg = ra_deg[i], .dec_deg = dec_deg[i]});
    }
    return catalog;
}

// -----------------------------------------------------------------
// validate_catalog
// -----------------------------------------------------------------

Catalog validate_catalog(std::span<const SkyPosition> catalog,
                         std::string_view name,
                         bool normalize_ra)
{
    Catalog checked;
    checked.reserve(catalog.size());

    for (usize i = 0; i < catalog.size(); ++i)
    {
        SkyPosition pos = catalog[i];

        if (!std::isfinite(pos.ra_deg) || !std::isfinite(pos.dec_deg))
        {
            fail(fmt::format("catalog {} entry {}: non-finite coordinate (ra={}, dec={})",
                             name, i, pos.ra_deg, pos.dec_deg));
        }

        if (pos.dec_deg < -90.0 || pos.dec_deg > 90.0)
        {
            fail(fmt::format("catalog {} entry {}: declination {} outside [-90, 90]",
                             name, i, pos.dec_deg));
        }

        if (pos.ra_deg < 0.0 || pos.ra_deg >= 360.0)
        {
            if (!normalize_ra)
            {
                fail(fmt::format("catalog {} entry {}: right ascension {} outside [0, 360)",
                                 name, i, pos.ra_deg));
            }
            pos.ra_deg = normDeg(pos.ra_deg);
        }

        checked.push_back(pos);
    }

    return checked;
}

// -----------------------------------------------------------------
// validate_radius
// -----------------------------------------------------------------

void validate_radius(f64 radius_arcsec)
{
    if (!std::isfinite(radius_arcsec) || radius_arcsec <= 0.0)
    {
        fail(fmt::format("search radius must be finite and positive, got {} arcsec",
                         radius_arcsec));
    }
}

// -----------------------------------------------------------------
// validate_config
// -----------------------------------------------------------------

void validate_config(const MatchConfig& config)
{
    validate_radius(config.radius_arcsec);

    if (config.worker_threads > kMaxWorkerThreads)
    {
        fail(fmt::format("worker_threads must be at most {}, got {}",
                         kMaxWorkerThreads, config.worker_threads));
    }
}

} // namespace skymatch::match
