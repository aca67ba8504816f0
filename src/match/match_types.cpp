/// @file match_types.cpp
/// @brief MatchResult column accessors.

#include "match/match_types.hpp"

namespace skymatch::match
{

std::vector<usize> MatchResult::indices_a() const
{
    std::vector<usize> out;
    out.reserve(pairs.size());
    for (const auto& p : pairs)
    {
        out.push_back(p.index_a);
    }
    return out;
}

std::vector<usize> MatchResult::indices_b() const
{
    std::vector<usize> out;
    out.reserve(pairs.size());
    for (const auto& p : pairs)
    {
        out.push_back(p.index_b);
    }
    return out;
}

std::vector<f64> MatchResult::separations_arcsec() const
{
    std::vector<f64> out;
    out.reserve(pairs.size());
    for (const auto& p : pairs)
    {
        out.push_back(p.separation_arcsec);
    }
    return out;
}

} // namespace skymatch::match
