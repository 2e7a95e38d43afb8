#pragma once

#include "quota_cache/types.hpp"

#include <string>

namespace quota_cache {

// Query families understood by the freshness classifier. The strings match
// the upstream endpoint paths.
namespace family {
inline constexpr const char *kTeams = "teams";
inline constexpr const char *kVenues = "venues";
inline constexpr const char *kLeagues = "leagues";
inline constexpr const char *kSeasons = "leagues/seasons";
inline constexpr const char *kCountries = "countries";
inline constexpr const char *kFixtures = "fixtures";
inline constexpr const char *kHeadToHead = "fixtures/headtohead";
inline constexpr const char *kFixtureStatistics = "fixtures/statistics";
inline constexpr const char *kTeamStatistics = "teams/statistics";
inline constexpr const char *kStandings = "standings";
inline constexpr const char *kPredictions = "predictions";
} // namespace family

// "family?a=1&b=2" with parameters sorted by name, empty values dropped and
// '%', '&', '=' percent-escaped.
std::string canonical_query(const std::string &family,
                            const QueryParams &params);

Fingerprint make_fingerprint(const std::string &family,
                             const QueryParams &params);

std::string fnv1a_hex(const std::string &data);

} // namespace quota_cache
