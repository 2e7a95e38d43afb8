#pragma once

#include "quota_cache/orchestrator.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace quota_cache {

struct TeamQuery {
  std::optional<std::uint64_t> id;
  std::string name;
  std::optional<std::uint64_t> league;
  std::optional<std::uint64_t> season;
  std::string country;
  std::string code;
  std::optional<std::uint64_t> venue;
  // Free-text search, at least three characters.
  std::string search;
};

struct FixtureQuery {
  std::optional<std::uint64_t> id;
  // Dash-separated fixture ids, "1-2-3".
  std::string ids;
  // "all" or dash-separated league ids.
  std::string live;
  std::string date;
  std::optional<std::uint64_t> league;
  std::optional<std::uint64_t> season;
  std::optional<std::uint64_t> team;
  std::optional<std::uint64_t> last;
  std::optional<std::uint64_t> next;
  std::string from;
  std::string to;
  std::string round;
  std::string status;
  std::optional<std::uint64_t> venue;
  std::string timezone;
};

// Typed front door over the orchestrator. Each call validates its input,
// builds the upstream query and fetches it. Bad input comes back as
// FetchStatus::InvalidQuery without consuming quota.
class SportsTools {
public:
  SportsTools(FetchOrchestrator &orchestrator, UpstreamCall upstream);

  FetchResult search_teams(const TeamQuery &q,
                           const CancellationToken &cancel = CancellationToken());
  FetchResult get_fixtures(const FixtureQuery &q,
                           const CancellationToken &cancel = CancellationToken());
  FetchResult get_team_statistics(std::uint64_t league, std::uint64_t team,
                                  std::uint64_t season,
                                  const std::string &date = {},
                                  const CancellationToken &cancel = CancellationToken());
  FetchResult get_standings(std::uint64_t league, std::uint64_t season,
                            std::optional<std::uint64_t> team = std::nullopt,
                            const CancellationToken &cancel = CancellationToken());
  FetchResult get_head2head(const std::string &h2h,
                            std::optional<std::uint64_t> last = std::nullopt,
                            std::optional<std::uint64_t> season = std::nullopt,
                            const CancellationToken &cancel = CancellationToken());

private:
  FetchResult run(const std::string &family, const QueryParams &params,
                  const CancellationToken &cancel);

  FetchOrchestrator &orchestrator_;
  UpstreamCall upstream_;
};

bool valid_date(const std::string &date);

} // namespace quota_cache
