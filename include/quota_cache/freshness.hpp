#pragma once

#include "quota_cache/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace quota_cache {

struct TtlPolicy {
  std::chrono::seconds long_ttl{24 * 60 * 60};
  std::chrono::seconds medium_ttl{60 * 60};
  std::chrono::seconds short_ttl{30 * 60};

  // Empty optional means the entry never expires. Must not be called with
  // TtlClass::None.
  std::optional<Duration> ttl_for(TtlClass c) const;
};

enum class FixtureState { Finished, InPlay, Scheduled };

FixtureState fixture_state(const std::string &short_status,
                           const std::string &long_status);

struct FixtureStatus {
  std::string short_status;
  std::string long_status;
};

// Every "status": {...} object found in a fixtures payload.
std::vector<FixtureStatus> extract_fixture_statuses(const std::string &payload);

// Maps a query and its upstream result to a freshness class. The payload is
// consulted because a fixture query is only permanently cacheable once every
// returned match is over.
TtlClass classify(const std::string &family, const QueryParams &params,
                  const std::string &payload);

} // namespace quota_cache
