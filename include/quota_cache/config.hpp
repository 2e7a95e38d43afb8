#pragma once

#include "quota_cache/cache.hpp"
#include "quota_cache/event_log.hpp"
#include "quota_cache/orchestrator.hpp"
#include "quota_cache/rate_limiter.hpp"

#include <string>
#include <vector>

namespace quota_cache {

struct MediatorConfig {
  RateLimiterConfig limiter{};
  CacheConfig cache{};
  OrchestratorConfig orchestrator{};
  TraceConfig trace{};
  std::string policy{"lru"};
};

// Reads a flat JSON object of settings. Keys that are absent keep their
// current value; numeric values are clamped to sane ranges. On any error
// `cfg` is left untouched.
bool load_config(const std::string &path, MediatorConfig &cfg,
                 std::string *err = nullptr);
bool parse_config_text(const std::string &text, MediatorConfig &cfg,
                       std::string *err = nullptr);

// "--flag value" pairs layered over a loaded config. Unknown flags are left
// for the caller and reported through `unused`.
bool apply_cli_overrides(const std::vector<std::string> &args,
                         MediatorConfig &cfg, std::string *err = nullptr,
                         std::vector<std::string> *unused = nullptr);

std::string describe(const MediatorConfig &cfg);

} // namespace quota_cache
