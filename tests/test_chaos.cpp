#include <catch2/catch.hpp>
#include "quota_cache/fingerprint.hpp"
#include "quota_cache/orchestrator.hpp"

#include <random>

TEST_CASE("chaos churn keeps the cache bounded and quota honoured", "[chaos]") {
  using namespace quota_cache;
  ManualTimeSource clock;
  EventLog log;
  CacheConfig ccfg;
  ccfg.max_entries = 64;
  ResultCache cache(ccfg, clock, make_policy_by_name("lru"));
  RateLimiterConfig lcfg;
  lcfg.calls_per_minute = 10;
  lcfg.calls_per_day = 500;
  RateLimiter limiter(lcfg, clock);
  OrchestratorConfig ocfg;
  ocfg.max_total_wait = std::chrono::seconds(30);
  FetchOrchestrator orch(ocfg, cache, limiter, clock, log);

  std::mt19937_64 rng(42);
  std::uint64_t upstream_calls = 0;
  UpstreamCall upstream = [&](const std::string &, const QueryParams &) {
    ++upstream_calls;
    switch (rng() % 8) {
    case 0:
      return UpstreamResponse::transport_error("reset");
    case 1:
      return UpstreamResponse::quota_error();
    case 2:
      return UpstreamResponse::upstream_error("bad request");
    case 3:
      return UpstreamResponse::ok(R"({"response":[{"status":{"short":"1H"}}]})");
    default:
      return UpstreamResponse::ok(R"({"response":[{"status":{"short":"FT"}}]})");
    }
  };

  const char *families[] = {family::kFixtures, family::kTeams, family::kStandings};
  for (int i = 0; i < 3000; ++i) {
    const auto f = families[rng() % 3];
    const QueryParams params{{"id", std::to_string(rng() % 200)}};
    switch (rng() % 6) {
    case 0:
      clock.advance(std::chrono::seconds(rng() % 120));
      break;
    case 1:
      cache.invalidate(make_fingerprint(f, params));
      break;
    case 2:
      cache.purge_expired(8);
      break;
    default: {
      const auto r = orch.fetch(f, params, upstream);
      REQUIRE(r.status != FetchStatus::InternalInvariantViolation);
      if (r.from_cache)
        REQUIRE(r.upstream_attempts == 0);
    }
    }
    REQUIRE(cache.size() <= 64);
    REQUIRE(limiter.remaining().minute <= 10);
  }
  REQUIRE(upstream_calls == limiter.stats().admitted);
  REQUIRE(orch.in_flight() == 0);
}
