#include "quota_cache/fingerprint.hpp"
#include "quota_cache/orchestrator.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace quota_cache;
using namespace std::chrono_literals;

namespace {
const std::string kFinished =
    R"({"response":[{"fixture":{"id":1,"status":{"long":"Match Finished","short":"FT"}}}]})";
const std::string kLive =
    R"({"response":[{"fixture":{"id":2,"status":{"long":"Second Half","short":"2H"}}}]})";

struct Harness {
  explicit Harness(RateLimiterConfig limits = {}, OrchestratorConfig ocfg = {},
                   CacheConfig ccfg = {})
      : cache(ccfg, clock, make_policy_by_name("lru")), limiter(limits, clock),
        orch(ocfg, cache, limiter, clock, log) {}

  ManualTimeSource clock;
  EventLog log;
  ResultCache cache;
  RateLimiter limiter;
  FetchOrchestrator orch;
};

// Manual clock whose waits block until the test opens the gate or the
// waiter's token is cancelled.
class GatedTimeSource final : public TimeSource {
public:
  TimePoint now() const override { return inner.now(); }
  WallClock::time_point wall_now() const override { return inner.wall_now(); }
  bool wait_for(Duration d, const CancellationToken &token) override {
    ++blocked;
    while (!open) {
      if (token.cancelled()) {
        --blocked;
        return false;
      }
      std::this_thread::sleep_for(1ms);
    }
    --blocked;
    return inner.wait_for(d, token);
  }

  ManualTimeSource inner;
  std::atomic<bool> open{false};
  std::atomic<int> blocked{0};
};

struct GatedHarness {
  explicit GatedHarness(RateLimiterConfig limits)
      : cache({}, clock, make_policy_by_name("lru")), limiter(limits, clock),
        orch({}, cache, limiter, clock, log) {}

  GatedTimeSource clock;
  EventLog log;
  ResultCache cache;
  RateLimiter limiter;
  FetchOrchestrator orch;
};

RateLimiterConfig limits(std::uint64_t per_minute, std::uint64_t per_day) {
  RateLimiterConfig cfg;
  cfg.calls_per_minute = per_minute;
  cfg.calls_per_day = per_day;
  return cfg;
}

UpstreamCall returning(std::atomic<int> &calls, std::string body) {
  return [&calls, body](const std::string &, const QueryParams &) {
    ++calls;
    return UpstreamResponse::ok(body);
  };
}
} // namespace

TEST_CASE("a miss fetches, classifies and stores", "[orchestrator]") {
  Harness h;
  std::atomic<int> calls{0};
  auto r = h.orch.fetch(family::kFixtures, {{"id", "1"}},
                        returning(calls, kFinished));
  REQUIRE(r.ok());
  CHECK(r.payload == kFinished);
  CHECK(r.ttl_class == TtlClass::Permanent);
  CHECK_FALSE(r.from_cache);
  CHECK(r.upstream_attempts == 1);
  CHECK(calls == 1);
  CHECK(h.cache.size() == 1);
}

TEST_CASE("a cache hit skips the limiter and the upstream",
          "[orchestrator][cache]") {
  Harness h(limits(1, 100));
  std::atomic<int> calls{0};
  const auto upstream = returning(calls, kFinished);
  REQUIRE(h.orch.fetch(family::kFixtures, {{"id", "1"}}, upstream).ok());
  auto again = h.orch.fetch(family::kFixtures, {{"id", "1"}}, upstream);
  REQUIRE(again.ok());
  CHECK(again.from_cache);
  CHECK(again.payload == kFinished);
  CHECK(calls == 1);
  CHECK(h.limiter.stats().admitted == 1);
  CHECK(h.limiter.stats().waits == 0);
  CHECK(h.orch.stats().cache_hits == 1);
}

TEST_CASE("concurrent identical fetches share one upstream call",
          "[orchestrator][dedup]") {
  Harness h;
  std::atomic<int> calls{0};
  UpstreamCall slow = [&](const std::string &, const QueryParams &) {
    ++calls;
    std::this_thread::sleep_for(200ms);
    return UpstreamResponse::ok(kFinished);
  };

  std::vector<FetchResult> results(10);
  std::vector<std::thread> threads;
  for (std::size_t i = 0; i < results.size(); ++i) {
    threads.emplace_back([&, i] {
      results[i] = h.orch.fetch(family::kFixtures,
                                {{"league", "39"}, {"season", "2024"}}, slow);
    });
  }
  for (auto &t : threads)
    t.join();

  CHECK(calls == 1);
  for (const auto &r : results) {
    CHECK(r.ok());
    CHECK(r.payload == kFinished);
  }
  CHECK(h.orch.stats().upstream_calls == 1);
  CHECK(h.orch.in_flight() == 0);
}

TEST_CASE("uncacheable results are fetched every time", "[orchestrator]") {
  Harness h;
  std::atomic<int> calls{0};
  const auto upstream = returning(calls, kLive);
  auto first = h.orch.fetch(family::kFixtures, {{"live", "all"}}, upstream);
  auto second = h.orch.fetch(family::kFixtures, {{"live", "all"}}, upstream);
  CHECK(first.ok());
  CHECK(first.ttl_class == TtlClass::None);
  CHECK_FALSE(second.from_cache);
  CHECK(calls == 2);
  CHECK(h.cache.size() == 0);
}

TEST_CASE("transport failures are retried with backoff",
          "[orchestrator][retry]") {
  Harness h;
  std::atomic<int> calls{0};
  UpstreamCall flaky = [&](const std::string &, const QueryParams &) {
    if (++calls < 3)
      return UpstreamResponse::transport_error("connection reset");
    return UpstreamResponse::ok(kFinished);
  };
  const auto start = h.clock.now();
  auto r = h.orch.fetch(family::kFixtures, {{"id", "5"}}, flaky);
  REQUIRE(r.ok());
  CHECK(r.upstream_attempts == 3);
  CHECK(h.orch.stats().transport_retries == 2);
  // 1s then 2s of retry delay.
  CHECK(h.clock.now() - start >= 3s);
  CHECK(h.limiter.stats().admitted == 3);
}

TEST_CASE("persistent transport failure gives up after the attempt budget",
          "[orchestrator][retry]") {
  Harness h;
  std::atomic<int> calls{0};
  UpstreamCall down = [&](const std::string &, const QueryParams &) {
    ++calls;
    return UpstreamResponse::transport_error("timeout");
  };
  auto r = h.orch.fetch(family::kTeams, {{"id", "33"}}, down);
  CHECK(r.status == FetchStatus::TransportFailure);
  CHECK(is_retryable(r.status));
  CHECK(r.error.find("timeout") != std::string::npos);
  CHECK(calls == 3);
  CHECK(r.upstream_attempts == 3);
  CHECK(h.cache.size() == 0);
  CHECK(h.log.count(LogLevel::Warn) >= 3);
}

TEST_CASE("an upstream quota rejection feeds the limiter",
          "[orchestrator][quota]") {
  Harness h;
  std::atomic<int> calls{0};
  UpstreamCall limited = [&](const std::string &, const QueryParams &) {
    ++calls;
    return UpstreamResponse::quota_error(45s);
  };
  auto r = h.orch.fetch(family::kStandings, {{"league", "39"}}, limited);
  CHECK(r.status == FetchStatus::QuotaExhausted);
  CHECK(calls == 1);
  CHECK(h.limiter.stats().quota_errors == 1);
  CHECK(h.limiter.last_backoff() == 45s);
  REQUIRE(h.limiter.blocked_until().has_value());
}

TEST_CASE("a short retry-after does not block the rest of the day",
          "[orchestrator][quota]") {
  Harness h;
  std::atomic<int> calls{0};
  UpstreamCall limited = [&](const std::string &, const QueryParams &) {
    ++calls;
    return UpstreamResponse::quota_error(90s);
  };
  auto first = h.orch.fetch(family::kStandings, {{"league", "39"}}, limited);
  REQUIRE(first.status == FetchStatus::QuotaExhausted);

  h.clock.advance(5min);
  auto second = h.orch.fetch(family::kStandings, {{"league", "39"}},
                             returning(calls, "{}"));
  CHECK(second.ok());
  CHECK(calls == 2);
  CHECK(h.limiter.remaining().day == 98);
  CHECK(h.limiter.stats().rejections == 0);
}

TEST_CASE("an upstream that throws is treated as a transport failure",
          "[orchestrator][retry]") {
  Harness h;
  std::atomic<int> calls{0};
  UpstreamCall throwing = [&](const std::string &,
                              const QueryParams &) -> UpstreamResponse {
    ++calls;
    throw std::runtime_error("socket closed");
  };
  auto r = h.orch.fetch(family::kFixtures, {{"id", "3"}}, throwing);
  CHECK(r.status == FetchStatus::TransportFailure);
  CHECK(r.error.find("socket closed") != std::string::npos);
  CHECK(calls == 3);
  CHECK(h.orch.in_flight() == 0);

  auto again = h.orch.fetch(family::kFixtures, {{"id", "3"}},
                            returning(calls, kFinished));
  CHECK(again.ok());
  CHECK_FALSE(again.shared);
}

TEST_CASE("a foreign exception still releases waiting callers",
          "[orchestrator][dedup]") {
  Harness h;
  std::atomic<int> calls{0};
  std::atomic<bool> entered{false};
  std::atomic<bool> release{false};
  UpstreamCall exploding = [&](const std::string &,
                               const QueryParams &) -> UpstreamResponse {
    ++calls;
    entered = true;
    while (!release)
      std::this_thread::sleep_for(1ms);
    throw 42;
  };

  std::atomic<bool> leader_threw{false};
  std::thread leader([&] {
    try {
      h.orch.fetch(family::kFixtures, {{"id", "4"}}, exploding);
    } catch (int) {
      leader_threw = true;
    }
  });
  while (!entered)
    std::this_thread::sleep_for(1ms);

  FetchResult follower_result;
  std::thread follower([&] {
    follower_result = h.orch.fetch(family::kFixtures, {{"id", "4"}}, exploding);
  });
  while (h.orch.stats().dedup_joins == 0)
    std::this_thread::sleep_for(1ms);
  release = true;
  leader.join();
  follower.join();

  CHECK(leader_threw);
  CHECK(follower_result.status == FetchStatus::TransportFailure);
  CHECK(follower_result.error == "in-flight fetch aborted");
  CHECK(calls == 1);
  CHECK(h.orch.in_flight() == 0);
  CHECK(h.orch.fetch(family::kFixtures, {{"id", "4"}},
                     returning(calls, kFinished))
            .ok());
}

TEST_CASE("a follower gives up on a flight that never finishes",
          "[orchestrator][dedup]") {
  OrchestratorConfig ocfg;
  ocfg.follower_max_wait = 50ms;
  Harness h({}, ocfg);
  std::atomic<int> calls{0};
  std::atomic<bool> entered{false};
  std::atomic<bool> release{false};
  UpstreamCall stuck = [&](const std::string &, const QueryParams &) {
    ++calls;
    entered = true;
    while (!release)
      std::this_thread::sleep_for(1ms);
    return UpstreamResponse::ok(kFinished);
  };

  FetchResult leader_result;
  std::thread leader([&] {
    leader_result = h.orch.fetch(family::kFixtures, {{"id", "6"}}, stuck);
  });
  while (!entered)
    std::this_thread::sleep_for(1ms);

  auto r = h.orch.fetch(family::kFixtures, {{"id", "6"}}, stuck);
  CHECK(r.status == FetchStatus::TransportFailure);
  CHECK(r.error.find("timed out") != std::string::npos);

  release = true;
  leader.join();
  CHECK(leader_result.ok());
  CHECK(calls == 1);
  CHECK(h.orch.in_flight() == 0);
}

TEST_CASE("upstream errors are returned without retry",
          "[orchestrator][errors]") {
  Harness h;
  std::atomic<int> calls{0};
  UpstreamCall broken = [&](const std::string &, const QueryParams &) {
    ++calls;
    return UpstreamResponse::upstream_error("league: unknown id");
  };
  auto r = h.orch.fetch(family::kStandings, {{"league", "0"}}, broken);
  CHECK(r.status == FetchStatus::UpstreamError);
  CHECK_FALSE(is_retryable(r.status));
  CHECK(r.error == "league: unknown id");
  CHECK(calls == 1);
  CHECK(h.orch.stats().failures == 1);
}

TEST_CASE("admission waits advance time and still succeed",
          "[orchestrator][limits]") {
  OrchestratorConfig ocfg;
  ocfg.cache_enabled = false;
  Harness h(limits(1, 100), ocfg);
  std::atomic<int> calls{0};
  const auto upstream = returning(calls, kFinished);
  const auto start = h.clock.now();
  REQUIRE(h.orch.fetch(family::kFixtures, {{"id", "1"}}, upstream).ok());
  auto r = h.orch.fetch(family::kFixtures, {{"id", "1"}}, upstream);
  REQUIRE(r.ok());
  CHECK_FALSE(r.from_cache);
  CHECK(calls == 2);
  CHECK(h.orch.stats().admission_waits == 1);
  CHECK(h.clock.now() - start >= 60s);
  CHECK(h.cache.size() == 0);
}

TEST_CASE("waits beyond the deadline fail fast as quota exhaustion",
          "[orchestrator][limits]") {
  OrchestratorConfig ocfg;
  ocfg.max_total_wait = 10s;
  Harness h(limits(1, 100), ocfg);
  std::atomic<int> calls{0};
  const auto upstream = returning(calls, kFinished);
  REQUIRE(h.orch.fetch(family::kFixtures, {{"id", "1"}}, upstream).ok());
  const auto before = h.clock.now();
  auto r = h.orch.fetch(family::kFixtures, {{"id", "2"}}, upstream);
  CHECK(r.status == FetchStatus::QuotaExhausted);
  CHECK(r.error.find("deadline") != std::string::npos);
  CHECK(calls == 1);
  CHECK(h.clock.now() == before);
}

TEST_CASE("an exhausted day quota is reported, not waited out",
          "[orchestrator][limits]") {
  auto cfg = limits(30, 1);
  cfg.max_wait = 1h;
  Harness h(cfg);
  std::atomic<int> calls{0};
  const auto upstream = returning(calls, "{}");
  REQUIRE(h.orch.fetch(family::kTeams, {{"id", "1"}}, upstream).ok());
  auto r = h.orch.fetch(family::kTeams, {{"id", "2"}}, upstream);
  CHECK(r.status == FetchStatus::QuotaExhausted);
  CHECK(r.error == "daily quota exhausted");
  CHECK(calls == 1);
}

TEST_CASE("a cancelled follower leaves without disturbing the leader",
          "[orchestrator][cancel]") {
  Harness h;
  std::atomic<int> calls{0};
  std::atomic<bool> entered{false};
  std::atomic<bool> release{false};
  UpstreamCall gated = [&](const std::string &, const QueryParams &) {
    ++calls;
    entered = true;
    while (!release)
      std::this_thread::sleep_for(1ms);
    return UpstreamResponse::ok(kFinished);
  };

  FetchResult leader_result;
  std::thread leader([&] {
    leader_result = h.orch.fetch(family::kFixtures, {{"id", "77"}}, gated);
  });
  while (!entered)
    std::this_thread::sleep_for(1ms);

  CancellationSource cancel;
  FetchResult follower_result;
  std::thread follower([&] {
    follower_result = h.orch.fetch(family::kFixtures, {{"id", "77"}}, gated,
                                   cancel.token());
  });
  while (h.orch.stats().dedup_joins == 0)
    std::this_thread::sleep_for(1ms);
  cancel.cancel();
  follower.join();
  CHECK(follower_result.status == FetchStatus::Cancelled);

  release = true;
  leader.join();
  CHECK(leader_result.ok());
  CHECK(calls == 1);
  CHECK(h.orch.stats().cancellations == 1);
}

TEST_CASE("a lone caller cancelling abandons the fetch",
          "[orchestrator][cancel]") {
  Harness h(limits(1, 100));
  std::atomic<int> calls{0};
  const auto upstream = returning(calls, kFinished);
  REQUIRE(h.orch.fetch(family::kFixtures, {{"id", "1"}}, upstream).ok());

  CancellationSource cancel;
  cancel.cancel();
  auto r = h.orch.fetch(family::kFixtures, {{"id", "2"}}, upstream,
                        cancel.token());
  CHECK(r.status == FetchStatus::Cancelled);
  CHECK(calls == 1);
  CHECK(h.orch.in_flight() == 0);
}

TEST_CASE("a cancelled leader returns at once and a follower takes over",
          "[orchestrator][cancel]") {
  GatedHarness h(limits(1, 100));
  std::atomic<int> calls{0};
  const auto upstream = returning(calls, kFinished);
  REQUIRE(h.orch.fetch(family::kFixtures, {{"id", "1"}}, upstream).ok());

  CancellationSource leader_cancel;
  FetchResult leader_result;
  std::thread leader([&] {
    leader_result = h.orch.fetch(family::kFixtures, {{"id", "2"}}, upstream,
                                 leader_cancel.token());
  });
  while (h.clock.blocked == 0)
    std::this_thread::sleep_for(1ms);

  FetchResult follower_result;
  std::thread follower([&] {
    follower_result = h.orch.fetch(family::kFixtures, {{"id", "2"}}, upstream);
  });
  while (h.orch.stats().dedup_joins == 0)
    std::this_thread::sleep_for(1ms);

  // The admission wait is still closed, so only a handoff lets the leader go.
  leader_cancel.cancel();
  leader.join();
  CHECK(leader_result.status == FetchStatus::Cancelled);
  CHECK(calls == 1);

  h.clock.open = true;
  follower.join();
  REQUIRE(follower_result.ok());
  CHECK(follower_result.payload == kFinished);
  CHECK(calls == 2);
  CHECK(h.orch.stats().cancellations == 1);
  CHECK(h.orch.in_flight() == 0);
  CHECK(h.cache.lookup(make_fingerprint(family::kFixtures, {{"id", "2"}}))
            .has_value());
}

TEST_CASE("a collision found by a new leader costs no upstream call",
          "[orchestrator][collision]") {
  GatedHarness h(limits(1, 100));
  std::atomic<int> calls{0};
  const auto upstream = returning(calls, kFinished);
  REQUIRE(h.orch.fetch(family::kFixtures, {{"id", "1"}}, upstream).ok());

  CancellationSource leader_cancel;
  FetchResult leader_result;
  std::thread leader([&] {
    leader_result = h.orch.fetch(family::kFixtures, {{"id", "2"}}, upstream,
                                 leader_cancel.token());
  });
  while (h.clock.blocked == 0)
    std::this_thread::sleep_for(1ms);

  FetchResult follower_result;
  std::thread follower([&] {
    follower_result = h.orch.fetch(family::kFixtures, {{"id", "2"}}, upstream);
  });
  while (h.orch.stats().dedup_joins == 0)
    std::this_thread::sleep_for(1ms);

  const auto real = make_fingerprint(family::kFixtures, {{"id", "2"}});
  Fingerprint impostor{real.family, "fixtures?id=999", real.key};
  REQUIRE(h.cache.store(impostor, "wrong", TtlClass::Permanent));

  leader_cancel.cancel();
  leader.join();
  h.clock.open = true;
  follower.join();

  CHECK(leader_result.status == FetchStatus::Cancelled);
  CHECK(follower_result.status == FetchStatus::InternalInvariantViolation);
  CHECK(follower_result.payload.empty());
  CHECK(calls == 1);
  CHECK(h.log.count(LogLevel::Error) == 1);
  CHECK(h.orch.in_flight() == 0);
}

TEST_CASE("a fingerprint collision is surfaced, not served",
          "[orchestrator][collision]") {
  Harness h;
  const auto real = make_fingerprint(family::kFixtures, {{"id", "1"}});
  Fingerprint impostor{real.family, "fixtures?id=999", real.key};
  REQUIRE(h.cache.store(impostor, "wrong", TtlClass::Permanent));

  std::atomic<int> calls{0};
  auto r = h.orch.fetch(family::kFixtures, {{"id", "1"}},
                        returning(calls, kFinished));
  CHECK(r.status == FetchStatus::InternalInvariantViolation);
  CHECK(r.payload.empty());
  CHECK(calls == 0);
  CHECK(h.log.count(LogLevel::Error) == 1);
}

TEST_CASE("fetch outcomes are written to the trace file",
          "[orchestrator][trace]") {
  Harness h;
  const std::string path = "quota_cache_test.trace.jsonl";
  std::remove(path.c_str());
  TraceConfig tcfg;
  tcfg.enabled = true;
  tcfg.path = path;
  REQUIRE(h.log.configure_trace(tcfg));

  std::atomic<int> calls{0};
  const auto upstream = returning(calls, kFinished);
  REQUIRE(h.orch.fetch(family::kFixtures, {{"id", "1"}}, upstream).ok());
  REQUIRE(h.orch.fetch(family::kFixtures, {{"id", "1"}}, upstream).ok());
  CHECK(h.log.trace_written() == 2);

  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  const auto text = ss.str();
  CHECK(text.find("\"status\":\"ok\"") != std::string::npos);
  CHECK(text.find("\"from_cache\":true") != std::string::npos);
  CHECK(text.find("\"ttl_class\":\"permanent\"") != std::string::npos);
}

TEST_CASE("trace lines escape the cache key", "[orchestrator][trace]") {
  Harness h;
  const std::string path = "quota_cache_test_escape.trace.jsonl";
  std::remove(path.c_str());
  TraceConfig tcfg;
  tcfg.enabled = true;
  tcfg.path = path;
  REQUIRE(h.log.configure_trace(tcfg));

  std::atomic<int> calls{0};
  REQUIRE(h.orch.fetch("odd\"family", {{"id", "1"}}, returning(calls, "{}"))
              .ok());
  std::ifstream in(path);
  std::string line;
  REQUIRE(std::getline(in, line));
  CHECK(line.find("\"key\":\"odd\\\"family:") != std::string::npos);
}

TEST_CASE("info aggregates orchestrator, limiter and cache",
          "[orchestrator][info]") {
  Harness h;
  std::atomic<int> calls{0};
  REQUIRE(h.orch.fetch(family::kTeams, {{"id", "1"}}, returning(calls, "{}"))
              .ok());
  const auto info = h.orch.info();
  CHECK(info.find("upstream_calls:1") != std::string::npos);
  CHECK(info.find("remaining_minute:29") != std::string::npos);
  CHECK(info.find("cache_keys:1") != std::string::npos);
}
