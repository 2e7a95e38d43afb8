#pragma once

#include "quota_cache/cache.hpp"
#include "quota_cache/event_log.hpp"
#include "quota_cache/fingerprint.hpp"
#include "quota_cache/rate_limiter.hpp"
#include "quota_cache/time_source.hpp"

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace quota_cache {

enum class UpstreamStatus { Ok, TransportError, QuotaError, UpstreamError };

struct UpstreamResponse {
  UpstreamStatus status{UpstreamStatus::Ok};
  std::string body;
  std::string error;
  // Only meaningful for QuotaError.
  std::optional<Duration> retry_after;

  static UpstreamResponse ok(std::string body) {
    return {UpstreamStatus::Ok, std::move(body), {}, std::nullopt};
  }
  static UpstreamResponse transport_error(std::string why) {
    return {UpstreamStatus::TransportError, {}, std::move(why), std::nullopt};
  }
  static UpstreamResponse quota_error(
      std::optional<Duration> retry_after = std::nullopt) {
    return {UpstreamStatus::QuotaError, {}, "quota exceeded", retry_after};
  }
  static UpstreamResponse upstream_error(std::string why) {
    return {UpstreamStatus::UpstreamError, {}, std::move(why), std::nullopt};
  }
};

using UpstreamCall = std::function<UpstreamResponse(const std::string &family,
                                                    const QueryParams &params)>;

enum class FetchStatus {
  Ok,
  QuotaExhausted,
  TransportFailure,
  UpstreamError,
  InternalInvariantViolation,
  Cancelled,
  InvalidQuery
};

const char *fetch_status_name(FetchStatus s);
// True for failures worth retrying later (quota, connectivity).
bool is_retryable(FetchStatus s);

struct FetchResult {
  FetchStatus status{FetchStatus::Ok};
  std::string payload;
  std::string error;
  TtlClass ttl_class{TtlClass::None};
  bool from_cache{false};
  // Result was produced by another caller's in-flight fetch.
  bool shared{false};
  std::uint32_t upstream_attempts{0};

  bool ok() const { return status == FetchStatus::Ok; }

  static FetchResult failure(FetchStatus s, std::string why) {
    FetchResult r;
    r.status = s;
    r.error = std::move(why);
    return r;
  }
};

struct OrchestratorConfig {
  // When false, lookups and stores are skipped; admission still applies.
  bool cache_enabled{true};
  std::uint32_t transport_max_attempts{3};
  Duration transport_backoff_base{std::chrono::seconds(1)};
  std::uint32_t max_admission_attempts{8};
  // Ceiling on admission waits plus retry delays for one fetch.
  Duration max_total_wait{std::chrono::seconds(120)};
  // Granularity at which a waiting follower polls its own cancellation and
  // a leadership handoff.
  Duration follower_poll{std::chrono::milliseconds(10)};
  // Real time a follower waits on a shared result before giving up.
  Duration follower_max_wait{std::chrono::seconds(150)};
};

struct OrchestratorStats {
  std::uint64_t fetches{0};
  std::uint64_t cache_hits{0};
  std::uint64_t upstream_calls{0};
  std::uint64_t dedup_joins{0};
  std::uint64_t admission_waits{0};
  std::uint64_t transport_retries{0};
  std::uint64_t failures{0};
  std::uint64_t cancellations{0};
};

// Facade the tool layer calls: cache, then deduplicated, rate-limited
// upstream fetch, then store.
class FetchOrchestrator {
public:
  FetchOrchestrator(OrchestratorConfig cfg, ResultCache &cache,
                    RateLimiter &limiter, TimeSource &time, EventLog &log);

  FetchOrchestrator(const FetchOrchestrator &) = delete;
  FetchOrchestrator &operator=(const FetchOrchestrator &) = delete;

  FetchResult fetch(const std::string &family, const QueryParams &params,
                    const UpstreamCall &upstream,
                    const CancellationToken &cancel = CancellationToken());

  OrchestratorStats stats() const;
  std::size_t in_flight() const;
  std::string info() const;
  const OrchestratorConfig &config() const { return cfg_; }

private:
  // One deduplicated upstream fetch. Fields other than the promise and
  // result are guarded by flights_mu_.
  struct Flight {
    std::string key;
    TimePoint deadline;
    std::promise<FetchResult> promise;
    std::shared_future<FetchResult> result;
    // Callers still waiting for the result, the leader included.
    std::size_t interest{1};
    // The leader cancelled and a follower should take over the work.
    bool handoff{false};
    // No caller is left; new callers start a fresh flight.
    bool abandoned{false};
    bool completed{false};
  };

  // Per-fetch state of the caller that performs the upstream work.
  struct LeaderContext {
    const Fingerprint &fp;
    const QueryParams &params;
    const UpstreamCall &upstream;
    const CancellationToken &cancel;
    std::shared_ptr<Flight> flight;
    TimePoint deadline;
    bool withdrawn{false};
    bool handed_off{false};
  };

  FetchResult lead(const Fingerprint &fp, const QueryParams &params,
                   const UpstreamCall &upstream,
                   const CancellationToken &cancel,
                   const std::shared_ptr<Flight> &flight);
  FetchResult run_leader(LeaderContext &ctx);
  UpstreamResponse call_upstream(LeaderContext &ctx);
  FetchResult await_follower(const Fingerprint &fp, const QueryParams &params,
                             const UpstreamCall &upstream,
                             const std::shared_ptr<Flight> &flight,
                             const CancellationToken &cancel);
  std::optional<FetchResult> wait_admission(LeaderContext &ctx);
  bool suspend(LeaderContext &ctx, Duration d);
  void withdraw(Flight &flight);
  bool release_leadership(Flight &flight);
  bool claim_leadership(Flight &flight);
  void complete(Flight &flight, const FetchResult &r);
  void note_leader_cancel(LeaderContext &ctx);
  FetchResult finish(const Fingerprint &fp, FetchResult result);
  void trace_outcome(const Fingerprint &fp, const FetchResult &r);
  void bump(std::uint64_t OrchestratorStats::*field);

  OrchestratorConfig cfg_;
  ResultCache &cache_;
  RateLimiter &limiter_;
  TimeSource &time_;
  EventLog &log_;

  mutable std::mutex flights_mu_;
  std::unordered_map<std::string, std::shared_ptr<Flight>> flights_;

  mutable std::mutex stats_mu_;
  OrchestratorStats stats_;
};

} // namespace quota_cache
