#pragma once

#include "quota_cache/time_source.hpp"

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <random>
#include <string>

namespace quota_cache {

enum class WindowKind { Minute, Day };

struct RateWindow {
  WindowKind kind{WindowKind::Minute};
  std::uint64_t limit{0};
  Duration span{0};
  std::deque<TimePoint> occupied;

  void prune(TimePoint now);
  bool has_capacity() const { return occupied.size() < limit; }
  // Instant at which the oldest admission leaves the window.
  TimePoint frees_at() const;
};

struct AdmissionDecision {
  enum class Kind { Admit, Wait, Reject };
  Kind kind{Kind::Admit};
  Duration wait{0};
  std::string reason;

  static AdmissionDecision admit() { return {Kind::Admit, Duration::zero(), {}}; }
  static AdmissionDecision wait_for(Duration d) { return {Kind::Wait, d, {}}; }
  static AdmissionDecision reject(std::string why) {
    return {Kind::Reject, Duration::zero(), std::move(why)};
  }
};

struct RateLimiterConfig {
  std::uint64_t calls_per_minute{30};
  std::uint64_t calls_per_day{100};
  // Longest wait the limiter will hand out before rejecting a call whose
  // day window is exhausted.
  Duration max_wait{std::chrono::hours(24)};
  // A retry-after hint at least this long means the daily quota is gone.
  Duration day_exhausted_hint{std::chrono::hours(1)};
  Duration backoff_base{std::chrono::seconds(1)};
  Duration backoff_max{std::chrono::seconds(300)};
  double jitter_ratio{0.25};
  std::uint64_t rng_seed{424242};
};

struct RateLimiterStats {
  std::uint64_t admitted{0};
  std::uint64_t waits{0};
  std::uint64_t rejections{0};
  std::uint64_t quota_errors{0};
  std::uint64_t consecutive_quota_errors{0};
};

struct Remaining {
  std::uint64_t minute{0};
  std::uint64_t day{0};
};

class RateLimiter {
public:
  RateLimiter(RateLimiterConfig cfg, TimeSource &time);

  RateLimiter(const RateLimiter &) = delete;
  RateLimiter &operator=(const RateLimiter &) = delete;

  // Decides whether one upstream call may go out now. An Admit reserves a
  // slot in both windows.
  AdmissionDecision acquire();
  // Reports how the admitted call ended. A quota rejection fills the minute
  // window and raises the backoff floor.
  void record_outcome(bool success,
                      std::optional<Duration> retry_after = std::nullopt);

  Remaining remaining() const;
  RateLimiterStats stats() const;
  Duration last_backoff() const;
  std::optional<TimePoint> blocked_until() const;
  std::string info() const;
  const RateLimiterConfig &config() const { return cfg_; }

private:
  Duration next_backoff_locked();

  RateLimiterConfig cfg_;
  TimeSource &time_;
  mutable std::mutex mu_;
  RateWindow minute_;
  RateWindow day_;
  std::optional<TimePoint> blocked_until_;
  Duration last_backoff_{0};
  RateLimiterStats stats_;
  std::mt19937_64 rng_;
};

} // namespace quota_cache
