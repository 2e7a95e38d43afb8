#include "quota_cache/rate_limiter.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace quota_cache {
namespace {
std::uint64_t live_count(const RateWindow &w, TimePoint now) {
  return static_cast<std::uint64_t>(
      std::count_if(w.occupied.begin(), w.occupied.end(),
                    [&](TimePoint t) { return t + w.span > now; }));
}

Duration ceil_ms(Clock::duration d) {
  auto ms = std::chrono::ceil<Duration>(d);
  return std::max(ms, Duration(1));
}
} // namespace

void RateWindow::prune(TimePoint now) {
  while (!occupied.empty() && occupied.front() + span <= now)
    occupied.pop_front();
}

TimePoint RateWindow::frees_at() const {
  if (occupied.empty())
    return TimePoint{};
  return occupied.front() + span;
}

RateLimiter::RateLimiter(RateLimiterConfig cfg, TimeSource &time)
    : cfg_(std::move(cfg)), time_(time), rng_(cfg_.rng_seed) {
  cfg_.calls_per_minute = std::max<std::uint64_t>(1, cfg_.calls_per_minute);
  cfg_.calls_per_day = std::max<std::uint64_t>(1, cfg_.calls_per_day);
  cfg_.jitter_ratio = std::clamp(cfg_.jitter_ratio, 0.0, 0.5);
  cfg_.backoff_base = std::max(cfg_.backoff_base, Duration(1));
  cfg_.backoff_max = std::max(cfg_.backoff_max, cfg_.backoff_base);
  cfg_.day_exhausted_hint =
      std::max<Duration>(cfg_.day_exhausted_hint, std::chrono::minutes(2));
  minute_.kind = WindowKind::Minute;
  minute_.limit = cfg_.calls_per_minute;
  minute_.span = std::chrono::minutes(1);
  day_.kind = WindowKind::Day;
  day_.limit = cfg_.calls_per_day;
  day_.span = std::chrono::hours(24);
}

AdmissionDecision RateLimiter::acquire() {
  std::lock_guard<std::mutex> lk(mu_);
  // Read the clock under the lock so window timestamps stay ordered.
  const auto now = time_.now();
  minute_.prune(now);
  day_.prune(now);

  if (blocked_until_.has_value()) {
    if (*blocked_until_ > now) {
      const auto wait = ceil_ms(*blocked_until_ - now);
      if (!day_.has_capacity() && wait > cfg_.max_wait) {
        ++stats_.rejections;
        return AdmissionDecision::reject("daily quota exhausted");
      }
      ++stats_.waits;
      return AdmissionDecision::wait_for(wait);
    }
    blocked_until_.reset();
  }

  if (minute_.has_capacity() && day_.has_capacity()) {
    minute_.occupied.push_back(now);
    day_.occupied.push_back(now);
    ++stats_.admitted;
    return AdmissionDecision::admit();
  }

  // Both windows must have room, so the caller waits for the later of the
  // two release instants.
  TimePoint free_at = now;
  if (!minute_.has_capacity())
    free_at = std::max(free_at, minute_.frees_at());
  if (!day_.has_capacity()) {
    free_at = std::max(free_at, day_.frees_at());
    if (free_at - now > cfg_.max_wait) {
      ++stats_.rejections;
      return AdmissionDecision::reject("daily quota exhausted");
    }
  }
  ++stats_.waits;
  return AdmissionDecision::wait_for(ceil_ms(free_at - now));
}

void RateLimiter::record_outcome(bool success,
                                 std::optional<Duration> retry_after) {
  std::lock_guard<std::mutex> lk(mu_);
  const auto now = time_.now();
  if (success) {
    stats_.consecutive_quota_errors = 0;
    return;
  }

  ++stats_.quota_errors;
  ++stats_.consecutive_quota_errors;

  // The upstream saw more calls than we did; treat the minute window as full.
  // Only a hint reaching the day-exhausted threshold also fills the day
  // window. Shorter hints act through blocked_until_ alone.
  const auto fill = [now](RateWindow &w) {
    w.prune(now);
    while (w.occupied.size() < w.limit)
      w.occupied.push_back(now);
  };
  fill(minute_);
  if (retry_after.has_value() && *retry_after >= cfg_.day_exhausted_hint)
    fill(day_);

  const Duration backoff = retry_after.has_value()
                             ? std::max(*retry_after, Duration::zero())
                             : next_backoff_locked();
  last_backoff_ = backoff;
  const auto until = now + backoff;
  if (!blocked_until_.has_value() || *blocked_until_ < until)
    blocked_until_ = until;
}

Duration RateLimiter::next_backoff_locked() {
  const auto n = std::min<std::uint64_t>(stats_.consecutive_quota_errors, 31);
  const double raw = static_cast<double>(cfg_.backoff_base.count()) *
                     std::ldexp(1.0, static_cast<int>(n) - 1);
  std::uniform_real_distribution<double> jitter(0.0, 1.0);
  const double jittered = raw + raw * cfg_.jitter_ratio * jitter(rng_);
  const double capped =
      std::min(jittered, static_cast<double>(cfg_.backoff_max.count()));
  return Duration(static_cast<Duration::rep>(capped));
}

Remaining RateLimiter::remaining() const {
  const auto now = time_.now();
  std::lock_guard<std::mutex> lk(mu_);
  Remaining r;
  const auto m = live_count(minute_, now);
  const auto d = live_count(day_, now);
  r.minute = minute_.limit > m ? minute_.limit - m : 0;
  r.day = day_.limit > d ? day_.limit - d : 0;
  return r;
}

RateLimiterStats RateLimiter::stats() const {
  std::lock_guard<std::mutex> lk(mu_);
  return stats_;
}

Duration RateLimiter::last_backoff() const {
  std::lock_guard<std::mutex> lk(mu_);
  return last_backoff_;
}

std::optional<TimePoint> RateLimiter::blocked_until() const {
  std::lock_guard<std::mutex> lk(mu_);
  return blocked_until_;
}

std::string RateLimiter::info() const {
  const auto r = remaining();
  const auto s = stats();
  std::ostringstream os;
  os << "limit_per_minute:" << cfg_.calls_per_minute << "\n";
  os << "limit_per_day:" << cfg_.calls_per_day << "\n";
  os << "remaining_minute:" << r.minute << "\n";
  os << "remaining_day:" << r.day << "\n";
  os << "admitted:" << s.admitted << "\n";
  os << "waits:" << s.waits << "\n";
  os << "rejections:" << s.rejections << "\n";
  os << "quota_errors:" << s.quota_errors << "\n";
  os << "last_backoff_ms:" << last_backoff().count() << "\n";
  return os.str();
}

} // namespace quota_cache
