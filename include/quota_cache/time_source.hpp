#pragma once

#include "quota_cache/types.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>

namespace quota_cache {

class CancellationSource;

// Copyable view of a cancellation flag. A default-constructed token is never
// cancelled.
class CancellationToken {
public:
  CancellationToken() = default;

  bool cancelled() const;
  // Blocks for up to `d`. Returns false if the token was (or became)
  // cancelled, true if the full duration elapsed.
  bool sleep_for(Duration d) const;

private:
  friend class CancellationSource;
  struct State {
    mutable std::mutex mu;
    std::condition_variable cv;
    bool cancelled{false};
  };
  explicit CancellationToken(std::shared_ptr<State> state)
      : state_(std::move(state)) {}

  std::shared_ptr<State> state_;
};

class CancellationSource {
public:
  CancellationSource();

  CancellationToken token() const { return CancellationToken(state_); }
  void cancel();
  bool cancelled() const;

private:
  std::shared_ptr<CancellationToken::State> state_;
};

class TimeSource {
public:
  virtual ~TimeSource() = default;
  virtual TimePoint now() const = 0;
  virtual WallClock::time_point wall_now() const = 0;
  // Suspends the caller for `d` unless `token` is cancelled first.
  // Returns false when the wait was cut short by cancellation.
  virtual bool wait_for(Duration d, const CancellationToken &token) = 0;
};

class SystemTimeSource final : public TimeSource {
public:
  TimePoint now() const override { return Clock::now(); }
  WallClock::time_point wall_now() const override { return WallClock::now(); }
  bool wait_for(Duration d, const CancellationToken &token) override;
};

// Simulated clock: waits advance time instantly. Used by tests and the
// replay bench so that minute and day windows can be exercised quickly.
class ManualTimeSource final : public TimeSource {
public:
  explicit ManualTimeSource(TimePoint start = TimePoint{} + std::chrono::hours(1));

  TimePoint now() const override;
  WallClock::time_point wall_now() const override;
  bool wait_for(Duration d, const CancellationToken &token) override;

  void advance(Duration d);
  void set(TimePoint t);
  std::uint64_t waits() const { return waits_.load(); }

private:
  TimePoint start_;
  WallClock::time_point wall_start_;
  std::atomic<std::int64_t> offset_ns_{0};
  std::atomic<std::uint64_t> waits_{0};
};

} // namespace quota_cache
