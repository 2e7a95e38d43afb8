#include "quota_cache/time_source.hpp"

#include <thread>

namespace quota_cache {

bool CancellationToken::cancelled() const {
  if (!state_)
    return false;
  std::lock_guard<std::mutex> lk(state_->mu);
  return state_->cancelled;
}

bool CancellationToken::sleep_for(Duration d) const {
  if (!state_) {
    std::this_thread::sleep_for(d);
    return true;
  }
  std::unique_lock<std::mutex> lk(state_->mu);
  return !state_->cv.wait_for(lk, d, [this] { return state_->cancelled; });
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<CancellationToken::State>()) {}

void CancellationSource::cancel() {
  {
    std::lock_guard<std::mutex> lk(state_->mu);
    state_->cancelled = true;
  }
  state_->cv.notify_all();
}

bool CancellationSource::cancelled() const {
  std::lock_guard<std::mutex> lk(state_->mu);
  return state_->cancelled;
}

bool SystemTimeSource::wait_for(Duration d, const CancellationToken &token) {
  if (d <= Duration::zero())
    return !token.cancelled();
  return token.sleep_for(d);
}

ManualTimeSource::ManualTimeSource(TimePoint start)
    : start_(start), wall_start_(WallClock::now()) {}

TimePoint ManualTimeSource::now() const {
  return start_ + std::chrono::nanoseconds(offset_ns_.load());
}

WallClock::time_point ManualTimeSource::wall_now() const {
  return wall_start_ + std::chrono::duration_cast<WallClock::duration>(
                           std::chrono::nanoseconds(offset_ns_.load()));
}

bool ManualTimeSource::wait_for(Duration d, const CancellationToken &token) {
  ++waits_;
  if (token.cancelled())
    return false;
  if (d > Duration::zero())
    advance(d);
  return !token.cancelled();
}

void ManualTimeSource::advance(Duration d) {
  offset_ns_ += std::chrono::duration_cast<std::chrono::nanoseconds>(d).count();
}

void ManualTimeSource::set(TimePoint t) {
  offset_ns_ = std::chrono::duration_cast<std::chrono::nanoseconds>(t - start_)
                   .count();
}

} // namespace quota_cache
