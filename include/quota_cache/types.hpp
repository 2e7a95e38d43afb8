#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace quota_cache {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;
using WallClock = std::chrono::system_clock;

using QueryParams = std::map<std::string, std::string>;

enum class TtlClass { Permanent, Long, Medium, Short, None };

const char *ttl_class_name(TtlClass c);

struct Fingerprint {
  std::string family;
  std::string canonical;
  std::string key;

  bool operator==(const Fingerprint &other) const { return key == other.key; }
};

struct CacheEntry {
  std::string key;
  std::string canonical;
  std::string payload;
  TtlClass ttl_class{TtlClass::Medium};
  TimePoint stored_at{};
  std::optional<TimePoint> expires_at;
  TimePoint last_access{};
  std::uint64_t hit_count{0};
};

// Slot held inside the cache map. Access metadata are atomics so that
// lookups can refresh them under a shared lock.
struct CacheSlot {
  CacheEntry entry;
  std::atomic<std::int64_t> last_access_ns{0};
  std::atomic<std::uint64_t> hit_count{0};
  std::uint64_t generation{0};
};

} // namespace quota_cache
