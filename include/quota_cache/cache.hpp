#pragma once

#include "quota_cache/freshness.hpp"
#include "quota_cache/policy.hpp"
#include "quota_cache/time_source.hpp"

#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <queue>
#include <shared_mutex>
#include <string>
#include <vector>

namespace quota_cache {

struct CacheConfig {
  bool enabled{true};
  std::size_t max_entries{1000};
  std::size_t max_payload_bytes{4 * 1024 * 1024};
  TtlPolicy ttl{};
};

struct CacheStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t insertions{0};
  std::uint64_t evictions{0};
  std::uint64_t expirations{0};
  std::uint64_t collisions{0};
};

// Fingerprint-keyed result store. Lookups share a reader lock; stores,
// evictions and expirations take the writer lock.
class ResultCache {
public:
  ResultCache(CacheConfig cfg, TimeSource &time,
              std::unique_ptr<IEvictionPolicy> policy);

  ResultCache(const ResultCache &) = delete;
  ResultCache &operator=(const ResultCache &) = delete;

  // Absent when missing or expired. When the stored entry under the same key
  // belongs to a different canonical query, `*collision` is set and nothing
  // is returned.
  std::optional<CacheEntry> lookup(const Fingerprint &fp,
                                   bool *collision = nullptr);
  // Last write wins. Refuses TtlClass::None, oversized payloads and, when
  // disabled, everything.
  bool store(const Fingerprint &fp, const std::string &payload,
             TtlClass ttl_class, std::string *err = nullptr);
  bool invalidate(const Fingerprint &fp);
  std::size_t invalidate_family(const std::string &family);
  void clear();
  std::size_t
  purge_expired(std::size_t max_items = std::numeric_limits<std::size_t>::max());
  // Pending expiry nodes, stale ones included.
  std::size_t expiry_backlog() const;

  bool enabled() const { return cfg_.enabled; }
  std::size_t size() const;
  std::size_t max_entries() const { return cfg_.max_entries; }
  CacheStats stats() const;
  double hit_rate() const;
  std::string info() const;
  const TtlPolicy &ttl_policy() const { return cfg_.ttl; }
  std::string policy_name() const;
  void set_policy(std::unique_ptr<IEvictionPolicy> policy);

private:
  struct ExpiryNode {
    TimePoint deadline;
    std::string key;
    std::uint64_t generation;
    bool operator>(const ExpiryNode &other) const {
      return deadline > other.deadline;
    }
  };

  struct Counters {
    std::atomic<std::uint64_t> hits{0};
    std::atomic<std::uint64_t> misses{0};
    std::atomic<std::uint64_t> insertions{0};
    std::atomic<std::uint64_t> evictions{0};
    std::atomic<std::uint64_t> expirations{0};
    std::atomic<std::uint64_t> collisions{0};
  };

  static std::int64_t ticks(TimePoint t) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               t.time_since_epoch())
        .count();
  }
  static bool expired(const CacheEntry &e, TimePoint now) {
    return e.expires_at.has_value() && *e.expires_at <= now;
  }
  static constexpr std::size_t kStorePurgeBound = 8;
  static constexpr std::size_t kHeapSlack = 64;

  void erase_locked(SlotMap::iterator it, bool eviction, bool expiration);
  void evict_until_room_locked();
  std::size_t purge_expired_locked(TimePoint now, std::size_t max_items);
  void compact_expiry_heap_locked();

  CacheConfig cfg_;
  TimeSource &time_;
  std::unique_ptr<IEvictionPolicy> policy_;
  mutable std::shared_mutex mu_;
  SlotMap slots_;
  std::priority_queue<ExpiryNode, std::vector<ExpiryNode>,
                      std::greater<ExpiryNode>>
      expiry_heap_;
  std::uint64_t generation_{0};
  mutable Counters counters_;
};

} // namespace quota_cache
