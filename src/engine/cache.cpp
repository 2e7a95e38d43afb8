#include "quota_cache/cache.hpp"

#include <algorithm>
#include <mutex>
#include <sstream>

namespace quota_cache {

ResultCache::ResultCache(CacheConfig cfg, TimeSource &time,
                         std::unique_ptr<IEvictionPolicy> policy)
    : cfg_(std::move(cfg)), time_(time), policy_(std::move(policy)) {
  if (!policy_)
    policy_ = make_policy_by_name("lru");
  if (cfg_.max_entries == 0)
    cfg_.max_entries = 1;
}

std::optional<CacheEntry> ResultCache::lookup(const Fingerprint &fp,
                                              bool *collision) {
  if (collision)
    *collision = false;
  const auto now = time_.now();
  std::uint64_t seen_generation = 0;
  {
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = slots_.find(fp.key);
    if (it == slots_.end()) {
      ++counters_.misses;
      return std::nullopt;
    }
    auto &slot = it->second;
    if (slot.entry.canonical != fp.canonical) {
      ++counters_.collisions;
      if (collision)
        *collision = true;
      return std::nullopt;
    }
    if (!expired(slot.entry, now)) {
      slot.last_access_ns = ticks(now);
      const auto hits = ++slot.hit_count;
      ++counters_.hits;
      CacheEntry out = slot.entry;
      out.last_access = now;
      out.hit_count = hits;
      return out;
    }
    seen_generation = slot.generation;
  }

  // Lazy expiry: upgrade to the writer lock and drop the stale entry unless
  // it was replaced in the meantime.
  std::unique_lock<std::shared_mutex> lk(mu_);
  auto it = slots_.find(fp.key);
  if (it != slots_.end() && it->second.generation == seen_generation &&
      expired(it->second.entry, now))
    erase_locked(it, false, true);
  ++counters_.misses;
  return std::nullopt;
}

bool ResultCache::store(const Fingerprint &fp, const std::string &payload,
                        TtlClass ttl_class, std::string *err) {
  if (!cfg_.enabled) {
    if (err)
      *err = "cache disabled";
    return false;
  }
  if (ttl_class == TtlClass::None) {
    if (err)
      *err = "ttl class none is not cacheable";
    return false;
  }
  if (fp.key.empty()) {
    if (err)
      *err = "empty fingerprint";
    return false;
  }
  if (payload.size() > cfg_.max_payload_bytes) {
    if (err)
      *err = "payload too large";
    return false;
  }

  const auto now = time_.now();
  std::unique_lock<std::shared_mutex> lk(mu_);
  // Writes drain a few due expirations, so the heap and stale slots stay
  // bounded without a background sweeper.
  purge_expired_locked(now, kStorePurgeBound);
  auto it = slots_.find(fp.key);
  if (it != slots_.end() && it->second.entry.canonical != fp.canonical) {
    ++counters_.collisions;
    if (err)
      *err = "fingerprint collision: " + fp.key;
    return false;
  }
  if (it == slots_.end()) {
    evict_until_room_locked();
    it = slots_.try_emplace(fp.key).first;
  }

  auto &slot = it->second;
  slot.entry.key = fp.key;
  slot.entry.canonical = fp.canonical;
  slot.entry.payload = payload;
  slot.entry.ttl_class = ttl_class;
  slot.entry.stored_at = now;
  slot.entry.last_access = now;
  slot.entry.hit_count = 0;
  slot.entry.expires_at.reset();
  if (auto ttl = cfg_.ttl.ttl_for(ttl_class))
    slot.entry.expires_at = now + *ttl;
  slot.last_access_ns = ticks(now);
  slot.hit_count = 0;
  slot.generation = ++generation_;
  if (slot.entry.expires_at.has_value()) {
    expiry_heap_.push({*slot.entry.expires_at, fp.key, slot.generation});
    if (expiry_heap_.size() > 2 * slots_.size() + kHeapSlack)
      compact_expiry_heap_locked();
  }
  ++counters_.insertions;
  return true;
}

bool ResultCache::invalidate(const Fingerprint &fp) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  auto it = slots_.find(fp.key);
  if (it == slots_.end() || it->second.entry.canonical != fp.canonical)
    return false;
  erase_locked(it, false, false);
  return true;
}

std::size_t ResultCache::invalidate_family(const std::string &family) {
  const std::string prefix = family + ":";
  std::unique_lock<std::shared_mutex> lk(mu_);
  std::size_t removed = 0;
  for (auto it = slots_.begin(); it != slots_.end();) {
    auto next = std::next(it);
    if (it->first.compare(0, prefix.size(), prefix) == 0) {
      erase_locked(it, false, false);
      ++removed;
    }
    it = next;
  }
  return removed;
}

void ResultCache::clear() {
  std::unique_lock<std::shared_mutex> lk(mu_);
  slots_.clear();
  expiry_heap_ = {};
}

std::size_t ResultCache::purge_expired(std::size_t max_items) {
  const auto now = time_.now();
  std::unique_lock<std::shared_mutex> lk(mu_);
  return purge_expired_locked(now, max_items);
}

std::size_t ResultCache::expiry_backlog() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return expiry_heap_.size();
}

std::size_t ResultCache::purge_expired_locked(TimePoint now,
                                              std::size_t max_items) {
  std::size_t purged = 0;
  while (!expiry_heap_.empty() && purged < max_items) {
    const auto &node = expiry_heap_.top();
    if (node.deadline > now)
      break;
    const auto key = node.key;
    const auto gen = node.generation;
    expiry_heap_.pop();
    auto it = slots_.find(key);
    if (it == slots_.end() || it->second.generation != gen)
      continue;
    if (!expired(it->second.entry, now))
      continue;
    erase_locked(it, false, true);
    ++purged;
  }
  return purged;
}

std::size_t ResultCache::size() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return slots_.size();
}

CacheStats ResultCache::stats() const {
  CacheStats s;
  s.hits = counters_.hits.load();
  s.misses = counters_.misses.load();
  s.insertions = counters_.insertions.load();
  s.evictions = counters_.evictions.load();
  s.expirations = counters_.expirations.load();
  s.collisions = counters_.collisions.load();
  return s;
}

double ResultCache::hit_rate() const {
  const auto s = stats();
  const auto total = s.hits + s.misses;
  if (total == 0)
    return 0.0;
  return static_cast<double>(s.hits) / static_cast<double>(total);
}

std::string ResultCache::info() const {
  const auto s = stats();
  std::shared_lock<std::shared_mutex> lk(mu_);
  std::ostringstream os;
  os << "cache_enabled:" << (cfg_.enabled ? 1 : 0) << "\n";
  os << "cache_policy:" << policy_->name() << "\n";
  os << "cache_keys:" << slots_.size() << "\n";
  os << "cache_max_entries:" << cfg_.max_entries << "\n";
  os << "cache_hits:" << s.hits << "\n";
  os << "cache_misses:" << s.misses << "\n";
  os << "cache_insertions:" << s.insertions << "\n";
  os << "cache_evictions:" << s.evictions << "\n";
  os << "cache_expirations:" << s.expirations << "\n";
  os << "cache_collisions:" << s.collisions << "\n";

  std::size_t permanent = 0;
  std::vector<std::pair<std::string, std::uint64_t>> counts;
  counts.reserve(slots_.size());
  for (const auto &[k, slot] : slots_) {
    if (slot.entry.ttl_class == TtlClass::Permanent)
      ++permanent;
    counts.emplace_back(k, slot.hit_count.load());
  }
  os << "cache_permanent_keys:" << permanent << "\n";
  std::sort(counts.begin(), counts.end(), [](const auto &a, const auto &b) {
    if (a.second == b.second)
      return a.first < b.first;
    return a.second > b.second;
  });
  os << "topk_hits:";
  for (std::size_t i = 0; i < std::min<std::size_t>(5, counts.size()); ++i) {
    if (i)
      os << ",";
    os << counts[i].first << ":" << counts[i].second;
  }
  os << "\n";
  return os.str();
}

std::string ResultCache::policy_name() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return policy_->name();
}

void ResultCache::set_policy(std::unique_ptr<IEvictionPolicy> policy) {
  if (!policy)
    return;
  std::unique_lock<std::shared_mutex> lk(mu_);
  policy_ = std::move(policy);
}

void ResultCache::erase_locked(SlotMap::iterator it, bool eviction,
                               bool expiration) {
  slots_.erase(it);
  if (eviction)
    ++counters_.evictions;
  if (expiration)
    ++counters_.expirations;
}

// Rebuilds the heap from live slots, dropping nodes of overwritten or erased
// entries.
void ResultCache::compact_expiry_heap_locked() {
  std::vector<ExpiryNode> live;
  live.reserve(slots_.size());
  for (const auto &[k, slot] : slots_) {
    if (slot.entry.expires_at.has_value())
      live.push_back({*slot.entry.expires_at, k, slot.generation});
  }
  expiry_heap_ = decltype(expiry_heap_)(std::greater<ExpiryNode>(),
                                        std::move(live));
}

void ResultCache::evict_until_room_locked() {
  std::size_t safety = slots_.size() + 1;
  while (slots_.size() >= cfg_.max_entries && safety-- > 0) {
    auto victim = policy_->pick_victim(slots_);
    if (!victim.has_value())
      break;
    auto it = slots_.find(*victim);
    if (it == slots_.end())
      break;
    erase_locked(it, true, false);
  }
}

} // namespace quota_cache
