#include "quota_cache/policy.hpp"

#include <tuple>

namespace quota_cache {
namespace {

bool is_permanent(const CacheSlot &s) {
  return s.entry.ttl_class == TtlClass::Permanent;
}

class LruPolicy final : public IEvictionPolicy {
public:
  std::string name() const override { return "lru"; }
  std::optional<std::string> pick_victim(const SlotMap &slots) override {
    if (slots.empty()) return std::nullopt;
    auto victim = slots.end();
    for (auto it = slots.begin(); it != slots.end(); ++it) {
      if (victim == slots.end() || older(*it, *victim)) victim = it;
    }
    return victim->first;
  }
private:
  // Orders by (permanent, last access, key): a non-permanent entry is always
  // dropped before any permanent one.
  static bool older(const SlotMap::value_type& a, const SlotMap::value_type& b) {
    return std::make_tuple(is_permanent(a.second), a.second.last_access_ns.load(), a.first) <
           std::make_tuple(is_permanent(b.second), b.second.last_access_ns.load(), b.first);
  }
};

class LfuPolicy final : public IEvictionPolicy {
public:
  std::string name() const override { return "lfu"; }
  std::optional<std::string> pick_victim(const SlotMap &slots) override {
    if (slots.empty()) return std::nullopt;
    auto victim = slots.end();
    for (auto it = slots.begin(); it != slots.end(); ++it) {
      if (victim == slots.end() || colder(*it, *victim)) victim = it;
    }
    return victim->first;
  }
private:
  static bool colder(const SlotMap::value_type& a, const SlotMap::value_type& b) {
    return std::make_tuple(is_permanent(a.second), a.second.hit_count.load(),
                           a.second.last_access_ns.load(), a.first) <
           std::make_tuple(is_permanent(b.second), b.second.hit_count.load(),
                           b.second.last_access_ns.load(), b.first);
  }
};

} // namespace

std::unique_ptr<IEvictionPolicy> make_policy_by_name(const std::string& mode) {
  if (mode == "lfu") return std::make_unique<LfuPolicy>();
  return std::make_unique<LruPolicy>();
}

} // namespace quota_cache
