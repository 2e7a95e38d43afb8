#pragma once

#include "quota_cache/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace quota_cache {

using SlotMap = std::unordered_map<std::string, CacheSlot>;

class IEvictionPolicy {
public:
  virtual ~IEvictionPolicy() = default;
  virtual std::string name() const = 0;
  // Chooses the entry to drop when the cache is at its entry ceiling.
  // Non-permanent entries are preferred over permanent ones.
  virtual std::optional<std::string> pick_victim(const SlotMap &slots) = 0;
};

std::unique_ptr<IEvictionPolicy> make_policy_by_name(const std::string &mode);

} // namespace quota_cache
