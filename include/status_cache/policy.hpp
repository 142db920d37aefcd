#pragma once

#include "status_cache/types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <optional>
#include <string>
#include <unordered_map>

namespace status_cache {

// Read-only view handed to an eviction policy while the cache lock is held.
// recency.front() is the least recently used id.
struct EvictionView {
  const std::list<std::string> &recency;
  const std::unordered_map<std::string, TimePoint> &freshness;
  std::size_t capacity;
  TimePoint now;
  Duration ttl;

  bool expired(const std::string &id) const;
};

// Names the next id to evict. The cache removes the victim from every view
// and calls again while it is over capacity.
using EvictionPolicy =
    std::function<std::optional<std::string>(const EvictionView &)>;

EvictionPolicy make_lru_policy();
EvictionPolicy make_ttl_first_policy();
EvictionPolicy make_random_policy(std::uint64_t seed = 42);

// "lru", "ttl_first" or "random"; anything else yields LRU.
EvictionPolicy make_policy_by_name(const std::string &mode);

} // namespace status_cache
