#pragma once

#include "status_cache/config.hpp"
#include "status_cache/logger.hpp"
#include "status_cache/policy.hpp"

#include <array>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace status_cache {

struct CacheStats {
  std::uint64_t updates{0};
  std::uint64_t queries{0};
  std::uint64_t removals{0};
  std::uint64_t evictions{0};
  std::uint64_t expirations{0};
};

// Thread-safe id -> status store indexed by status, bounded by capacity
// (evicted synchronously on update) and by ttl (expired lazily on read).
//
// Every public member takes the same mutex, so the membership, freshness and
// recency views are never observed out of step with each other.
class StatusCache {
public:
  // An empty policy selects make_policy_by_name(cfg.policy). Throws
  // std::invalid_argument when capacity is zero or ttl is not positive.
  explicit StatusCache(CacheConfig cfg, EvictionPolicy policy = {},
                       NowFn now = {});

  StatusCache(const StatusCache &) = delete;
  StatusCache &operator=(const StatusCache &) = delete;

  // Throws std::invalid_argument for a status outside the enumeration.
  void update(const std::string &id, Status status);

  // Live members of status in lexicographic order. Expired members found in
  // the bucket are removed from the cache.
  std::vector<std::string> query_by_status(Status status);

  // Returns whether id was present.
  bool remove(const std::string &id);

  std::optional<Status> status_of(const std::string &id);

  // Removes up to ttl_cleanup_per_tick expired entries.
  std::size_t tick();

  void clear();

  std::size_t size() const;
  std::size_t bucket_size(Status status) const;
  std::vector<std::string> recency_order() const;
  std::vector<Entry> snapshot() const;
  CacheStats stats() const;
  std::string info() const;

  const CacheConfig &config() const { return cfg_; }
  // An empty policy restores make_policy_by_name(config().policy).
  void set_policy(EvictionPolicy policy);
  void set_logger(std::shared_ptr<Logger> logger);

private:
  struct Placement {
    Status status;
    std::list<std::string>::iterator recency_pos;
  };

  bool expired_locked(const std::string &id, TimePoint now) const;
  void touch_locked(const std::string &id);
  void erase_locked(const std::string &id);
  void evict_until_fit_locked();

  CacheConfig cfg_;
  EvictionPolicy policy_;
  std::string policy_name_;
  NowFn now_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  std::array<std::set<std::string>, kStatusCount> membership_;
  std::unordered_map<std::string, TimePoint> freshness_;
  std::list<std::string> recency_;
  std::unordered_map<std::string, Placement> placement_;
  CacheStats stats_;
};

} // namespace status_cache
