#include "status_cache/status_cache.hpp"

#include <exception>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace status_cache {
namespace {
void require_valid(Status status) {
  if (!is_valid_status(status))
    throw std::invalid_argument(
        "unknown status value " +
        std::to_string(static_cast<unsigned>(status)));
}

std::size_t index_of(Status status) { return static_cast<std::size_t>(status); }

// make_policy_by_name() maps unknown modes to LRU.
std::string builtin_policy_name(const std::string &mode) {
  if (mode == "ttl_first" || mode == "random")
    return mode;
  return "lru";
}
} // namespace

StatusCache::StatusCache(CacheConfig cfg, EvictionPolicy policy, NowFn now)
    : cfg_(std::move(cfg)), policy_(std::move(policy)), now_(std::move(now)) {
  if (cfg_.capacity == 0)
    throw std::invalid_argument("capacity must be positive");
  if (cfg_.ttl <= Duration::zero())
    throw std::invalid_argument("ttl must be positive");
  if (policy_) {
    policy_name_ = "custom";
  } else {
    policy_ = make_policy_by_name(cfg_.policy);
    policy_name_ = builtin_policy_name(cfg_.policy);
  }
  if (!now_)
    now_ = [] { return Clock::now(); };
}

void StatusCache::update(const std::string &id, Status status) {
  require_valid(status);
  std::lock_guard<std::mutex> lock(mutex_);
  ++stats_.updates;

  auto it = placement_.find(id);
  if (it == placement_.end()) {
    recency_.push_back(id);
    placement_.emplace(id, Placement{status, std::prev(recency_.end())});
  } else {
    if (it->second.status != status) {
      membership_[index_of(it->second.status)].erase(id);
      it->second.status = status;
    }
    recency_.splice(recency_.end(), recency_, it->second.recency_pos);
  }
  membership_[index_of(status)].insert(id);
  freshness_[id] = now_();

  evict_until_fit_locked();
}

std::vector<std::string> StatusCache::query_by_status(Status status) {
  require_valid(status);
  std::lock_guard<std::mutex> lock(mutex_);
  ++stats_.queries;

  const auto now = now_();
  std::vector<std::string> live;
  std::vector<std::string> stale;
  for (const auto &id : membership_[index_of(status)]) {
    if (expired_locked(id, now))
      stale.push_back(id);
    else
      live.push_back(id);
  }

  for (const auto &id : stale) {
    erase_locked(id);
    ++stats_.expirations;
    if (logger_ && logger_->enabled(LogLevel::Debug))
      logger_->debug("expired " + id + " from " + status_name(status));
  }
  if (cfg_.touch_on_query) {
    for (const auto &id : live)
      touch_locked(id);
  }
  return live;
}

bool StatusCache::remove(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!placement_.contains(id))
    return false;
  erase_locked(id);
  ++stats_.removals;
  return true;
}

std::optional<Status> StatusCache::status_of(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = placement_.find(id);
  if (it == placement_.end())
    return std::nullopt;
  if (expired_locked(id, now_())) {
    erase_locked(id);
    ++stats_.expirations;
    return std::nullopt;
  }
  const Status status = it->second.status;
  if (cfg_.touch_on_query)
    touch_locked(id);
  return status;
}

std::size_t StatusCache::tick() {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = now_();
  std::size_t cleaned = 0;
  auto it = recency_.begin();
  while (it != recency_.end() && cleaned < cfg_.ttl_cleanup_per_tick) {
    const std::string id = *it;
    ++it;
    if (!expired_locked(id, now)) {
      // Without read-driven touches recency order is update order.
      if (!cfg_.touch_on_query)
        break;
      continue;
    }
    erase_locked(id);
    ++stats_.expirations;
    ++cleaned;
  }
  if (cleaned > 0 && logger_ && logger_->enabled(LogLevel::Debug))
    logger_->debug("tick expired " + std::to_string(cleaned) + " entries");
  return cleaned;
}

void StatusCache::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &bucket : membership_)
    bucket.clear();
  freshness_.clear();
  recency_.clear();
  placement_.clear();
}

std::size_t StatusCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return placement_.size();
}

std::size_t StatusCache::bucket_size(Status status) const {
  require_valid(status);
  std::lock_guard<std::mutex> lock(mutex_);
  return membership_[index_of(status)].size();
}

std::vector<std::string> StatusCache::recency_order() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<std::string>(recency_.begin(), recency_.end());
}

std::vector<Entry> StatusCache::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Entry> out;
  out.reserve(recency_.size());
  for (const auto &id : recency_)
    out.push_back({id, placement_.at(id).status, freshness_.at(id)});
  return out;
}

CacheStats StatusCache::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

std::string StatusCache::info() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::ostringstream os;
  os << "policy_mode:" << policy_name_ << "\n";
  os << "capacity:" << cfg_.capacity << "\n";
  os << "ttl_ms:" << cfg_.ttl.count() << "\n";
  os << "keys:" << placement_.size() << "\n";
  for (const auto status : all_statuses())
    os << "bucket_" << status_name(status) << ":"
       << membership_[index_of(status)].size() << "\n";
  os << "updates:" << stats_.updates << "\n";
  os << "queries:" << stats_.queries << "\n";
  os << "removals:" << stats_.removals << "\n";
  os << "evictions:" << stats_.evictions << "\n";
  os << "expirations:" << stats_.expirations << "\n";
  return os.str();
}

void StatusCache::set_policy(EvictionPolicy policy) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (policy) {
    policy_ = std::move(policy);
    policy_name_ = "custom";
  } else {
    policy_ = make_policy_by_name(cfg_.policy);
    policy_name_ = builtin_policy_name(cfg_.policy);
  }
}

void StatusCache::set_logger(std::shared_ptr<Logger> logger) {
  std::lock_guard<std::mutex> lock(mutex_);
  logger_ = std::move(logger);
}

bool StatusCache::expired_locked(const std::string &id, TimePoint now) const {
  auto it = freshness_.find(id);
  if (it == freshness_.end())
    return false;
  return now - it->second > cfg_.ttl;
}

void StatusCache::touch_locked(const std::string &id) {
  auto it = placement_.find(id);
  if (it == placement_.end())
    return;
  recency_.splice(recency_.end(), recency_, it->second.recency_pos);
}

void StatusCache::erase_locked(const std::string &id) {
  auto it = placement_.find(id);
  if (it == placement_.end())
    return;
  membership_[index_of(it->second.status)].erase(id);
  recency_.erase(it->second.recency_pos);
  freshness_.erase(id);
  placement_.erase(it);
}

void StatusCache::evict_until_fit_locked() {
  while (placement_.size() > cfg_.capacity) {
    EvictionView view{recency_, freshness_, cfg_.capacity, now_(), cfg_.ttl};
    std::optional<std::string> victim;
    try {
      victim = policy_(view);
    } catch (const std::exception &e) {
      if (logger_)
        logger_->warn(std::string("eviction policy failed: ") + e.what());
    }
    if (!victim.has_value() || !placement_.contains(*victim)) {
      if (logger_)
        logger_->warn("eviction policy returned no live victim, evicting "
                      "least recently used");
      victim = recency_.front();
    }
    if (logger_ && logger_->enabled(LogLevel::Debug))
      logger_->debug("evicted " + *victim);
    erase_locked(*victim);
    ++stats_.evictions;
  }
}

} // namespace status_cache
