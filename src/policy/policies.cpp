#include "status_cache/policy.hpp"

#include <iterator>
#include <random>

namespace status_cache {

bool EvictionView::expired(const std::string &id) const {
  auto it = freshness.find(id);
  if (it == freshness.end())
    return false;
  return now - it->second > ttl;
}

EvictionPolicy make_lru_policy() {
  return [](const EvictionView &view) -> std::optional<std::string> {
    if (view.recency.empty())
      return std::nullopt;
    return view.recency.front();
  };
}

EvictionPolicy make_ttl_first_policy() {
  return [](const EvictionView &view) -> std::optional<std::string> {
    if (view.recency.empty())
      return std::nullopt;
    for (const auto &id : view.recency) {
      if (view.expired(id))
        return id;
    }
    return view.recency.front();
  };
}

EvictionPolicy make_random_policy(std::uint64_t seed) {
  // Each copy of the returned function owns its generator.
  return [rng = std::mt19937_64(seed)](
             const EvictionView &view) mutable -> std::optional<std::string> {
    if (view.recency.empty())
      return std::nullopt;
    std::uniform_int_distribution<std::size_t> pick(0,
                                                    view.recency.size() - 1);
    auto it = view.recency.begin();
    std::advance(it, pick(rng));
    return *it;
  };
}

EvictionPolicy make_policy_by_name(const std::string &mode) {
  if (mode == "ttl_first")
    return make_ttl_first_policy();
  if (mode == "random")
    return make_random_policy();
  return make_lru_policy();
}

} // namespace status_cache
