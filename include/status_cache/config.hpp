#pragma once

#include "status_cache/types.hpp"

#include <cstddef>
#include <string>

namespace status_cache {

struct CacheConfig {
  std::size_t capacity{1024};
  Duration ttl{5000};
  std::size_t ttl_cleanup_per_tick{128};
  bool touch_on_query{false};
  std::string policy{"lru"};
  std::string log_level{"info"};
};

// Overlays the keys found in a flat JSON object onto cfg. On failure cfg is
// left untouched and err (if given) describes the problem.
bool load_config(const std::string &path, CacheConfig &cfg,
                 std::string *err = nullptr);

} // namespace status_cache
