#include "status_cache/config.hpp"
#include "status_cache/logger.hpp"

#include <algorithm>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace status_cache {
namespace {
bool extract_i64(const std::string &text, const std::string &key,
                 std::int64_t &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*(-?[0-9]+)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = static_cast<std::int64_t>(std::stoll(m[1].str()));
  return true;
}
bool extract_bool(const std::string &text, const std::string &key,
                  bool &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*(true|false)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str() == "true";
  return true;
}
bool extract_string(const std::string &text, const std::string &key,
                    std::string &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str();
  return true;
}
} // namespace

bool load_config(const std::string &path, CacheConfig &cfg, std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "config file not found: " + path;
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  const std::string text = ss.str();
  const auto open = text.find('{');
  const auto close = text.rfind('}');
  if (open == std::string::npos || close == std::string::npos ||
      close < open) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  CacheConfig c = cfg;
  constexpr std::int64_t kDayMs = 24LL * 60 * 60 * 1000;

  std::int64_t n;
  bool b;
  std::string s;
  try {
    if (extract_i64(text, "capacity", n))
      c.capacity = static_cast<std::size_t>(
          std::clamp<std::int64_t>(n, 1, 100000000));
    if (extract_i64(text, "ttl_ms", n))
      c.ttl = Duration(std::clamp<std::int64_t>(n, 1, kDayMs));
    if (extract_i64(text, "ttl_cleanup_per_tick", n))
      c.ttl_cleanup_per_tick = static_cast<std::size_t>(
          std::clamp<std::int64_t>(n, 1, 1000000));
  } catch (const std::out_of_range &) {
    if (err)
      *err = "numeric value out of range";
    return false;
  }
  if (extract_bool(text, "touch_on_query", b))
    c.touch_on_query = b;
  if (extract_string(text, "policy", s)) {
    if (s != "lru" && s != "ttl_first" && s != "random") {
      if (err)
        *err = "unknown policy: " + s;
      return false;
    }
    c.policy = s;
  }
  if (extract_string(text, "log_level", s)) {
    if (!parse_log_level(s).has_value()) {
      if (err)
        *err = "unknown log_level: " + s;
      return false;
    }
    c.log_level = s;
  }

  cfg = c;
  return true;
}

} // namespace status_cache
