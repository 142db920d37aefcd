#include "status_cache/types.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace status_cache {
namespace {
constexpr std::array<const char *, kStatusCount> kNames = {
    "NEEDS_ATTENTION", "WORKING_NORMALLY", "UNREACHABLE", "ENABLED",
    "DISABLED"};

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}
} // namespace

const std::array<Status, kStatusCount> &all_statuses() {
  static const std::array<Status, kStatusCount> statuses = {
      Status::NeedsAttention, Status::WorkingNormally, Status::Unreachable,
      Status::Enabled, Status::Disabled};
  return statuses;
}

bool is_valid_status(Status status) {
  return static_cast<std::size_t>(status) < kStatusCount;
}

const char *status_name(Status status) {
  if (!is_valid_status(status))
    throw std::invalid_argument(
        "unknown status value " +
        std::to_string(static_cast<unsigned>(status)));
  return kNames[static_cast<std::size_t>(status)];
}

std::optional<Status> parse_status(const std::string &name) {
  const std::string wanted = upper(name);
  for (std::size_t i = 0; i < kNames.size(); ++i) {
    if (wanted == kNames[i])
      return all_statuses()[i];
  }
  return std::nullopt;
}

} // namespace status_cache
