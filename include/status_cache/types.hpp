#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace status_cache {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;
using NowFn = std::function<TimePoint()>;

enum class Status : std::uint8_t {
  NeedsAttention,
  WorkingNormally,
  Unreachable,
  Enabled,
  Disabled,
};

inline constexpr std::size_t kStatusCount = 5;

const std::array<Status, kStatusCount> &all_statuses();
bool is_valid_status(Status status);

// Canonical upper-snake name, e.g. "NEEDS_ATTENTION". Throws
// std::invalid_argument for a value outside the enumeration.
const char *status_name(Status status);

// Case-insensitive inverse of status_name().
std::optional<Status> parse_status(const std::string &name);

struct Entry {
  std::string id;
  Status status{Status::WorkingNormally};
  TimePoint last_updated{};
};

} // namespace status_cache
