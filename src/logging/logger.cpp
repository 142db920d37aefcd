#include "status_cache/logger.hpp"

#include <algorithm>
#include <cctype>

namespace status_cache {

std::optional<LogLevel> parse_log_level(const std::string &name) {
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (s == "debug")
    return LogLevel::Debug;
  if (s == "info")
    return LogLevel::Info;
  if (s == "warn" || s == "warning")
    return LogLevel::Warn;
  if (s == "error")
    return LogLevel::Error;
  return std::nullopt;
}

Logger::Logger(LogLevel level, std::ostream &out) : level_(level), out_(out) {}

void Logger::debug(const std::string &message) {
  write(LogLevel::Debug, "[DEBUG] ", message);
}

void Logger::info(const std::string &message) {
  write(LogLevel::Info, "[INFO] ", message);
}

void Logger::warn(const std::string &message) {
  write(LogLevel::Warn, "[WARN] ", message);
}

void Logger::error(const std::string &message) {
  write(LogLevel::Error, "[ERROR] ", message);
}

void Logger::write(LogLevel level, const char *prefix,
                   const std::string &message) {
  if (!enabled(level))
    return;
  std::lock_guard<std::mutex> lock(out_mutex_);
  out_ << prefix << message << '\n';
}

} // namespace status_cache
