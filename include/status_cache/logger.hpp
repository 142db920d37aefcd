#pragma once

#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace status_cache {

enum class LogLevel { Debug, Info, Warn, Error };

std::optional<LogLevel> parse_log_level(const std::string &name);

class Logger {
public:
  explicit Logger(LogLevel level = LogLevel::Info, std::ostream &out = std::clog);

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  void debug(const std::string &message);
  void info(const std::string &message);
  void warn(const std::string &message);
  void error(const std::string &message);

  LogLevel level() const { return level_; }
  bool enabled(LogLevel level) const { return level >= level_; }

private:
  void write(LogLevel level, const char *prefix, const std::string &message);

  LogLevel level_;
  std::ostream &out_;
  std::mutex out_mutex_;
};

} // namespace status_cache
