#pragma once

#include "status_cache/status_cache.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace status_cache {

// Background thread that calls StatusCache::tick() every interval. The cache
// must outlive the sweeper.
class ExpirySweeper {
public:
  ExpirySweeper(StatusCache &cache, Duration interval,
                std::shared_ptr<Logger> logger = nullptr);
  ~ExpirySweeper();

  ExpirySweeper(const ExpirySweeper &) = delete;
  ExpirySweeper &operator=(const ExpirySweeper &) = delete;

  void stop();
  std::uint64_t runs() const { return runs_.load(); }
  std::uint64_t swept() const { return swept_.load(); }

private:
  void run();

  StatusCache &cache_;
  Duration interval_;
  std::shared_ptr<Logger> logger_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool stopping_{false};
  std::atomic<std::uint64_t> runs_{0};
  std::atomic<std::uint64_t> swept_{0};
  std::thread thread_;
};

} // namespace status_cache
