#include "status_cache/sweeper.hpp"

#include <exception>
#include <stdexcept>
#include <string>

namespace status_cache {

ExpirySweeper::ExpirySweeper(StatusCache &cache, Duration interval,
                             std::shared_ptr<Logger> logger)
    : cache_(cache), interval_(interval), logger_(std::move(logger)) {
  if (interval_ <= Duration::zero())
    throw std::invalid_argument("sweep interval must be positive");
  thread_ = std::thread([this] { run(); });
}

ExpirySweeper::~ExpirySweeper() { stop(); }

void ExpirySweeper::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable())
    thread_.join();
}

void ExpirySweeper::run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!cv_.wait_for(lock, interval_, [this] { return stopping_; })) {
    lock.unlock();
    try {
      const auto n = cache_.tick();
      swept_ += n;
      if (n > 0 && logger_)
        logger_->debug("sweeper expired " + std::to_string(n) + " entries");
    } catch (const std::exception &e) {
      if (logger_)
        logger_->error(std::string("sweeper tick failed: ") + e.what());
    }
    ++runs_;
    lock.lock();
  }
}

} // namespace status_cache
