#include "sweeper.hpp"
#include "util/log.hpp"
#include <stdexcept>

namespace RedisLite {

Sweeper::Sweeper(ConcurrentStore &store, std::chrono::milliseconds interval)
    : store_(store), interval_(interval) {
  if (interval_.count() <= 0) {
    throw std::invalid_argument("sweep interval must be positive");
  }
}

Sweeper::~Sweeper() { stop(); }

void Sweeper::start() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mtx_);
  if (worker_.joinable()) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mtx_);
    stop_requested_ = false;
  }
  worker_ = std::thread([this]() { run(); });
}

// lifecycle_mtx_ stays held until the old worker has exited.
void Sweeper::stop() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mtx_);
  {
    std::lock_guard<std::mutex> lock(mtx_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

bool Sweeper::running() const {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mtx_);
  return worker_.joinable();
}

void Sweeper::run() {
  std::unique_lock<std::mutex> lock(mtx_);
  while (true) {
    if (cv_.wait_for(lock, interval_, [this]() { return stop_requested_; })) {
      return;
    }

    lock.unlock();
    std::size_t removed = store_.sweep_expired();
    if (removed > 0) {
      log::debug() << "sweeper removed " << removed << " expired key(s)";
    }
    lock.lock();
  }
}

} // namespace RedisLite
