#pragma once
#include "common/concurrent_store.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace RedisLite {

// Background thread that purges expired entries every interval.
class Sweeper {
public:
  Sweeper(ConcurrentStore &store, std::chrono::milliseconds interval);
  ~Sweeper();

  Sweeper(const Sweeper &) = delete;
  Sweeper &operator=(const Sweeper &) = delete;

  void start();
  void stop();
  bool running() const;

  std::chrono::milliseconds interval() const { return interval_; }

private:
  void run();

  ConcurrentStore &store_;
  std::chrono::milliseconds interval_;

  std::thread worker_;
  mutable std::mutex lifecycle_mtx_; // guards worker_
  std::mutex mtx_;
  std::condition_variable cv_;
  bool stop_requested_ = false;
};

} // namespace RedisLite
