#include "concurrent_store.hpp"
#include "common/types.hpp"
#include <chrono>
#include <mutex>

namespace RedisLite {
i64 ConcurrentStore::system_now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

ConcurrentStore::ConcurrentStore() : clock_(&ConcurrentStore::system_now_ms) {}

ConcurrentStore::ConcurrentStore(Clock clock) : clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = &ConcurrentStore::system_now_ms;
  }
}

std::optional<Entry> ConcurrentStore::get(const std::string &key) const {
  std::shared_lock lock(mtx_);
  auto it = store_.find(key);

  if (it == store_.end()) {
    return std::nullopt;
  }

  if (it->second.is_expired(clock_())) {
    return std::nullopt;
  }

  return it->second;
}

void ConcurrentStore::set(const std::string &key, std::string value,
                          i64 ttl_ms) {
  std::unique_lock lock(mtx_);

  i64 expires_at = 0;
  if (ttl_ms > 0) {
    expires_at = clock_() + ttl_ms;
  }

  store_.insert_or_assign(key, Entry{std::move(value), expires_at});
}

std::size_t ConcurrentStore::del(const std::vector<std::string> &keys) {
  std::unique_lock lock(mtx_);
  i64 now = clock_();
  std::size_t removed = 0;

  for (const auto &key : keys) {
    auto it = store_.find(key);
    if (it == store_.end()) {
      continue;
    }
    // expired entries go away too, but the caller never saw them
    if (!it->second.is_expired(now)) {
      removed++;
    }
    store_.erase(it);
  }
  return removed;
}

bool ConcurrentStore::set_expiry(const std::string &key, i64 ttl_seconds) {
  std::unique_lock lock(mtx_);
  auto it = store_.find(key);
  if (it == store_.end()) {
    return false;
  }

  i64 now = clock_();
  if (it->second.is_expired(now)) {
    store_.erase(it);
    return false;
  }

  // a deadline already in the past removes the key right away
  if (ttl_seconds <= 0) {
    store_.erase(it);
    return true;
  }

  it->second.expires_at = now + ttl_seconds * 1000;
  return true;
}

TimeToLive ConcurrentStore::ttl(const std::string &key) const {
  std::shared_lock lock(mtx_);
  auto it = store_.find(key);
  if (it == store_.end()) {
    return {TimeToLive::status::NOT_FOUND};
  }

  if (it->second.is_persistent()) {
    return {TimeToLive::status::NO_EXPIRY};
  }

  i64 remaining_ms = it->second.expires_at - clock_();
  if (remaining_ms < 0) {
    return {TimeToLive::status::NOT_FOUND};
  }
  return {TimeToLive::status::SECONDS, remaining_ms / 1000};
}

std::size_t ConcurrentStore::sweep_expired() {
  std::unique_lock lock(mtx_);
  if (store_.empty()) {
    return 0;
  }

  i64 now = clock_();
  std::size_t removed = 0;

  auto it = store_.begin();
  while (it != store_.end()) {
    if (it->second.is_expired(now)) {
      it = store_.erase(it);
      removed++;
    } else {
      it++;
    }
  }
  return removed;
}

std::size_t ConcurrentStore::size() const {
  std::shared_lock lock(mtx_);
  return store_.size();
}

bool ConcurrentStore::contains(const std::string &key) const {
  std::shared_lock lock(mtx_);
  return store_.find(key) != store_.end();
}
} // namespace RedisLite
