#pragma once

#include "common/types.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace RedisLite {

// Key -> Entry map behind a single reader/writer lock. Reads treat expired
// entries as absent without removing them; writers and sweep_expired() do the
// physical removal.
class ConcurrentStore {
public:
  using Clock = std::function<i64()>; // epoch milliseconds

  ConcurrentStore();
  explicit ConcurrentStore(Clock clock);

  std::optional<Entry> get(const std::string &key) const;
  void set(const std::string &key, std::string value, i64 ttl_ms = 0);
  std::size_t del(const std::vector<std::string> &keys);
  bool set_expiry(const std::string &key, i64 ttl_seconds);
  TimeToLive ttl(const std::string &key) const;

  // Full scan under the exclusive lock. Returns the number of keys removed.
  std::size_t sweep_expired();

  std::size_t size() const;
  bool contains(const std::string &key) const;
  i64 now_ms() const { return clock_(); }

  static i64 system_now_ms();

private:
  std::unordered_map<std::string, Entry> store_;
  mutable std::shared_mutex mtx_;
  Clock clock_;
};

} // namespace RedisLite
