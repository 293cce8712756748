#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <stdexcept>

namespace RedisLite {
namespace log {

static std::atomic<level> g_level{level::INFO};

void set_level(level l) { g_level.store(l); }

level current_level() { return g_level.load(); }

bool enabled(level l) {
  return static_cast<uint8_t>(l) >= static_cast<uint8_t>(g_level.load());
}

level parse_level(const std::string &name) {
  std::string lowered = name;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lowered == "debug")
    return level::DEBUG;
  if (lowered == "info")
    return level::INFO;
  if (lowered == "warn" || lowered == "warning")
    return level::WARN;
  if (lowered == "error")
    return level::ERROR;
  throw std::invalid_argument("unknown log level '" + name + "'");
}

const char *level_name(level l) {
  switch (l) {
  case level::DEBUG:
    return "DEBUG";
  case level::INFO:
    return "INFO";
  case level::WARN:
    return "WARN";
  case level::ERROR:
    return "ERROR";
  }
  return "?";
}

void write(level l, const std::string &msg) {
  if (!enabled(l)) {
    return;
  }

  auto now = std::chrono::system_clock::now();
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&t, &tm);

  static std::mutex mtx;
  std::lock_guard<std::mutex> lock(mtx);
  std::fprintf(stderr, "[%02d:%02d:%02d] [%s] %s\n", tm.tm_hour, tm.tm_min,
               tm.tm_sec, level_name(l), msg.c_str());
}

} // namespace log
} // namespace RedisLite
