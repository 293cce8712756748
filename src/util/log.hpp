#pragma once

#include <atomic>
#include <cstdint>
#include <sstream>
#include <string>

namespace RedisLite {
namespace log {

enum class level : uint8_t { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

void set_level(level l);
level current_level();
bool enabled(level l);

// Throws std::invalid_argument for anything but debug/info/warn/error.
level parse_level(const std::string &name);
const char *level_name(level l);

void write(level l, const std::string &msg);

// Collects one line and writes it when destroyed:
//   log::info() << "listening on " << port;
class line {
public:
  explicit line(level l) : level_(l), active_(enabled(l)) {}
  ~line() {
    if (active_) {
      write(level_, out_.str());
    }
  }

  line(const line &) = delete;
  line &operator=(const line &) = delete;

  template <typename T> line &operator<<(const T &value) {
    if (active_) {
      out_ << value;
    }
    return *this;
  }

private:
  level level_;
  bool active_;
  std::ostringstream out_;
};

inline line debug() { return line(level::DEBUG); }
inline line info() { return line(level::INFO); }
inline line warn() { return line(level::WARN); }
inline line error() { return line(level::ERROR); }

} // namespace log
} // namespace RedisLite
