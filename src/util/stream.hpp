#pragma once
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <sys/types.h>

namespace RedisLite {

// Stream closed, truncated or failed. Terminal for a connection.
struct TransportError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

class Source {
public:
  virtual ~Source() = default;
  // Returns bytes read, 0 at end of stream. Throws TransportError on failure.
  virtual size_t read_some(char *buf, size_t len) = 0;
};

class Sink {
public:
  virtual ~Sink() = default;
  // Writes everything or throws TransportError.
  virtual void write_all(const char *data, size_t len) = 0;
};

class BufferedReader {
public:
  explicit BufferedReader(Source &source) : source_(source) {}

  char read_byte();
  // Reads through the next LF; the returned line has CRLF (or LF) stripped.
  // std::nullopt when the line is longer than max_len; the whole line is
  // discarded through its LF.
  std::optional<std::string> read_line(size_t max_len);
  std::string read_exact(size_t n);

  size_t buffered() const { return buf_.size() - pos_; }

private:
  bool fill();
  void skip_line();

  Source &source_;
  std::string buf_;
  size_t pos_ = 0;
};

class BufferedWriter {
public:
  explicit BufferedWriter(Sink &sink) : sink_(sink) {}

  void write(std::string_view data) { buf_.append(data); }
  void flush();

private:
  Sink &sink_;
  std::string buf_;
};

class SocketSource : public Source {
public:
  explicit SocketSource(int fd) : fd_(fd) {}
  size_t read_some(char *buf, size_t len) override;

private:
  int fd_;
};

class SocketSink : public Sink {
public:
  explicit SocketSink(int fd) : fd_(fd) {}
  void write_all(const char *data, size_t len) override;

private:
  int fd_;
};

// In-memory source, hands out at most chunk bytes per read.
class StringSource : public Source {
public:
  explicit StringSource(std::string data, size_t chunk = 4096)
      : data_(std::move(data)), chunk_(chunk == 0 ? 1 : chunk) {}
  size_t read_some(char *buf, size_t len) override;

private:
  std::string data_;
  size_t pos_ = 0;
  size_t chunk_;
};

class StringSink : public Sink {
public:
  void write_all(const char *data, size_t len) override {
    if (fail_writes_) {
      throw TransportError("write failed");
    }
    data_.append(data, len);
  }

  const std::string &str() const { return data_; }
  void clear() { data_.clear(); }
  void fail_writes(bool fail) { fail_writes_ = fail; }

private:
  std::string data_;
  bool fail_writes_ = false;
};

bool robust_send(int sock_fd, const char *data, size_t len);
void configure_socket_safety(int sock_fd);

} // namespace RedisLite
