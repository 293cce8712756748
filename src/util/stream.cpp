#include "stream.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

namespace RedisLite {

static constexpr size_t READ_CHUNK = 16 * 1024;

bool BufferedReader::fill() {
  if (pos_ > 0) {
    buf_.erase(0, pos_);
    pos_ = 0;
  }

  char temp[READ_CHUNK];
  size_t n = source_.read_some(temp, sizeof(temp));
  if (n == 0) {
    return false;
  }
  buf_.append(temp, n);
  return true;
}

char BufferedReader::read_byte() {
  if (buffered() == 0 && !fill()) {
    throw TransportError("connection closed");
  }
  return buf_[pos_++];
}

std::optional<std::string> BufferedReader::read_line(size_t max_len) {
  size_t scanned = 0;
  while (true) {
    size_t lf = buf_.find('\n', pos_ + scanned);
    if (lf != std::string::npos) {
      size_t len = lf - pos_;
      if (len > max_len + 1) {
        pos_ = lf + 1;
        return std::nullopt;
      }
      std::string line = buf_.substr(pos_, len);
      pos_ = lf + 1;
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      return line;
    }

    if (buffered() > max_len + 1) {
      skip_line();
      return std::nullopt;
    }

    scanned = buffered();
    if (!fill()) {
      throw TransportError("connection closed mid-line");
    }
  }
}

void BufferedReader::skip_line() {
  while (true) {
    size_t lf = buf_.find('\n', pos_);
    if (lf != std::string::npos) {
      pos_ = lf + 1;
      return;
    }
    pos_ = buf_.size();
    if (!fill()) {
      throw TransportError("connection closed mid-line");
    }
  }
}

std::string BufferedReader::read_exact(size_t n) {
  while (buffered() < n) {
    if (!fill()) {
      throw TransportError("connection closed mid-payload");
    }
  }
  std::string out = buf_.substr(pos_, n);
  pos_ += n;
  return out;
}

void BufferedWriter::flush() {
  if (buf_.empty()) {
    return;
  }
  std::string pending;
  pending.swap(buf_);
  sink_.write_all(pending.data(), pending.size());
}

size_t SocketSource::read_some(char *buf, size_t len) {
  while (true) {
    ssize_t n = recv(fd_, buf, len, 0);
    if (n >= 0) {
      return static_cast<size_t>(n);
    }
    if (errno == EINTR) {
      continue;
    }
    throw TransportError(std::string("recv failed: ") + std::strerror(errno));
  }
}

void SocketSink::write_all(const char *data, size_t len) {
  if (len == 0) {
    return;
  }
  if (!robust_send(fd_, data, len)) {
    throw TransportError(std::string("send failed: ") + std::strerror(errno));
  }
}

size_t StringSource::read_some(char *buf, size_t len) {
  size_t n = std::min({len, chunk_, data_.size() - pos_});
  std::memcpy(buf, data_.data() + pos_, n);
  pos_ += n;
  return n;
}

bool robust_send(int sock_fd, const char *data, size_t len) {
  if (sock_fd < 0 || !data || len == 0) {
    return false;
  }

  size_t sent = 0;

  while (sent < len) {
    ssize_t n = send(sock_fd, data + sent, len - sent, MSG_NOSIGNAL);

    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      // blocking sockets only; EAGAIN here means a send timeout was hit
      return false;
    }

    if (n == 0) {
      return false;
    }
    sent += static_cast<size_t>(n);
  }

  return true;
}

void configure_socket_safety(int sock_fd) {
  int nodelay = 1;
  setsockopt(sock_fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));
  int keepalive = 1;
  setsockopt(sock_fd, SOL_SOCKET, SO_KEEPALIVE, &keepalive, sizeof(keepalive));
}

} // namespace RedisLite
