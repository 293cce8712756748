#include "tcp_server.hpp"
#include "server/connection.hpp"
#include "util/log.hpp"
#include "util/stream.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <exception>
#include <netinet/in.h>
#include <sys/socket.h>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace RedisLite {

TCPServer::TCPServer(const std::string &address, int port,
                     CommandDispatcher &dispatcher)
    : host_(address), port_(port), running_(false), listen_fd_(-1),
      client_id_counter_(0), active_connections_(0), dispatcher_(dispatcher) {}

TCPServer::~TCPServer() {
  stop();
  wait_for_clients();

  int server_fd = listen_fd_.exchange(-1);
  if (server_fd >= 0) {
    close(server_fd);
  }
}

void TCPServer::handle_client(int client_fd, int client_id) {
  log::debug() << "client " << client_id << " connected";

  SocketSource in(client_fd);
  SocketSink out(client_fd);
  Connection connection(in, out, dispatcher_);
  try {
    connection.serve();
  } catch (const std::exception &e) {
    log::warn() << "client " << client_id << " dropped: " << e.what();
  }

  log::debug() << "client " << client_id << " disconnected after "
               << connection.requests_served() << " request(s)";

  {
    std::lock_guard<std::mutex> lock(clients_mtx_);
    client_fds_.erase(client_fd);
    close(client_fd);
    active_connections_--;
    // must happen under the lock: ~TCPServer waits on this
    clients_cv_.notify_all();
  }
}

void TCPServer::start() {
  bind_and_listen();
  serve();
}

void TCPServer::bind_and_listen() {
  sockaddr_in address{};
  address.sin_family = AF_INET;
  address.sin_port = htons(static_cast<uint16_t>(port_));
  if (inet_pton(AF_INET, host_.c_str(), &address.sin_addr) != 1) {
    throw std::system_error(EINVAL, std::generic_category(),
                            "invalid bind address '" + host_ + "'");
  }

  int server_fd = socket(AF_INET, SOCK_STREAM, 0);
  if (server_fd < 0) {
    throw std::system_error(errno, std::generic_category(), "socket");
  }

  int opt = 1;
  setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  if (bind(server_fd, reinterpret_cast<sockaddr *>(&address),
           sizeof(address)) != 0) {
    int err = errno;
    close(server_fd);
    throw std::system_error(err, std::generic_category(),
                            "bind " + host_ + ":" + std::to_string(port_));
  }

  if (listen(server_fd, SOMAXCONN) != 0) {
    int err = errno;
    close(server_fd);
    throw std::system_error(err, std::generic_category(), "listen");
  }

  // pick up the real port when 0 was requested
  sockaddr_in bound{};
  socklen_t len = sizeof(bound);
  if (getsockname(server_fd, reinterpret_cast<sockaddr *>(&bound), &len) == 0) {
    port_ = ntohs(bound.sin_port);
  }

  listen_fd_ = server_fd;
  running_ = true;
  log::info() << "listening on " << host_ << ":" << port_;
}

void TCPServer::serve() {
  while (running_) {
    int server_fd = listen_fd_.load();
    if (server_fd < 0) {
      break;
    }

    sockaddr_in client{};
    socklen_t addrlen = sizeof(client);
    int client_fd = accept(server_fd, reinterpret_cast<sockaddr *>(&client),
                           &addrlen);
    if (client_fd < 0) {
      if (!running_) {
        break;
      }
      if (errno != EINTR) {
        log::warn() << "accept failed: " << std::strerror(errno);
      }
      continue;
    }

    configure_socket_safety(client_fd);
    int client_id = ++client_id_counter_;
    {
      std::lock_guard<std::mutex> lock(clients_mtx_);
      if (!running_) {
        close(client_fd);
        break;
      }
      client_fds_.insert(client_fd);
      active_connections_++;
    }

    std::thread([this, client_fd, client_id]() {
      handle_client(client_fd, client_id);
    }).detach();
  }

  {
    std::lock_guard<std::mutex> lock(clients_mtx_);
    int server_fd = listen_fd_.exchange(-1);
    if (server_fd >= 0) {
      close(server_fd);
    }
  }
  log::info() << "server stopped accepting connections";
}

void TCPServer::stop() {
  std::lock_guard<std::mutex> lock(clients_mtx_);
  running_ = false;

  int server_fd = listen_fd_.load();
  if (server_fd >= 0) {
    shutdown(server_fd, SHUT_RDWR);
  }
  // wakes every blocked recv; the connection threads close their own fds
  for (int fd : client_fds_) {
    shutdown(fd, SHUT_RDWR);
  }
}

void TCPServer::wait_for_clients() {
  std::unique_lock<std::mutex> lock(clients_mtx_);
  clients_cv_.wait(lock, [this]() { return client_fds_.empty(); });
}

} // namespace RedisLite
