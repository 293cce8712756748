#pragma once
#include "server/command_dispatcher.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <unordered_set>

namespace RedisLite {

class TCPServer {
public:
  TCPServer(const std::string &address, int port, CommandDispatcher &dispatcher);
  ~TCPServer();

  TCPServer(const TCPServer &) = delete;
  TCPServer &operator=(const TCPServer &) = delete;

  // bind_and_listen() then serve().
  void start();
  // Throws std::system_error when the socket can not be set up.
  void bind_and_listen();
  // Accept loop; returns after stop().
  void serve();
  // Safe from any thread: closes the listener and every open connection.
  void stop();

  int port() const { return port_; }
  int active_connections() const { return active_connections_.load(); }

private:
  void handle_client(int client_fd, int client_id);
  void wait_for_clients();

  std::string host_;
  int port_;
  std::atomic<bool> running_;
  std::atomic<int> listen_fd_;
  std::atomic<int> client_id_counter_;
  std::atomic<int> active_connections_;

  std::mutex clients_mtx_;
  std::condition_variable clients_cv_;
  std::unordered_set<int> client_fds_;

  CommandDispatcher &dispatcher_;
};

} // namespace RedisLite
