#include "common/concurrent_store.hpp"
#include "common/sweeper.hpp"
#include "server/command_dispatcher.hpp"
#include "server/config.hpp"
#include "server/tcp_server.hpp"
#include "util/log.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace {
int g_signal_write_fd = -1;

void signal_handler(int sig) {
  if (g_signal_write_fd >= 0) {
    char byte = static_cast<char>(sig);
    [[maybe_unused]] ssize_t n = write(g_signal_write_fd, &byte, 1);
  }
}
} // namespace

int main(int argc, char **argv) {
  using namespace RedisLite;

  Config cfg;
  try {
    cfg = parse_args(argc, argv);
  } catch (const std::invalid_argument &e) {
    std::cerr << "redis-lite: " << e.what() << "\n" << usage(argv[0]);
    return 1;
  }

  if (cfg.show_help) {
    std::cout << usage(argv[0]);
    return 0;
  }

  log::set_level(cfg.log_level);

  int signal_pipe[2];
  if (pipe(signal_pipe) != 0) {
    log::error() << "pipe failed: " << std::strerror(errno);
    return 1;
  }
  g_signal_write_fd = signal_pipe[1];

  signal(SIGPIPE, SIG_IGN);

  struct sigaction sa{};
  sa.sa_handler = signal_handler;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);

  ConcurrentStore store;
  CommandDispatcher dispatcher(store);
  Sweeper sweeper(store, cfg.sweep_interval);
  TCPServer server(cfg.host, cfg.port, dispatcher);

  try {
    server.bind_and_listen();
  } catch (const std::system_error &e) {
    log::error() << e.what();
    return 1;
  }

  sweeper.start();

  std::thread signal_watcher([&server, read_fd = signal_pipe[0]]() {
    char byte = 0;
    ssize_t n;
    do {
      n = read(read_fd, &byte, 1);
    } while (n < 0 && errno == EINTR);
    if (n == 1) {
      log::info() << "received signal " << static_cast<int>(byte)
                  << ", shutting down";
      server.stop();
    }
  });

  server.serve();

  sweeper.stop();
  g_signal_write_fd = -1;
  close(signal_pipe[1]); // unblocks the watcher if serve() ended on its own
  signal_watcher.join();
  close(signal_pipe[0]);

  log::info() << "bye";
  return 0;
}
