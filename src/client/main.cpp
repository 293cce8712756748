#include "../client/tcp_client.hpp"
#include "util/RESP.hpp"
#include <csignal>
#include <iostream>

int main(int argc, char **argv) {
  std::string address = "127.0.0.1";
  int port = 6379;

  if (argc > 1)
    address = argv[1];
  if (argc > 2) {
    long long parsed = 0;
    if (!RedisLite::parse_i64(argv[2], parsed) || parsed <= 0 ||
        parsed > 65535) {
      std::cerr << "Error: invalid port '" << argv[2] << "'\n";
      return 1;
    }
    port = static_cast<int>(parsed);
  }

  signal(SIGPIPE, SIG_IGN);

  RedisLite::TCPClient client;
  try {
    client.connect_to_server(address, port);
    client.run(std::cin, std::cout);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
