#pragma once
#include "util/RESP.hpp"
#include "util/stream.hpp"
#include <iosfwd>
#include <memory>
#include <string>

namespace RedisLite {

class TCPClient {
public:
  TCPClient();
  ~TCPClient();

  TCPClient(const TCPClient &) = delete;
  TCPClient &operator=(const TCPClient &) = delete;

  // Throws std::runtime_error when the server can not be reached.
  void connect_to_server(const std::string &address, int port);

  // Sends one request and waits for its reply.
  RESP request(const RESP &command);

  // Interactive loop until "exit"/"quit" or end of input.
  void run(std::istream &input, std::ostream &output);

  void disconnect();

private:
  int sock_fd_;
  std::unique_ptr<SocketSource> source_;
  std::unique_ptr<SocketSink> sink_;
  std::unique_ptr<BufferedReader> reader_;
  std::unique_ptr<BufferedWriter> writer_;
};

} // namespace RedisLite
