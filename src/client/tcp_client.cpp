#include "../client/tcp_client.hpp"
#include <arpa/inet.h>
#include <iostream>
#include <netinet/in.h>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>

namespace RedisLite {

TCPClient::TCPClient() : sock_fd_(-1) {}

TCPClient::~TCPClient() { disconnect(); }

void TCPClient::connect_to_server(const std::string &address, int port) {
  disconnect();

  sockaddr_in server_addr{};
  server_addr.sin_family = AF_INET;
  server_addr.sin_port = htons(static_cast<uint16_t>(port));

  if (inet_pton(AF_INET, address.c_str(), &server_addr.sin_addr) <= 0)
    throw std::runtime_error("Invalid address/ Address not supported");

  sock_fd_ = socket(AF_INET, SOCK_STREAM, 0);
  if (sock_fd_ < 0)
    throw std::runtime_error("Socket creation failed");

  if (connect(sock_fd_, reinterpret_cast<sockaddr *>(&server_addr),
              sizeof(server_addr)) < 0) {
    disconnect();
    throw std::runtime_error("Connection to " + address + ":" +
                             std::to_string(port) + " failed");
  }
  configure_socket_safety(sock_fd_);

  source_ = std::make_unique<SocketSource>(sock_fd_);
  sink_ = std::make_unique<SocketSink>(sock_fd_);
  reader_ = std::make_unique<BufferedReader>(*source_);
  writer_ = std::make_unique<BufferedWriter>(*sink_);
}

RESP TCPClient::request(const RESP &command) {
  if (sock_fd_ < 0)
    throw std::runtime_error("not connected");

  encode_RESP(*writer_, command);
  writer_->flush();
  return decode_RESP(*reader_);
}

void TCPClient::run(std::istream &input, std::ostream &output) {
  std::string line;
  while (true) {
    output << "redis-lite> " << std::flush;
    if (!std::getline(input, line))
      break;

    if (line == "exit" || line == "quit")
      break;

    RESP command{};
    try {
      command = convert_inline_to_RESP(line);
    } catch (const std::invalid_argument &e) {
      output << "(error) " << e.what() << "\n";
      continue;
    }
    if (command.elements.empty())
      continue;

    output << format_RESP(request(command)) << "\n";
  }
}

void TCPClient::disconnect() {
  writer_.reset();
  reader_.reset();
  sink_.reset();
  source_.reset();
  if (sock_fd_ >= 0) {
    close(sock_fd_);
    sock_fd_ = -1;
  }
}

} // namespace RedisLite
