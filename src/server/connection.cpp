#include "connection.hpp"
#include "util/log.hpp"

namespace RedisLite {

bool Connection::step() {
  if (state_ == state::CLOSED) {
    return false;
  }

  RESP request{};
  try {
    request = decode_RESP(reader_);
  } catch (const TransportError &e) {
    log::debug() << "connection closed: " << e.what();
    state_ = state::CLOSED;
    return false;
  } catch (const ProtocolError &e) {
    log::debug() << "protocol error: " << e.what();
    return reply(RESP::error(std::string("ERR Protocol error: ") + e.what()));
  }

  requests_served_++;
  return reply(dispatcher_.dispatch(request));
}

bool Connection::reply(const RESP &resp) {
  try {
    encode_RESP(writer_, resp);
    writer_.flush();
  } catch (const TransportError &e) {
    log::debug() << "write failed: " << e.what();
    state_ = state::CLOSED;
    return false;
  }
  return true;
}

void Connection::serve() {
  while (step()) {
  }
}

} // namespace RedisLite
