#pragma once
#include "server/command_dispatcher.hpp"
#include "util/stream.hpp"

namespace RedisLite {

// Per-connection loop: decode one request, dispatch, encode, flush.
// Protocol errors are answered and the connection stays open; transport
// errors close it without a reply.
class Connection {
public:
  enum class state { READING, CLOSED };

  Connection(Source &in, Sink &out, CommandDispatcher &dispatcher)
      : reader_(in), writer_(out), dispatcher_(dispatcher) {}

  // Runs one request/reply cycle. Returns false once the connection closed.
  bool step();
  void serve();

  state current_state() const { return state_; }
  long long requests_served() const { return requests_served_; }

private:
  bool reply(const RESP &resp);

  BufferedReader reader_;
  BufferedWriter writer_;
  CommandDispatcher &dispatcher_;
  state state_ = state::READING;
  long long requests_served_ = 0;
};

} // namespace RedisLite
