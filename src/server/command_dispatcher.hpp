#pragma once
#include "common/concurrent_store.hpp"
#include "util/RESP.hpp"
#include <string>
#include <vector>

namespace RedisLite {

// Validates one decoded request and runs it against the store.
// Never throws for client input; every problem becomes an error reply.
class CommandDispatcher {
public:
  explicit CommandDispatcher(ConcurrentStore &store) : data_store_(store) {}

  RESP dispatch(const RESP &request);

private:
  using Args = std::vector<RESP>; // full request, name included
  using Handler = RESP (CommandDispatcher::*)(const Args &);

  RESP handle_ping(const Args &args);
  RESP handle_echo(const Args &args);
  RESP handle_set(const Args &args);
  RESP handle_get(const Args &args);
  RESP handle_del(const Args &args);
  RESP handle_expire(const Args &args);
  RESP handle_ttl(const Args &args);

  ConcurrentStore &data_store_;
};

} // namespace RedisLite
