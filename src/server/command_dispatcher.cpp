#include "command_dispatcher.hpp"
#include "common/types.hpp"
#include <algorithm>
#include <cctype>
#include <limits>

namespace RedisLite {

static std::string to_upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

static std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

static bool is_bulk(const RESP &r) {
  return r.resp_type == RESP::type::BULK_STRING && !r.is_null;
}

static RESP wrong_arity(const std::string &command) {
  return RESP::error("ERR wrong number of arguments for '" +
                     to_lower(command) + "'");
}

static RESP not_an_integer() {
  return RESP::error("ERR value is not an integer or out of range");
}

static RESP invalid_expire(const char *command) {
  return RESP::error(std::string("ERR invalid expire time in '") + command +
                     "' command");
}

// amount * unit_ms without overflowing i64
static bool to_millis(i64 amount, i64 unit_ms, i64 &out) {
  if (amount > std::numeric_limits<i64>::max() / unit_ms ||
      amount < std::numeric_limits<i64>::min() / unit_ms) {
    return false;
  }
  out = amount * unit_ms;
  return true;
}

RESP CommandDispatcher::dispatch(const RESP &request) {
  if (request.resp_type != RESP::type::ARRAY || request.elements.empty() ||
      !is_bulk(request.elements[0])) {
    return RESP::error("ERR protocol error");
  }

  const Args &args = request.elements;
  std::string command = to_upper(args[0].str);

  Handler handler = nullptr;
  if (command == "PING") {
    handler = &CommandDispatcher::handle_ping;
  } else if (command == "ECHO") {
    handler = &CommandDispatcher::handle_echo;
  } else if (command == "SET") {
    handler = &CommandDispatcher::handle_set;
  } else if (command == "GET") {
    handler = &CommandDispatcher::handle_get;
  } else if (command == "DEL") {
    handler = &CommandDispatcher::handle_del;
  } else if (command == "EXPIRE") {
    handler = &CommandDispatcher::handle_expire;
  } else if (command == "TTL") {
    handler = &CommandDispatcher::handle_ttl;
  } else {
    return RESP::error("ERR unknown command '" + command + "'");
  }

  if (!std::all_of(args.begin() + 1, args.end(), is_bulk)) {
    return RESP::error("ERR wrong type of argument for '" + to_lower(command) +
                       "'");
  }

  return (this->*handler)(args);
}

RESP CommandDispatcher::handle_ping(const Args &args) {
  if (args.size() == 1)
    return RESP::simple("PONG");
  if (args.size() == 2)
    return RESP::bulk(args[1].str);
  return wrong_arity("ping");
}

RESP CommandDispatcher::handle_echo(const Args &args) {
  if (args.size() != 2)
    return wrong_arity("echo");

  return RESP::bulk(args[1].str);
}

// SET key value [EX seconds | PX milliseconds]
RESP CommandDispatcher::handle_set(const Args &args) {
  if (args.size() < 3)
    return wrong_arity("set");
  if (args.size() != 3 && args.size() != 5)
    return RESP::error("ERR syntax error");

  i64 ttl_ms = 0;
  if (args.size() == 5) {
    std::string opt = to_upper(args[3].str);
    i64 unit_ms = 0;
    if (opt == "EX")
      unit_ms = 1000;
    else if (opt == "PX")
      unit_ms = 1;
    else
      return RESP::error("ERR syntax error");

    long long amount = 0;
    if (!parse_i64(args[4].str, amount))
      return not_an_integer();
    if (amount <= 0 || !to_millis(amount, unit_ms, ttl_ms))
      return invalid_expire("set");
    if (ttl_ms > std::numeric_limits<i64>::max() - data_store_.now_ms())
      return invalid_expire("set");
  }

  data_store_.set(args[1].str, args[2].str, ttl_ms);
  return RESP::simple("OK");
}

RESP CommandDispatcher::handle_get(const Args &args) {
  if (args.size() != 2)
    return wrong_arity("get");

  std::optional<Entry> entry = data_store_.get(args[1].str);
  if (!entry)
    return RESP::null_bulk();
  return RESP::bulk(std::move(entry->value));
}

RESP CommandDispatcher::handle_del(const Args &args) {
  if (args.size() < 2)
    return wrong_arity("del");

  std::vector<std::string> keys;
  keys.reserve(args.size() - 1);
  for (auto it = args.begin() + 1; it != args.end(); ++it) {
    keys.push_back(it->str);
  }
  return RESP::number(static_cast<long long>(data_store_.del(keys)));
}

RESP CommandDispatcher::handle_expire(const Args &args) {
  if (args.size() != 3)
    return wrong_arity("expire");

  long long seconds = 0;
  if (!parse_i64(args[2].str, seconds))
    return not_an_integer();

  i64 ttl_ms = 0;
  if (!to_millis(seconds, 1000, ttl_ms))
    return invalid_expire("expire");
  i64 now = data_store_.now_ms();
  if (ttl_ms > 0 && ttl_ms > std::numeric_limits<i64>::max() - now)
    return invalid_expire("expire");

  return RESP::number(data_store_.set_expiry(args[1].str, seconds) ? 1 : 0);
}

RESP CommandDispatcher::handle_ttl(const Args &args) {
  if (args.size() != 2)
    return wrong_arity("ttl");

  TimeToLive ttl = data_store_.ttl(args[1].str);
  switch (ttl.ttl_status) {
  case TimeToLive::status::NOT_FOUND:
    return RESP::number(-2);
  case TimeToLive::status::NO_EXPIRY:
    return RESP::number(-1);
  case TimeToLive::status::SECONDS:
    return RESP::number(ttl.seconds);
  }
  return RESP::number(-2);
}

} // namespace RedisLite
