#include "server/command_dispatcher.hpp"
#include <atomic>
#include <gtest/gtest.h>
#include <initializer_list>
#include <string>

using namespace RedisLite;

class CommandDispatcherTest : public ::testing::Test {
protected:
  std::atomic<i64> now{1'700'000'000'000};
  ConcurrentStore store{[this]() { return now.load(); }};
  CommandDispatcher dispatcher{store};

  RESP run(std::initializer_list<std::string> words) {
    std::vector<RESP> elements;
    for (const auto &w : words) {
      elements.push_back(RESP::bulk(w));
    }
    return dispatcher.dispatch(RESP::array(std::move(elements)));
  }
};

// PING / ECHO
TEST_F(CommandDispatcherTest, Ping) {
  EXPECT_EQ(run({"PING"}), RESP::simple("PONG"));
  EXPECT_EQ(run({"ping", "hello"}), RESP::bulk("hello"));
  EXPECT_EQ(run({"PING", "a", "b"}),
            RESP::error("ERR wrong number of arguments for 'ping'"));
}

TEST_F(CommandDispatcherTest, Echo) {
  EXPECT_EQ(run({"ECHO", "hi there"}), RESP::bulk("hi there"));
  EXPECT_EQ(run({"ECHO", ""}), RESP::bulk(""));
  EXPECT_EQ(run({"ECHO"}),
            RESP::error("ERR wrong number of arguments for 'echo'"));
}

TEST_F(CommandDispatcherTest, CommandNameIsCaseInsensitive) {
  EXPECT_EQ(run({"sEt", "k", "v"}), RESP::simple("OK"));
  EXPECT_EQ(run({"Get", "k"}), RESP::bulk("v"));
}

// SET / GET
TEST_F(CommandDispatcherTest, SetAndGet) {
  EXPECT_EQ(run({"SET", "foo", "bar"}), RESP::simple("OK"));
  EXPECT_EQ(run({"GET", "foo"}), RESP::bulk("bar"));
  EXPECT_EQ(run({"GET", "missing"}), RESP::null_bulk());
}

TEST_F(CommandDispatcherTest, SetWithEx) {
  EXPECT_EQ(run({"SET", "k", "v", "EX", "10"}), RESP::simple("OK"));
  EXPECT_EQ(run({"TTL", "k"}), RESP::number(10));
  now += 10'001;
  EXPECT_EQ(run({"GET", "k"}), RESP::null_bulk());
}

TEST_F(CommandDispatcherTest, SetWithPx) {
  EXPECT_EQ(run({"SET", "k", "v", "px", "1500"}), RESP::simple("OK"));
  EXPECT_EQ(run({"TTL", "k"}), RESP::number(1));
  now += 1501;
  EXPECT_EQ(run({"GET", "k"}), RESP::null_bulk());
}

TEST_F(CommandDispatcherTest, SetClearsPreviousExpiry) {
  run({"SET", "k", "v", "EX", "10"});
  run({"SET", "k", "w"});
  EXPECT_EQ(run({"TTL", "k"}), RESP::number(-1));
}

TEST_F(CommandDispatcherTest, SetRejectsMalformedOptions) {
  EXPECT_EQ(run({"SET", "k"}),
            RESP::error("ERR wrong number of arguments for 'set'"));
  EXPECT_EQ(run({"SET", "k", "v", "EX"}), RESP::error("ERR syntax error"));
  EXPECT_EQ(run({"SET", "k", "v", "EX", "1", "extra"}),
            RESP::error("ERR syntax error"));
  EXPECT_EQ(run({"SET", "k", "v", "KEEP", "1"}),
            RESP::error("ERR syntax error"));
  EXPECT_EQ(run({"SET", "k", "v", "EX", "ten"}),
            RESP::error("ERR value is not an integer or out of range"));
  EXPECT_EQ(run({"SET", "k", "v", "EX", "0"}),
            RESP::error("ERR invalid expire time in 'set' command"));
  EXPECT_EQ(run({"SET", "k", "v", "PX", "-5"}),
            RESP::error("ERR invalid expire time in 'set' command"));
  EXPECT_EQ(run({"SET", "k", "v", "EX", "9223372036854775807"}),
            RESP::error("ERR invalid expire time in 'set' command"));

  // nothing was written by the rejected commands
  EXPECT_EQ(run({"GET", "k"}), RESP::null_bulk());
}

TEST_F(CommandDispatcherTest, GetArity) {
  EXPECT_EQ(run({"GET"}), RESP::error("ERR wrong number of arguments for 'get'"));
  EXPECT_EQ(run({"GET", "a", "b"}),
            RESP::error("ERR wrong number of arguments for 'get'"));
}

// DEL
TEST_F(CommandDispatcherTest, DelCountsRemovedKeys) {
  run({"SET", "a", "1"});
  run({"SET", "b", "2"});
  EXPECT_EQ(run({"DEL", "a", "b", "c"}), RESP::number(2));
  EXPECT_EQ(run({"DEL", "a"}), RESP::number(0));
  EXPECT_EQ(run({"DEL"}), RESP::error("ERR wrong number of arguments for 'del'"));
}

TEST_F(CommandDispatcherTest, DelIgnoresExpiredKeys) {
  run({"SET", "k", "v", "PX", "10"});
  now += 11;
  EXPECT_EQ(run({"DEL", "k"}), RESP::number(0));
}

// EXPIRE / TTL
TEST_F(CommandDispatcherTest, ExpireAndTtl) {
  EXPECT_EQ(run({"TTL", "k"}), RESP::number(-2));
  run({"SET", "k", "v"});
  EXPECT_EQ(run({"TTL", "k"}), RESP::number(-1));
  EXPECT_EQ(run({"EXPIRE", "k", "100"}), RESP::number(1));
  EXPECT_EQ(run({"TTL", "k"}), RESP::number(100));
  now += 30'500;
  EXPECT_EQ(run({"TTL", "k"}), RESP::number(69));
}

TEST_F(CommandDispatcherTest, ExpireMissingKey) {
  EXPECT_EQ(run({"EXPIRE", "nope", "10"}), RESP::number(0));
  EXPECT_EQ(run({"GET", "nope"}), RESP::null_bulk());
}

TEST_F(CommandDispatcherTest, ExpireExpiredKey) {
  run({"SET", "k", "v", "EX", "1"});
  now += 2000;
  EXPECT_EQ(run({"EXPIRE", "k", "100"}), RESP::number(0));
  EXPECT_EQ(run({"GET", "k"}), RESP::null_bulk());
}

TEST_F(CommandDispatcherTest, ExpireNonPositiveRemovesKey) {
  run({"SET", "k", "v"});
  EXPECT_EQ(run({"EXPIRE", "k", "-1"}), RESP::number(1));
  EXPECT_EQ(run({"GET", "k"}), RESP::null_bulk());
  EXPECT_EQ(run({"TTL", "k"}), RESP::number(-2));
}

TEST_F(CommandDispatcherTest, ExpireRejectsBadSeconds) {
  run({"SET", "k", "v"});
  EXPECT_EQ(run({"EXPIRE", "k", "soon"}),
            RESP::error("ERR value is not an integer or out of range"));
  EXPECT_EQ(run({"EXPIRE", "k", "9223372036854775807"}),
            RESP::error("ERR invalid expire time in 'expire' command"));
  EXPECT_EQ(run({"EXPIRE", "k"}),
            RESP::error("ERR wrong number of arguments for 'expire'"));
  EXPECT_EQ(run({"TTL", "k"}), RESP::number(-1));
}

TEST_F(CommandDispatcherTest, TtlArity) {
  EXPECT_EQ(run({"TTL"}), RESP::error("ERR wrong number of arguments for 'ttl'"));
}

// Malformed requests
TEST_F(CommandDispatcherTest, UnknownCommand) {
  EXPECT_EQ(run({"flushall"}), RESP::error("ERR unknown command 'FLUSHALL'"));
}

TEST_F(CommandDispatcherTest, UnknownCommandWinsOverArgumentType) {
  RESP request = RESP::array({RESP::bulk("FOO"), RESP::number(1)});
  EXPECT_EQ(dispatcher.dispatch(request),
            RESP::error("ERR unknown command 'FOO'"));
}

TEST_F(CommandDispatcherTest, RequestMustBeNonEmptyArray) {
  EXPECT_EQ(dispatcher.dispatch(RESP::simple("PING")),
            RESP::error("ERR protocol error"));
  EXPECT_EQ(dispatcher.dispatch(RESP::array({})),
            RESP::error("ERR protocol error"));
  EXPECT_EQ(dispatcher.dispatch(RESP::array({RESP::number(1)})),
            RESP::error("ERR protocol error"));
  EXPECT_EQ(dispatcher.dispatch(RESP::array({RESP::null_bulk()})),
            RESP::error("ERR protocol error"));
}

TEST_F(CommandDispatcherTest, ArgumentsMustBeBulkStrings) {
  RESP request = RESP::array({RESP::bulk("SET"), RESP::bulk("k"), RESP::number(5)});
  EXPECT_EQ(dispatcher.dispatch(request),
            RESP::error("ERR wrong type of argument for 'set'"));

  request = RESP::array({RESP::bulk("GET"), RESP::null_bulk()});
  EXPECT_EQ(dispatcher.dispatch(request),
            RESP::error("ERR wrong type of argument for 'get'"));
}

TEST_F(CommandDispatcherTest, SessionScenario) {
  EXPECT_EQ(run({"PING"}), RESP::simple("PONG"));
  EXPECT_EQ(run({"SET", "foo", "bar"}), RESP::simple("OK"));
  EXPECT_EQ(run({"GET", "foo"}), RESP::bulk("bar"));
  EXPECT_EQ(run({"EXPIRE", "foo", "1"}), RESP::number(1));
  EXPECT_EQ(run({"TTL", "foo"}), RESP::number(1));
  now += 1100;
  EXPECT_EQ(run({"GET", "foo"}), RESP::null_bulk());
  EXPECT_EQ(run({"TTL", "foo"}), RESP::number(-2));
  EXPECT_EQ(run({"DEL", "foo"}), RESP::number(0));
}
