#include "util/stream.hpp"
#include <gtest/gtest.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace RedisLite;

TEST(BufferedReader, ReadsLinesAcrossChunks) {
  StringSource source("first\r\nsecond\nthird\r\n", 3);
  BufferedReader reader(source);

  EXPECT_EQ(reader.read_line(64), "first");
  EXPECT_EQ(reader.read_line(64), "second");
  EXPECT_EQ(reader.read_line(64), "third");
  EXPECT_THROW(reader.read_byte(), TransportError);
}

TEST(BufferedReader, OverlongLineIsSkippedAcrossChunks) {
  StringSource source("abcdefghij\r\nok\r\n", 2);
  BufferedReader reader(source);

  EXPECT_FALSE(reader.read_line(4).has_value());
  EXPECT_EQ(reader.read_line(4), "ok");
}

TEST(BufferedReader, OverlongLineCutOffByEndOfStream) {
  StringSource source("abcdefghij", 3);
  BufferedReader reader(source);

  EXPECT_THROW(reader.read_line(4), TransportError);
}

TEST(BufferedReader, OverlongTerminatedLineIsSkippedWhole) {
  StringSource source("abcdefghij\r\nok\r\n");
  BufferedReader reader(source);

  EXPECT_FALSE(reader.read_line(4).has_value());
  EXPECT_EQ(reader.read_line(4), "ok");
}

TEST(BufferedReader, ReadExactSpansChunks) {
  StringSource source("0123456789", 4);
  BufferedReader reader(source);

  EXPECT_EQ(reader.read_byte(), '0');
  EXPECT_EQ(reader.read_exact(7), "1234567");
  EXPECT_THROW(reader.read_exact(5), TransportError);
}

TEST(BufferedWriter, HoldsDataUntilFlush) {
  StringSink sink;
  BufferedWriter writer(sink);

  writer.write("abc");
  writer.write("def");
  EXPECT_EQ(sink.str(), "");
  writer.flush();
  EXPECT_EQ(sink.str(), "abcdef");
}

TEST(BufferedWriter, SinkFailureSurfacesAsTransportError) {
  StringSink sink;
  sink.fail_writes(true);
  BufferedWriter writer(sink);

  writer.write("+OK\r\n");
  EXPECT_THROW(writer.flush(), TransportError);
}

TEST(SocketStreams, RoundTripOverSocketPair) {
  int fds[2];
  ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);

  SocketSink sink(fds[0]);
  SocketSource source(fds[1]);
  BufferedReader reader(source);

  sink.write_all("+PONG\r\n", 7);
  EXPECT_EQ(reader.read_byte(), '+');
  EXPECT_EQ(reader.read_line(64), "PONG");

  close(fds[0]);
  EXPECT_THROW(reader.read_byte(), TransportError);
  close(fds[1]);
}
