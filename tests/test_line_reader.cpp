#include <gtest/gtest.h>

#include "mock_transport.hpp"
#include "tweetstream/core/error.hpp"
#include "tweetstream/streaming/line_reader.hpp"

using namespace tweetstream;
using namespace tweetstream::streaming;
using namespace tweetstream::testing;

namespace {

std::vector<std::string> drain(LineReader &reader) {
  std::vector<std::string> lines;
  while (auto line = reader.next()) {
    lines.push_back(*line);
  }
  return lines;
}

}  // namespace

TEST(LineReaderTest, SplitsLinesAcrossChunks) {
  auto state = make_state({"{\"text\":\"he", "llo\"}\r\n{\"te", "xt\":\"world\"}\r", "\n"});
  LineReader reader(make_stream(state));

  EXPECT_EQ(drain(reader), (std::vector<std::string>{"{\"text\":\"hello\"}", "{\"text\":\"world\"}"}));
}

TEST(LineReaderTest, SkipsBlankAndKeepAliveLines) {
  auto state = make_state({"\r\n", "\r\n\r\n", "a\n", " \r\n\n", "b\r\n", "\r\n"});
  LineReader reader(make_stream(state));

  EXPECT_EQ(drain(reader), (std::vector<std::string>{"a", "b"}));
}

TEST(LineReaderTest, KeepsLineContentIntact) {
  std::string line = "  {\"text\":\"tab\\there \\u00e9 \xC3\xA9\"}  ";
  auto state = make_state({line + "\n"});
  LineReader reader(make_stream(state));

  auto lines = drain(reader);
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0], line);
}

TEST(LineReaderTest, UnterminatedFinalLine) {
  auto state = make_state({"first\n", "last"});
  LineReader reader(make_stream(state));

  EXPECT_EQ(drain(reader), (std::vector<std::string>{"first", "last"}));
}

TEST(LineReaderTest, EmptyBody) {
  auto state = make_state({});
  LineReader reader(make_stream(state));

  EXPECT_FALSE(reader.next().has_value());
  EXPECT_FALSE(reader.is_open());
  EXPECT_EQ(state->close_calls, 1);
}

TEST(LineReaderTest, ClosesOnceAtEndOfBody) {
  auto state = make_state({"a\nb\n"});
  {
    LineReader reader(make_stream(state));
    drain(reader);
    EXPECT_EQ(state->close_calls, 1);
    // Pulling again and closing again are no-ops
    EXPECT_FALSE(reader.next().has_value());
    reader.close();
  }
  EXPECT_EQ(state->close_calls, 1);
}

TEST(LineReaderTest, ClosesOnceWhenAbandoned) {
  auto state = make_state({"a\n", "b\n", "c\n"});
  {
    LineReader reader(make_stream(state));
    ASSERT_TRUE(reader.next().has_value());
  }
  EXPECT_EQ(state->close_calls, 1);
}

TEST(LineReaderTest, ExplicitClose) {
  auto state = make_state({"a\n", "b\n"});
  LineReader reader(make_stream(state));

  ASSERT_TRUE(reader.next().has_value());
  reader.close();
  EXPECT_FALSE(reader.is_open());
  EXPECT_FALSE(reader.next().has_value());
  EXPECT_EQ(state->close_calls, 1);
}

TEST(LineReaderTest, MovedFromReaderDoesNotClose) {
  auto state = make_state({"a\n", "b\n"});
  LineReader reader(make_stream(state));
  ASSERT_EQ(*reader.next(), "a");

  LineReader moved(std::move(reader));
  EXPECT_EQ(state->close_calls, 0);
  EXPECT_EQ(*moved.next(), "b");
  EXPECT_FALSE(moved.next().has_value());
  EXPECT_EQ(state->close_calls, 1);
}

TEST(LineReaderTest, TransportErrorPropagates) {
  auto state = make_state({"a\n"}, "Connection reset by peer");
  LineReader reader(make_stream(state));

  ASSERT_EQ(*reader.next(), "a");
  try {
    reader.next();
    FAIL() << "Expected ConnectionError";
  } catch (const ConnectionError &e) {
    EXPECT_STREQ(e.what(), "Connection reset by peer");
  }
  EXPECT_FALSE(reader.is_open());
  EXPECT_EQ(state->close_calls, 1);
}

TEST(LineReaderTest, LineTooLong) {
  auto state = make_state({std::string(64, 'x'), std::string(64, 'x'), "\n"});
  LineReader reader(make_stream(state), 100);

  EXPECT_THROW(reader.next(), ConnectionError);
  EXPECT_FALSE(reader.is_open());
  EXPECT_EQ(state->close_calls, 1);
}

TEST(LineReaderTest, LongLineWithinLimit) {
  std::string line(10000, 'y');
  auto state = make_state({line.substr(0, 3000), line.substr(3000), "\n"});
  LineReader reader(make_stream(state));

  auto lines = drain(reader);
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0], line);
}
