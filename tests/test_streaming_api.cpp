#include <gtest/gtest.h>

#include "mock_transport.hpp"
#include "tweetstream/core/error.hpp"
#include "tweetstream/streaming/streaming_api.hpp"

using namespace tweetstream;
using namespace tweetstream::streaming;
using namespace tweetstream::testing;

namespace {

std::vector<std::string> collect_texts(MessageStream &stream) {
  std::vector<std::string> texts;
  for (const auto &message : stream) {
    if (auto *status = message.get_if<StatusMessage>()) {
      texts.push_back(status->text);
    } else if (auto *raw = message.get_if<RawJsonMessage>()) {
      texts.push_back("raw:" + raw->raw_json);
    }
  }
  return texts;
}

}  // namespace

TEST(StreamingApiTest, GetEndpoint) {
  StreamingApi api(std::make_shared<MockTransport>());

  auto endpoint = api.get_endpoint(StreamType::Filter);
  EXPECT_EQ(endpoint.method, HttpMethod::Post);
  EXPECT_EQ(endpoint.url, "https://stream.twitter.com/1.1/statuses/filter.json");

  EXPECT_THROW(api.get_endpoint(static_cast<StreamType>(42)), InvalidVariantError);
}

TEST(StreamingApiTest, StartStreamDecodesMessages) {
  auto transport = std::make_shared<MockTransport>();
  transport->state->chunks = {"{\"text\":\"hello\"}\r\n", "\r\n", "not json\r\n", "{\"text\":\"world\"}\r\n"};
  StreamingApi api(transport);

  auto stream = api.start_stream(StreamType::Filter, {{"track", std::vector<std::string>{"hello", "world"}}, {"stall_warnings", true}});

  EXPECT_EQ(collect_texts(stream), (std::vector<std::string>{"hello", "raw:not json", "world"}));
  EXPECT_EQ(transport->call_count, 1);
  EXPECT_EQ(transport->last_method, HttpMethod::Post);
  EXPECT_EQ(transport->last_url, "https://stream.twitter.com/1.1/statuses/filter.json");
  EXPECT_EQ(transport->last_params, (StringParams{{"track", "hello,world"}, {"stall_warnings", "true"}}));
  EXPECT_EQ(transport->state->close_calls, 1);
}

TEST(StreamingApiTest, StartStreamIsLazy) {
  auto transport = std::make_shared<MockTransport>();
  transport->state->chunks = {"{\"text\":\"a\"}\n"};
  StreamingApi api(transport);

  auto stream = api.start_stream(StreamType::Sample);
  EXPECT_EQ(transport->call_count, 0);

  ASSERT_TRUE(stream.next().has_value());
  EXPECT_EQ(transport->call_count, 1);
  EXPECT_EQ(transport->last_method, HttpMethod::Get);
  EXPECT_TRUE(transport->last_params.empty());
}

TEST(StreamingApiTest, InvalidTypeFailsBeforeConnecting) {
  auto transport = std::make_shared<MockTransport>();
  StreamingApi api(transport);

  EXPECT_THROW(api.start_stream(static_cast<StreamType>(9)), InvalidVariantError);
  EXPECT_EQ(transport->call_count, 0);
}

TEST(StreamingApiTest, RejectedConnection) {
  auto transport = std::make_shared<MockTransport>();
  transport->reject_with = "HTTP error 420";
  transport->reject_status = 420;
  StreamingApi api(transport);

  auto stream = api.start_stream(StreamType::User);
  try {
    stream.next();
    FAIL() << "Expected ConnectionError";
  } catch (const ConnectionError &e) {
    EXPECT_EQ(e.status_code(), 420);
  }
  EXPECT_EQ(transport->last_url, "https://userstream.twitter.com/1.1/user.json");
}

TEST(StreamingApiTest, TransportFailureMidStream) {
  auto transport = std::make_shared<MockTransport>();
  transport->state->chunks = {"{\"text\":\"one\"}\n", "{\"text\":\"two\"}\n"};
  transport->state->fail_with = "Read timed out";
  StreamingApi api(transport);

  auto stream = api.start_stream(StreamType::Firehose);
  std::vector<std::string> texts;
  try {
    for (const auto &message : stream) {
      texts.push_back(message.get<StatusMessage>().text);
    }
    FAIL() << "Expected ConnectionError";
  } catch (const ConnectionError &e) {
    EXPECT_STREQ(e.what(), "Read timed out");
  }
  EXPECT_EQ(texts, (std::vector<std::string>{"one", "two"}));
  EXPECT_EQ(transport->state->close_calls, 1);
}

TEST(StreamingApiTest, StreamOutlivesApi) {
  auto transport = std::make_shared<MockTransport>();
  transport->state->chunks = {"{\"text\":\"still here\"}\n"};

  std::optional<MessageStream> stream;
  {
    StreamingApi api(transport);
    stream.emplace(api.start_stream(StreamType::Site));
  }

  auto message = stream->next();
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(message->get<StatusMessage>().text, "still here");
  EXPECT_EQ(transport->last_url, "https://sitestream.twitter.com/1.1/site.json");
}

TEST(StreamingApiTest, ConnectReturnsLines) {
  auto transport = std::make_shared<MockTransport>();
  transport->state->chunks = {"{\"text\":\"a\"}\r\n\r\n", "not json\n"};
  StreamingApi api(transport);

  auto lines = api.connect({{"delimited", std::string("length")}}, HttpMethod::Get, "http://localhost/custom.json");
  EXPECT_EQ(transport->call_count, 1);
  EXPECT_EQ(transport->last_url, "http://localhost/custom.json");
  EXPECT_EQ(transport->last_params, (StringParams{{"delimited", "length"}}));

  EXPECT_EQ(*lines.next(), "{\"text\":\"a\"}");
  EXPECT_EQ(*lines.next(), "not json");
  EXPECT_FALSE(lines.next().has_value());
}

TEST(StreamingApiTest, CustomParser) {
  auto transport = std::make_shared<MockTransport>();
  transport->state->chunks = {"anything\n"};
  StreamingApi api(transport, ConnectionOptions{}, [](const std::string &) -> StreamingMessage { return LimitMessage{1}; });

  auto stream = api.start_stream(StreamType::Sample);
  auto message = stream.next();
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(message->type(), MessageType::Limit);
}

TEST(StreamingApiTest, IndependentStreams) {
  auto transport = std::make_shared<MockTransport>();
  transport->state->chunks = {"{\"text\":\"a\"}\n", "{\"text\":\"b\"}\n"};
  StreamingApi api(transport);

  auto first = api.start_stream(StreamType::Sample);
  auto second = api.start_stream(StreamType::Sample);
  first.close();

  EXPECT_EQ(transport->call_count, 0);
  ASSERT_TRUE(second.next().has_value());
  EXPECT_EQ(transport->call_count, 1);
}
