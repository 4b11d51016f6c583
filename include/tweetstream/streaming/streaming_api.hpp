#pragma once

#include <memory>
#include <string>

#include "tweetstream/core/config.hpp"
#include "tweetstream/core/types.hpp"
#include "tweetstream/net/transport.hpp"
#include "tweetstream/streaming/dispatcher.hpp"
#include "tweetstream/streaming/endpoint.hpp"
#include "tweetstream/streaming/line_reader.hpp"
#include "tweetstream/streaming/message_parser.hpp"
#include "tweetstream/streaming/parameters.hpp"

namespace tweetstream::streaming {

// Entry point of the streaming API.
// Holds no per-stream state; every start_stream() call gets its own connection.
class StreamingApi {
 public:
  explicit StreamingApi(std::shared_ptr<net::Transport> transport, ConnectionOptions options = {},
                        MessageParser parser = parse_streaming_message);

  // URL and verb for a stream type. Throws InvalidVariantError.
  Endpoint get_endpoint(StreamType type) const;

  // Sends the request now and returns the body's non-empty lines.
  // Throws ConnectionError if the request cannot be established.
  LineReader connect(const StreamingParameters &parameters, HttpMethod method, const std::string &url) const;

  // Lazy message sequence for a stream type. The endpoint is resolved immediately
  // (InvalidVariantError is thrown here); the connection is opened by the first pull.
  MessageStream start_stream(StreamType type, const StreamingParameters &parameters = {}) const;

  const ConnectionOptions &options() const {
    return options_;
  }

 private:
  std::shared_ptr<net::Transport> transport_;
  ConnectionOptions options_;
  MessageParser parser_;
};

}  // namespace tweetstream::streaming
