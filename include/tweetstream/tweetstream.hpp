#pragma once

// Core types
#include "tweetstream/core/config.hpp"
#include "tweetstream/core/error.hpp"
#include "tweetstream/core/types.hpp"

// Network
#include "tweetstream/net/asio_transport.hpp"
#include "tweetstream/net/auth_provider.hpp"
#include "tweetstream/net/transport.hpp"
#include "tweetstream/net/url.hpp"

// Streaming
#include "tweetstream/streaming/dispatcher.hpp"
#include "tweetstream/streaming/endpoint.hpp"
#include "tweetstream/streaming/line_reader.hpp"
#include "tweetstream/streaming/message.hpp"
#include "tweetstream/streaming/message_parser.hpp"
#include "tweetstream/streaming/parameters.hpp"
#include "tweetstream/streaming/streaming_api.hpp"

#include "tweetstream/version.hpp"

namespace tweetstream {

// Get version string
std::string version();

// StreamingApi over an AsioTransport configured from config (endpoints, token, extra headers)
streaming::StreamingApi make_streaming_api(const Config &config);

}  // namespace tweetstream
