#include "tweetstream/streaming/streaming_api.hpp"

#include <spdlog/spdlog.h>

#include "tweetstream/core/error.hpp"

namespace tweetstream::streaming {

namespace {

LineReader open_lines(net::Transport &transport, HttpMethod method, const std::string &url, const StringParams &params, size_t max_line_bytes) {
  auto stream = transport.send_streaming_request(method, url, params);
  if (!stream) {
    throw ConnectionError("Transport returned no response stream for " + url);
  }
  return LineReader(std::move(stream), max_line_bytes);
}

}  // namespace

StreamingApi::StreamingApi(std::shared_ptr<net::Transport> transport, ConnectionOptions options, MessageParser parser)
    : transport_(std::move(transport)), options_(std::move(options)), parser_(std::move(parser)) {}

Endpoint StreamingApi::get_endpoint(StreamType type) const {
  return resolve_endpoint(type, options_);
}

LineReader StreamingApi::connect(const StreamingParameters &parameters, HttpMethod method, const std::string &url) const {
  return open_lines(*transport_, method, url, parameters.serialize(), options_.max_line_bytes);
}

MessageStream StreamingApi::start_stream(StreamType type, const StreamingParameters &parameters) const {
  auto endpoint = get_endpoint(type);
  spdlog::info("Starting {} stream: {} {}", to_string(type), to_string(endpoint.method), endpoint.url);

  auto connector = [transport = transport_, endpoint, params = parameters.serialize(), max_line_bytes = options_.max_line_bytes]() {
    return open_lines(*transport, endpoint.method, endpoint.url, params, max_line_bytes);
  };
  return MessageStream(std::move(connector), parser_);
}

}  // namespace tweetstream::streaming
