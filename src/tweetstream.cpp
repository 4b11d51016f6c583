#include "tweetstream/tweetstream.hpp"

namespace tweetstream {

std::string version() {
  return TWEETSTREAM_VERSION;
}

streaming::StreamingApi make_streaming_api(const Config &config) {
  auto transport = std::make_shared<net::AsioTransport>(config.connection, net::make_auth_provider(config), config.headers);
  return streaming::StreamingApi(std::move(transport), config.connection);
}

}  // namespace tweetstream
