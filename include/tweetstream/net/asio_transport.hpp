#pragma once

#include <map>
#include <memory>
#include <string>

#include "tweetstream/core/config.hpp"
#include "tweetstream/net/auth_provider.hpp"
#include "tweetstream/net/transport.hpp"

namespace tweetstream::net {

// HTTP/1.1 streaming transport over asio (plain TCP or TLS via OpenSSL).
// Every request gets its own io_context and socket; reads block the calling thread
// until body bytes arrive or read_timeout expires.
class AsioTransport : public Transport {
 public:
  explicit AsioTransport(ConnectionOptions options, AuthProviderPtr auth = nullptr, std::map<std::string, std::string> headers = {});

  ~AsioTransport() override;

  std::unique_ptr<ResponseStream> send_streaming_request(HttpMethod method, const std::string &url, const StringParams &params) override;

  // Request head and body sent for the given call. Throws ConnectionError for an unusable URL.
  std::string build_request(HttpMethod method, const std::string &url, const StringParams &params) const;

 private:
  ConnectionOptions options_;
  AuthProviderPtr auth_;
  std::map<std::string, std::string> headers_;
};

}  // namespace tweetstream::net
