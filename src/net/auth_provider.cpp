#include "tweetstream/net/auth_provider.hpp"

namespace tweetstream::net {

BearerTokenAuth::BearerTokenAuth(std::string token) : token_(std::move(token)) {}

std::string BearerTokenAuth::scheme() const {
  return "bearer";
}

std::optional<std::string> BearerTokenAuth::get_auth_header(HttpMethod, const std::string &, const StringParams &) {
  if (token_.empty()) {
    return std::nullopt;
  }
  return "Bearer " + token_;
}

AuthProviderPtr make_auth_provider(const Config &config) {
  if (!config.bearer_token || config.bearer_token->empty()) {
    return nullptr;
  }
  return std::make_shared<BearerTokenAuth>(*config.bearer_token);
}

}  // namespace tweetstream::net
