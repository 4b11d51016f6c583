#pragma once

#include <memory>
#include <optional>
#include <string>

#include "tweetstream/core/config.hpp"
#include "tweetstream/core/types.hpp"

namespace tweetstream::net {

// Attaches credentials to outgoing streaming requests.
// Signing schemes (OAuth 1.0a and the like) need the method, URL and parameters, hence the wide signature.
class AuthProvider {
 public:
  virtual ~AuthProvider() = default;

  // Scheme identifier, e.g. "bearer"
  virtual std::string scheme() const = 0;

  // Value of the Authorization header for this request.
  // Returns nullopt if no credentials are available.
  virtual std::optional<std::string> get_auth_header(HttpMethod method, const std::string &url, const StringParams &params) = 0;
};

using AuthProviderPtr = std::shared_ptr<AuthProvider>;

// Static application token
class BearerTokenAuth : public AuthProvider {
 public:
  explicit BearerTokenAuth(std::string token);

  std::string scheme() const override;

  std::optional<std::string> get_auth_header(HttpMethod method, const std::string &url, const StringParams &params) override;

 private:
  std::string token_;
};

// Provider matching the configured credentials, or nullptr when none are configured
AuthProviderPtr make_auth_provider(const Config &config);

}  // namespace tweetstream::net
