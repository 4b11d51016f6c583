#pragma once

#include <optional>
#include <string>

#include "tweetstream/core/types.hpp"

namespace tweetstream::net {

// URL parsing helper
struct ParsedUrl {
  std::string scheme;
  std::string host;
  std::string port;
  std::string path;
  std::string query;  // Includes the leading '?' when present

  bool is_https() const {
    return scheme == "https";
  }

  std::string port_or_default() const;

  static std::optional<ParsedUrl> parse(const std::string &url);
};

// Join an API base URL and a resource path.
// Trailing slashes of base_url are dropped; "/<api_version>" is inserted when with_version is set.
std::string build_url(const std::string &base_url, bool with_version, const std::string &api_version, const std::string &resource);

// Percent-encode everything outside the RFC 3986 unreserved set
std::string url_encode(const std::string &value);

// name1=value1&name2=value2, both sides percent-encoded, in the given order
std::string form_encode(const StringParams &params);

}  // namespace tweetstream::net
