#include "tweetstream/net/url.hpp"

#include <regex>

namespace tweetstream::net {

std::optional<ParsedUrl> ParsedUrl::parse(const std::string &url) {
  // Simple regex-based URL parser
  static const std::regex url_regex(R"(^(https?):\/\/([^:\/\s]+)(?::(\d+))?(\/[^\?\s]*)?(\?[^\s]*)?)");
  std::smatch match;

  if (!std::regex_match(url, match, url_regex)) {
    return std::nullopt;
  }

  ParsedUrl result;
  result.scheme = match[1].str();
  result.host = match[2].str();
  result.port = match[3].str();
  result.path = match[4].str().empty() ? "/" : match[4].str();
  result.query = match[5].str();

  return result;
}

std::string ParsedUrl::port_or_default() const {
  if (!port.empty()) return port;
  return is_https() ? "443" : "80";
}

std::string build_url(const std::string &base_url, bool with_version, const std::string &api_version, const std::string &resource) {
  std::string url = base_url;
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }

  if (with_version) {
    url += '/';
    url += api_version;
  }

  url += '/';
  url += resource;
  return url;
}

std::string url_encode(const std::string &value) {
  static const char hex[] = "0123456789ABCDEF";

  std::string out;
  out.reserve(value.size());
  for (unsigned char c : value) {
    bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '.' || c == '_' || c == '~';
    if (unreserved) {
      out += static_cast<char>(c);
    } else {
      out += '%';
      out += hex[c >> 4];
      out += hex[c & 0x0F];
    }
  }
  return out;
}

std::string form_encode(const StringParams &params) {
  std::string out;
  for (const auto &[name, value] : params) {
    if (!out.empty()) out += '&';
    out += url_encode(name);
    out += '=';
    out += url_encode(value);
  }
  return out;
}

}  // namespace tweetstream::net
