#include "tweetstream/streaming/endpoint.hpp"

#include <array>

#include "tweetstream/core/error.hpp"
#include "tweetstream/net/url.hpp"

namespace tweetstream::streaming {

namespace {

enum class BaseUrl {
  UserStream,
  SiteStream,
  PublicStream
};

struct EndpointSpec {
  StreamType type;
  HttpMethod method;
  BaseUrl base;
  const char *resource;
};

// Indexed by StreamType
constexpr std::array<EndpointSpec, 5> kEndpoints = {{
    {StreamType::User, HttpMethod::Get, BaseUrl::UserStream, "user.json"},
    {StreamType::Site, HttpMethod::Get, BaseUrl::SiteStream, "site.json"},
    {StreamType::Filter, HttpMethod::Post, BaseUrl::PublicStream, "statuses/filter.json"},
    {StreamType::Sample, HttpMethod::Get, BaseUrl::PublicStream, "statuses/sample.json"},
    {StreamType::Firehose, HttpMethod::Get, BaseUrl::PublicStream, "statuses/firehose.json"},
}};

const std::string &base_url(BaseUrl base, const ConnectionOptions &options) {
  switch (base) {
    case BaseUrl::UserStream:
      return options.user_stream_url;
    case BaseUrl::SiteStream:
      return options.site_stream_url;
    case BaseUrl::PublicStream:
      break;
  }
  return options.stream_url;
}

}  // namespace

Endpoint resolve_endpoint(StreamType type, const ConnectionOptions &options) {
  auto index = static_cast<size_t>(type);
  if (index >= kEndpoints.size() || kEndpoints[index].type != type) {
    throw InvalidVariantError("Invalid stream type: " + std::to_string(static_cast<int>(type)));
  }

  const auto &spec = kEndpoints[index];
  return Endpoint{spec.method, net::build_url(base_url(spec.base, options), true, options.api_version, spec.resource)};
}

}  // namespace tweetstream::streaming
