#pragma once

#include <string>

#include "tweetstream/core/config.hpp"
#include "tweetstream/core/types.hpp"

namespace tweetstream::streaming {

struct Endpoint {
  HttpMethod method = HttpMethod::Get;
  std::string url;
};

// URL and verb of a stream type.
// Throws InvalidVariantError for a value outside the StreamType enumerators.
Endpoint resolve_endpoint(StreamType type, const ConnectionOptions &options);

}  // namespace tweetstream::streaming
