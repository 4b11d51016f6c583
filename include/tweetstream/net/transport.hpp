#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "tweetstream/core/types.hpp"

namespace tweetstream::net {

// Body of an open streaming response.
// Implementations own the connection; close() releases it and may be called any number of times.
class ResponseStream {
 public:
  virtual ~ResponseStream() = default;

  // Blocks until at least one body byte is available.
  // Returns 0 once the body has ended; throws ConnectionError on transport failure.
  virtual size_t read_some(char *buffer, size_t size) = 0;

  virtual void close() = 0;

  virtual bool is_open() const = 0;
};

// Issues long-lived HTTP requests. Owns credentials and connection setup.
class Transport {
 public:
  virtual ~Transport() = default;

  // Parameters travel as query string for GET and as a form body for POST.
  // Throws ConnectionError when the request cannot be established or the server rejects it.
  virtual std::unique_ptr<ResponseStream> send_streaming_request(HttpMethod method, const std::string &url, const StringParams &params) = 0;
};

}  // namespace tweetstream::net
