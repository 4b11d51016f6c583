#pragma once

#include <stdexcept>
#include <string>

namespace tweetstream {

// Base class of every error raised by the library
class Error : public std::runtime_error {
 public:
  explicit Error(const std::string &what) : std::runtime_error(what) {}
};

// Stream type outside the known set; raised before any connection attempt
class InvalidVariantError : public Error {
 public:
  explicit InvalidVariantError(const std::string &what) : Error(what) {}
};

// Transport failure while connecting or reading. Ends the current stream.
class ConnectionError : public Error {
 public:
  explicit ConnectionError(const std::string &what, int status_code = 0, std::string body = {})
      : Error(what), status_code_(status_code), body_(std::move(body)) {}

  // HTTP status when the server answered with a non-2xx status, 0 otherwise
  int status_code() const {
    return status_code_;
  }

  // Leading part of the server's error body, if any
  const std::string &body() const {
    return body_;
  }

 private:
  int status_code_;
  std::string body_;
};

// A line that could not be decoded into a recognized message
class ParsingError : public Error {
 public:
  ParsingError(const std::string &what, std::string json) : Error(what), json_(std::move(json)) {}

  const std::string &json() const {
    return json_;
  }

 private:
  std::string json_;
};

}  // namespace tweetstream
