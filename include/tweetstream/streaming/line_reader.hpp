#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "tweetstream/net/transport.hpp"

namespace tweetstream::streaming {

// Lazy, single-pass sequence of the non-empty lines of a response body.
// Owns the connection: it is closed exactly once, when the body ends, a read fails,
// close() is called, or the reader is destroyed.
class LineReader {
 public:
  static constexpr size_t kDefaultMaxLineBytes = 1024 * 1024;

  explicit LineReader(std::unique_ptr<net::ResponseStream> stream, size_t max_line_bytes = kDefaultMaxLineBytes);

  ~LineReader();

  LineReader(LineReader &&other) noexcept;
  LineReader &operator=(LineReader &&other) noexcept;

  LineReader(const LineReader &) = delete;
  LineReader &operator=(const LineReader &) = delete;

  // Next line with its terminator stripped. Blank and whitespace-only lines (keep-alives) are skipped.
  // Returns nullopt once the body has ended or the reader is closed.
  // Throws ConnectionError on a transport failure; the reader is closed afterwards.
  std::optional<std::string> next();

  void close();

  bool is_open() const {
    return stream_ != nullptr;
  }

 private:
  std::optional<std::string> extract_line();

  std::unique_ptr<net::ResponseStream> stream_;
  std::string buffer_;
  size_t scan_pos_ = 0;
  size_t max_line_bytes_;
};

}  // namespace tweetstream::streaming
