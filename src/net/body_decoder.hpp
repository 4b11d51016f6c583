#pragma once

#include <cstddef>
#include <string>

namespace tweetstream::net {

// Incremental HTTP/1.1 response body decoder.
// Raw socket bytes go in, payload bytes come out; chunk framing may be split at any byte.
class BodyDecoder {
 public:
  enum class Framing {
    Chunked,        // Transfer-Encoding: chunked
    ContentLength,  // Fixed length
    UntilClose      // Body ends when the server closes the connection
  };

  static BodyDecoder chunked();
  static BodyDecoder content_length(size_t length);
  static BodyDecoder until_close();

  // Decodes up to size bytes, appending payload to out.
  // Returns the number of raw bytes consumed; bytes after the end of the body are left unconsumed.
  // Throws ConnectionError on malformed chunk framing.
  size_t feed(const char *data, size_t size, std::string &out);

  // The connection was closed by the peer. Returns true if that is a valid end of the body.
  bool on_eof();

  bool finished() const {
    return state_ == State::Done;
  }

  Framing framing() const {
    return framing_;
  }

 private:
  enum class State {
    ChunkSize,
    ChunkData,
    ChunkDataEnd,
    Trailer,
    Identity,
    Done
  };

  BodyDecoder(Framing framing, State state, size_t remaining) : framing_(framing), state_(state), remaining_(remaining) {}

  void finish_size_line();

  Framing framing_;
  State state_;
  size_t remaining_ = 0;
  std::string line_;
};

}  // namespace tweetstream::net
