#include "net/body_decoder.hpp"

#include <algorithm>
#include <charconv>

#include "tweetstream/core/error.hpp"

namespace tweetstream::net {

namespace {

// Chunk-size lines are a hex number plus optional extensions; anything longer is garbage
constexpr size_t kMaxSizeLine = 1024;

}  // namespace

BodyDecoder BodyDecoder::chunked() {
  return BodyDecoder(Framing::Chunked, State::ChunkSize, 0);
}

BodyDecoder BodyDecoder::content_length(size_t length) {
  return BodyDecoder(Framing::ContentLength, length == 0 ? State::Done : State::Identity, length);
}

BodyDecoder BodyDecoder::until_close() {
  return BodyDecoder(Framing::UntilClose, State::Identity, 0);
}

void BodyDecoder::finish_size_line() {
  std::string line = std::move(line_);
  line_.clear();

  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  // Drop chunk extensions
  auto semi = line.find(';');
  if (semi != std::string::npos) {
    line.erase(semi);
  }
  line.erase(0, line.find_first_not_of(" \t"));
  line.erase(line.find_last_not_of(" \t") + 1);

  size_t size = 0;
  auto [ptr, ec] = std::from_chars(line.data(), line.data() + line.size(), size, 16);
  if (line.empty() || ec != std::errc() || ptr != line.data() + line.size()) {
    throw ConnectionError("Malformed chunk size: '" + line + "'");
  }

  if (size == 0) {
    state_ = State::Trailer;
  } else {
    remaining_ = size;
    state_ = State::ChunkData;
  }
}

size_t BodyDecoder::feed(const char *data, size_t size, std::string &out) {
  size_t i = 0;
  while (i < size && state_ != State::Done) {
    switch (state_) {
      case State::ChunkSize: {
        char c = data[i++];
        if (c == '\n') {
          finish_size_line();
        } else {
          line_ += c;
          if (line_.size() > kMaxSizeLine) {
            throw ConnectionError("Chunk size line too long");
          }
        }
        break;
      }

      case State::ChunkData: {
        size_t take = std::min(remaining_, size - i);
        out.append(data + i, take);
        i += take;
        remaining_ -= take;
        if (remaining_ == 0) {
          state_ = State::ChunkDataEnd;
        }
        break;
      }

      case State::ChunkDataEnd: {
        char c = data[i++];
        if (c == '\n') {
          state_ = State::ChunkSize;
        } else if (c != '\r') {
          throw ConnectionError("Missing CRLF after chunk data");
        }
        break;
      }

      case State::Trailer: {
        char c = data[i++];
        if (c == '\n') {
          if (!line_.empty() && line_.back() == '\r') {
            line_.pop_back();
          }
          // Empty line terminates the trailer section
          if (line_.empty()) {
            state_ = State::Done;
          }
          line_.clear();
        } else {
          line_ += c;
          if (line_.size() > kMaxSizeLine) {
            throw ConnectionError("Trailer line too long");
          }
        }
        break;
      }

      case State::Identity: {
        if (framing_ == Framing::UntilClose) {
          out.append(data + i, size - i);
          i = size;
        } else {
          size_t take = std::min(remaining_, size - i);
          out.append(data + i, take);
          i += take;
          remaining_ -= take;
          if (remaining_ == 0) {
            state_ = State::Done;
          }
        }
        break;
      }

      case State::Done:
        break;
    }
  }
  return i;
}

bool BodyDecoder::on_eof() {
  if (framing_ == Framing::UntilClose) {
    state_ = State::Done;
  }
  return state_ == State::Done;
}

}  // namespace tweetstream::net
