#include "tweetstream/streaming/line_reader.hpp"

#include <spdlog/spdlog.h>

#include <array>

#include "tweetstream/core/error.hpp"

namespace tweetstream::streaming {

namespace {

bool is_blank(const std::string &line) {
  return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

}  // namespace

LineReader::LineReader(std::unique_ptr<net::ResponseStream> stream, size_t max_line_bytes)
    : stream_(std::move(stream)), max_line_bytes_(max_line_bytes) {}

LineReader::~LineReader() {
  close();
}

LineReader::LineReader(LineReader &&other) noexcept
    : stream_(std::move(other.stream_)), buffer_(std::move(other.buffer_)), scan_pos_(other.scan_pos_), max_line_bytes_(other.max_line_bytes_) {
  other.buffer_.clear();
  other.scan_pos_ = 0;
}

LineReader &LineReader::operator=(LineReader &&other) noexcept {
  if (this != &other) {
    close();
    stream_ = std::move(other.stream_);
    buffer_ = std::move(other.buffer_);
    scan_pos_ = other.scan_pos_;
    max_line_bytes_ = other.max_line_bytes_;
    other.buffer_.clear();
    other.scan_pos_ = 0;
  }
  return *this;
}

std::optional<std::string> LineReader::next() {
  std::array<char, 4096> chunk;

  while (stream_) {
    if (auto line = extract_line()) {
      if (is_blank(*line)) {
        spdlog::trace("Skipping keep-alive line");
        continue;
      }
      return line;
    }

    if (buffer_.size() > max_line_bytes_) {
      close();
      throw ConnectionError("Stream line exceeds " + std::to_string(max_line_bytes_) + " bytes");
    }

    size_t n = 0;
    try {
      n = stream_->read_some(chunk.data(), chunk.size());
    } catch (const ConnectionError &) {
      close();
      throw;
    }

    if (n == 0) {
      // End of body: an unterminated final line still counts
      std::string rest = std::move(buffer_);
      close();
      if (!rest.empty() && rest.back() == '\r') {
        rest.pop_back();
      }
      if (is_blank(rest)) {
        return std::nullopt;
      }
      return rest;
    }

    buffer_.append(chunk.data(), n);
  }

  return std::nullopt;
}

void LineReader::close() {
  buffer_.clear();
  scan_pos_ = 0;
  if (!stream_) return;

  stream_->close();
  stream_.reset();
}

std::optional<std::string> LineReader::extract_line() {
  auto pos = buffer_.find('\n', scan_pos_);
  if (pos == std::string::npos) {
    scan_pos_ = buffer_.size();
    return std::nullopt;
  }

  std::string line = buffer_.substr(0, pos);
  buffer_.erase(0, pos + 1);
  scan_pos_ = 0;

  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return line;
}

}  // namespace tweetstream::streaming
