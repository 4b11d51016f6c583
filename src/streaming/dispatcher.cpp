#include "tweetstream/streaming/dispatcher.hpp"

#include <spdlog/spdlog.h>

#include "tweetstream/core/error.hpp"

namespace tweetstream::streaming {

StreamingMessage decode(const std::string &line, const MessageParser &parser) {
  try {
    return parser(line);
  } catch (const ParsingError &e) {
    spdlog::debug("Undecodable stream line ({}): {}", e.what(), line);
    return RawJsonMessage{line, e};
  } catch (const json::exception &e) {
    // Custom parsers may let nlohmann errors through
    spdlog::debug("Undecodable stream line ({}): {}", e.what(), line);
    return RawJsonMessage{line, ParsingError(e.what(), line)};
  }
}

StreamingMessage decode(const std::string &line) {
  return decode(line, parse_streaming_message);
}

// --- MessageStream ---

MessageStream::MessageStream(Connector connect, MessageParser parser) : connect_(std::move(connect)), parser_(std::move(parser)) {}

std::optional<StreamingMessage> MessageStream::next() {
  if (closed_) return std::nullopt;

  try {
    if (!lines_) {
      lines_.emplace(connect_());
    }

    auto line = lines_->next();
    if (!line) {
      closed_ = true;
      spdlog::info("Stream ended");
      return std::nullopt;
    }
    return decode(*line, parser_);
  } catch (const ConnectionError &e) {
    closed_ = true;
    if (lines_) lines_->close();
    spdlog::warn("Stream terminated: {}", e.what());
    throw;
  }
}

void MessageStream::close() {
  closed_ = true;
  if (lines_) lines_->close();
}

bool MessageStream::is_open() const {
  return !closed_ && lines_ && lines_->is_open();
}

MessageStream::Iterator MessageStream::begin() {
  return Iterator(this);
}

MessageStream::Iterator MessageStream::end() {
  return Iterator();
}

// --- MessageStream::Iterator ---

MessageStream::Iterator::Iterator(MessageStream *stream) : stream_(stream) {
  fetch_next();
}

void MessageStream::Iterator::fetch_next() {
  if (!stream_) return;

  current_ = stream_->next();
  if (!current_) {
    stream_ = nullptr;
  }
}

MessageStream::Iterator::reference MessageStream::Iterator::operator*() const {
  return *current_;
}

MessageStream::Iterator::pointer MessageStream::Iterator::operator->() const {
  return &*current_;
}

MessageStream::Iterator &MessageStream::Iterator::operator++() {
  fetch_next();
  return *this;
}

bool MessageStream::Iterator::operator==(const Iterator &other) const {
  return stream_ == other.stream_;
}

bool MessageStream::Iterator::operator!=(const Iterator &other) const {
  return !(*this == other);
}

}  // namespace tweetstream::streaming
