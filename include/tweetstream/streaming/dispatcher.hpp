#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <string>

#include "tweetstream/streaming/line_reader.hpp"
#include "tweetstream/streaming/message.hpp"
#include "tweetstream/streaming/message_parser.hpp"

namespace tweetstream::streaming {

// Decodes one line. A ParsingError from the parser becomes a RawJsonMessage carrying the
// line and the error; payload problems never escape as exceptions.
StreamingMessage decode(const std::string &line, const MessageParser &parser);

StreamingMessage decode(const std::string &line);

// Lazy sequence of decoded messages.
// The connection is opened by the first pull; each pull reads exactly one line and decodes it
// before returning. ConnectionError propagates to the caller and ends the sequence.
class MessageStream {
 public:
  using Connector = std::function<LineReader()>;

  class Iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = StreamingMessage;
    using difference_type = std::ptrdiff_t;
    using pointer = const StreamingMessage *;
    using reference = const StreamingMessage &;

    Iterator() = default;
    explicit Iterator(MessageStream *stream);

    reference operator*() const;
    pointer operator->() const;
    Iterator &operator++();

    bool operator==(const Iterator &other) const;
    bool operator!=(const Iterator &other) const;

   private:
    void fetch_next();

    MessageStream *stream_ = nullptr;
    std::optional<StreamingMessage> current_;
  };

  MessageStream(Connector connect, MessageParser parser);

  MessageStream(MessageStream &&) noexcept = default;
  MessageStream &operator=(MessageStream &&) noexcept = default;

  MessageStream(const MessageStream &) = delete;
  MessageStream &operator=(const MessageStream &) = delete;

  // Next message in wire order, nullopt once the stream has ended or was closed
  std::optional<StreamingMessage> next();

  // Releases the connection; later pulls return nullopt
  void close();

  bool is_open() const;

  // Single pass: begin() pulls the first message
  Iterator begin();
  Iterator end();

 private:
  Connector connect_;
  MessageParser parser_;
  std::optional<LineReader> lines_;
  bool closed_ = false;
};

}  // namespace tweetstream::streaming
