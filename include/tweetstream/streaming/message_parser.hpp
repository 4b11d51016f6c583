#pragma once

#include <functional>
#include <string>

#include "tweetstream/streaming/message.hpp"

namespace tweetstream::streaming {

// Turns one stream line into a message; throws ParsingError when it cannot
using MessageParser = std::function<StreamingMessage(const std::string &line)>;

// Classifies a line by its top-level keys (text, delete, scrub_geo, limit, status_withheld,
// user_withheld, disconnect, warning, friends, friends_str, event, direct_message, for_user,
// control; first match wins).
// Throws ParsingError for invalid JSON, a non-object value, an unknown shape, or a known
// shape with mistyped fields.
StreamingMessage parse_streaming_message(const std::string &line);

}  // namespace tweetstream::streaming
