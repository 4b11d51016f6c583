#include "tweetstream/streaming/message.hpp"

namespace tweetstream::streaming {

std::string to_string(MessageType type) {
  switch (type) {
    case MessageType::Status:
      return "status";
    case MessageType::Delete:
      return "delete";
    case MessageType::ScrubGeo:
      return "scrub_geo";
    case MessageType::Limit:
      return "limit";
    case MessageType::Withheld:
      return "withheld";
    case MessageType::Disconnect:
      return "disconnect";
    case MessageType::Warning:
      return "warning";
    case MessageType::Friends:
      return "friends";
    case MessageType::Event:
      return "event";
    case MessageType::DirectMessage:
      return "direct_message";
    case MessageType::Envelopes:
      return "envelopes";
    case MessageType::Control:
      return "control";
    case MessageType::RawJson:
      return "raw_json";
  }
  return "unknown";
}

MessageType StreamingMessage::type() const {
  // Variant alternatives are declared in MessageType order
  return static_cast<MessageType>(value_.index());
}

}  // namespace tweetstream::streaming
