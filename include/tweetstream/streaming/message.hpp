#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "tweetstream/core/error.hpp"
#include "tweetstream/core/types.hpp"

namespace tweetstream::streaming {

class StreamingMessage;

// Kind of a decoded stream line
enum class MessageType {
  Status,
  Delete,
  ScrubGeo,
  Limit,
  Withheld,
  Disconnect,
  Warning,
  Friends,
  Event,
  DirectMessage,
  Envelopes,
  Control,
  RawJson
};

std::string to_string(MessageType type);

// New status. Only text is required; the full object is kept in `status`.
struct StatusMessage {
  int64_t id = 0;
  std::string text;
  std::string user_screen_name;
  json status;
};

// Deletion notice for a status or a direct message
struct DeleteMessage {
  enum class Target {
    Status,
    DirectMessage
  };

  Target target = Target::Status;
  int64_t id = 0;
  int64_t user_id = 0;
};

// Location data must be removed from statuses up to up_to_status_id
struct ScrubGeoMessage {
  int64_t user_id = 0;
  int64_t up_to_status_id = 0;
};

// Number of matching statuses not delivered because of rate limiting
struct LimitMessage {
  int64_t track = 0;
};

struct WithheldMessage {
  enum class Target {
    Status,
    User
  };

  Target target = Target::Status;
  int64_t id = 0;
  int64_t user_id = 0;  // Status owner; 0 for user_withheld
  std::vector<std::string> withheld_in_countries;
};

// The server is about to close the connection
struct DisconnectMessage {
  int code = 0;
  std::string stream_name;
  std::string reason;
};

// Stall or follow-limit warning
struct WarningMessage {
  std::string code;
  std::string message;
  std::optional<int> percent_full;
  std::optional<int64_t> user_id;
};

// Friend list preamble of a user stream. Numeric ids are kept as decimal strings.
struct FriendsMessage {
  std::vector<std::string> friend_ids;
};

// Account activity (favorite, follow, list changes, ...)
struct EventMessage {
  std::string event;
  std::string created_at;
  json source;
  json target;
  json target_object;
};

struct DirectMessageMessage {
  int64_t id = 0;
  std::string text;
  json direct_message;
};

// Site stream envelope: `message` is addressed to the account for_user
struct EnvelopesMessage {
  int64_t for_user = 0;
  std::shared_ptr<const StreamingMessage> message;
};

// Site stream control URI
struct ControlMessage {
  std::string control_uri;
};

// A line that could not be decoded, kept verbatim with the reason
struct RawJsonMessage {
  std::string raw_json;
  ParsingError error;
};

// One decoded stream line
class StreamingMessage {
 public:
  using Variant = std::variant<StatusMessage, DeleteMessage, ScrubGeoMessage, LimitMessage, WithheldMessage, DisconnectMessage, WarningMessage,
                               FriendsMessage, EventMessage, DirectMessageMessage, EnvelopesMessage, ControlMessage, RawJsonMessage>;

  // Implicit from any message kind
  template <typename T,
            typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, StreamingMessage> && std::is_constructible_v<Variant, T &&>>>
  StreamingMessage(T &&message) : value_(std::forward<T>(message)) {}

  MessageType type() const;

  const Variant &value() const {
    return value_;
  }

  template <typename T>
  bool is() const {
    return std::holds_alternative<T>(value_);
  }

  template <typename T>
  const T *get_if() const {
    return std::get_if<T>(&value_);
  }

  // Throws std::bad_variant_access if the message is of another kind
  template <typename T>
  const T &get() const {
    return std::get<T>(value_);
  }

 private:
  Variant value_;
};

inline MessageType message_type(const StreamingMessage &message) {
  return message.type();
}

}  // namespace tweetstream::streaming
