#include "tweetstream/streaming/message_parser.hpp"

#include <cstdint>
#include <limits>
#include <string>

namespace tweetstream::streaming {

namespace {

// Rejects floats and values outside T instead of letting get<T>() truncate them.
template <typename T>
T checked_int(const json &value, const char *field, const std::string &line) {
  if (value.is_number_unsigned()) {
    auto v = value.get<uint64_t>();
    if (v <= static_cast<uint64_t>(std::numeric_limits<T>::max())) return static_cast<T>(v);
  } else if (value.is_number_integer()) {
    auto v = value.get<int64_t>();
    if (v >= std::numeric_limits<T>::min() && v <= std::numeric_limits<T>::max()) return static_cast<T>(v);
  }
  throw ParsingError(std::string("Field '") + field + "' is not a valid integer", line);
}

int64_t optional_id(const json &obj, const char *key, const std::string &line) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return 0;
  return checked_int<int64_t>(*it, key, line);
}

StatusMessage parse_status(const json &j, const std::string &line) {
  StatusMessage msg;
  msg.id = optional_id(j, "id", line);
  msg.text = j.at("text").get<std::string>();
  auto user = j.find("user");
  if (user != j.end() && user->is_object()) {
    msg.user_screen_name = user->value("screen_name", "");
  }
  msg.status = j;
  return msg;
}

DeleteMessage parse_delete(const json &j, const std::string &line) {
  const auto &body = j.at("delete");
  DeleteMessage msg;
  const json *target = nullptr;
  if (body.contains("status")) {
    msg.target = DeleteMessage::Target::Status;
    target = &body.at("status");
  } else {
    msg.target = DeleteMessage::Target::DirectMessage;
    target = &body.at("direct_message");
  }
  msg.id = checked_int<int64_t>(target->at("id"), "id", line);
  msg.user_id = optional_id(*target, "user_id", line);
  return msg;
}

ScrubGeoMessage parse_scrub_geo(const json &j, const std::string &line) {
  const auto &body = j.at("scrub_geo");
  return ScrubGeoMessage{checked_int<int64_t>(body.at("user_id"), "user_id", line),
                         checked_int<int64_t>(body.at("up_to_status_id"), "up_to_status_id", line)};
}

LimitMessage parse_limit(const json &j, const std::string &line) {
  return LimitMessage{checked_int<int64_t>(j.at("limit").at("track"), "track", line)};
}

WithheldMessage parse_withheld(const json &j, WithheldMessage::Target target, const std::string &line) {
  const auto &body = j.at(target == WithheldMessage::Target::Status ? "status_withheld" : "user_withheld");
  WithheldMessage msg;
  msg.target = target;
  msg.id = checked_int<int64_t>(body.at("id"), "id", line);
  msg.user_id = optional_id(body, "user_id", line);
  if (body.contains("withheld_in_countries")) {
    msg.withheld_in_countries = body.at("withheld_in_countries").get<std::vector<std::string>>();
  }
  return msg;
}

DisconnectMessage parse_disconnect(const json &j, const std::string &line) {
  const auto &body = j.at("disconnect");
  DisconnectMessage msg;
  msg.code = checked_int<int>(body.at("code"), "code", line);
  msg.stream_name = body.value("stream_name", "");
  msg.reason = body.value("reason", "");
  return msg;
}

WarningMessage parse_warning(const json &j, const std::string &line) {
  const auto &body = j.at("warning");
  WarningMessage msg;
  msg.code = body.value("code", "");
  msg.message = body.value("message", "");
  if (body.contains("percent_full")) {
    msg.percent_full = checked_int<int>(body.at("percent_full"), "percent_full", line);
  }
  if (body.contains("user_id")) {
    msg.user_id = checked_int<int64_t>(body.at("user_id"), "user_id", line);
  }
  return msg;
}

FriendsMessage parse_friends(const json &j, const std::string &line) {
  FriendsMessage msg;
  if (j.contains("friends_str")) {
    msg.friend_ids = j.at("friends_str").get<std::vector<std::string>>();
    return msg;
  }
  for (const auto &id : j.at("friends")) {
    msg.friend_ids.push_back(std::to_string(checked_int<int64_t>(id, "friends", line)));
  }
  return msg;
}

EventMessage parse_event(const json &j) {
  EventMessage msg;
  msg.event = j.at("event").get<std::string>();
  msg.created_at = j.value("created_at", "");
  msg.source = j.value("source", json());
  msg.target = j.value("target", json());
  msg.target_object = j.value("target_object", json());
  return msg;
}

DirectMessageMessage parse_direct_message(const json &j, const std::string &line) {
  const auto &body = j.at("direct_message");
  DirectMessageMessage msg;
  msg.id = optional_id(body, "id", line);
  msg.text = body.value("text", "");
  msg.direct_message = body;
  return msg;
}

ControlMessage parse_control(const json &j) {
  return ControlMessage{j.at("control").at("control_uri").get<std::string>()};
}

StreamingMessage classify(const json &j, const std::string &line, bool allow_envelope);

EnvelopesMessage parse_envelopes(const json &j, const std::string &line) {
  EnvelopesMessage msg;
  msg.for_user = checked_int<int64_t>(j.at("for_user"), "for_user", line);
  // Envelopes wrap exactly one level; the inner message reports errors against the wire line
  msg.message = std::make_shared<const StreamingMessage>(classify(j.at("message"), line, false));
  return msg;
}

StreamingMessage classify(const json &j, const std::string &line, bool allow_envelope) {
  if (!j.is_object()) {
    throw ParsingError("Stream message is not a JSON object", line);
  }

  if (j.contains("text")) return parse_status(j, line);
  if (j.contains("delete")) return parse_delete(j, line);
  if (j.contains("scrub_geo")) return parse_scrub_geo(j, line);
  if (j.contains("limit")) return parse_limit(j, line);
  if (j.contains("status_withheld")) return parse_withheld(j, WithheldMessage::Target::Status, line);
  if (j.contains("user_withheld")) return parse_withheld(j, WithheldMessage::Target::User, line);
  if (j.contains("disconnect")) return parse_disconnect(j, line);
  if (j.contains("warning")) return parse_warning(j, line);
  if (j.contains("friends") || j.contains("friends_str")) return parse_friends(j, line);
  if (j.contains("event")) return parse_event(j);
  if (j.contains("direct_message")) return parse_direct_message(j, line);
  if (j.contains("for_user")) {
    if (!allow_envelope) throw ParsingError("Nested stream envelope", line);
    return parse_envelopes(j, line);
  }
  if (j.contains("control")) return parse_control(j);

  throw ParsingError("Unsupported stream message type", line);
}

}  // namespace

StreamingMessage parse_streaming_message(const std::string &line) {
  json j;
  try {
    j = json::parse(line);
  } catch (const json::parse_error &e) {
    throw ParsingError(std::string("Invalid JSON: ") + e.what(), line);
  }

  try {
    return classify(j, line, true);
  } catch (const json::exception &e) {
    // Known message kind, unexpected field layout
    throw ParsingError(std::string("Malformed stream message: ") + e.what(), line);
  }
}

}  // namespace tweetstream::streaming
