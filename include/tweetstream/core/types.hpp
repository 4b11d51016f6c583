#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tweetstream {

using json = nlohmann::json;

// Serialized request parameter: name -> already-stringified value
using StringParam = std::pair<std::string, std::string>;
using StringParams = std::vector<StringParam>;

// Kinds of long-lived feed
enum class StreamType {
  User,      // Per-account stream
  Site,      // Multi-account stream
  Filter,    // Public statuses matching predicates
  Sample,    // Random sample of public statuses
  Firehose   // All public statuses
};

std::string to_string(StreamType type);

std::optional<StreamType> stream_type_from_string(const std::string &str);

enum class HttpMethod {
  Get,
  Post
};

std::string to_string(HttpMethod method);

}  // namespace tweetstream
