#include "tweetstream/core/types.hpp"

namespace tweetstream {

std::string to_string(StreamType type) {
  switch (type) {
    case StreamType::User:
      return "user";
    case StreamType::Site:
      return "site";
    case StreamType::Filter:
      return "filter";
    case StreamType::Sample:
      return "sample";
    case StreamType::Firehose:
      return "firehose";
  }
  return "unknown";
}

std::optional<StreamType> stream_type_from_string(const std::string &str) {
  if (str == "user") return StreamType::User;
  if (str == "site") return StreamType::Site;
  if (str == "filter") return StreamType::Filter;
  if (str == "sample") return StreamType::Sample;
  if (str == "firehose") return StreamType::Firehose;
  return std::nullopt;
}

std::string to_string(HttpMethod method) {
  switch (method) {
    case HttpMethod::Get:
      return "GET";
    case HttpMethod::Post:
      return "POST";
  }
  return "GET";
}

}  // namespace tweetstream
