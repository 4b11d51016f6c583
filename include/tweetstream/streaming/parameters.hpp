#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "tweetstream/core/types.hpp"

namespace tweetstream::streaming {

// Value of one streaming parameter
using ParameterValue = std::variant<std::string, bool, int64_t, std::vector<std::string>, std::vector<int64_t>>;

// Ordered request parameters (track, follow, locations, stall_warnings, ...).
// The filter stream needs at least one predicate; that is left to the server to enforce.
class StreamingParameters {
 public:
  StreamingParameters() = default;
  StreamingParameters(std::initializer_list<std::pair<std::string, ParameterValue>> params);

  // Build from a JSON object. Accepts strings, booleans, integers and arrays of strings or integers.
  // Throws std::invalid_argument for any other shape.
  static StreamingParameters from_json(const json &j);

  StreamingParameters &add(std::string name, ParameterValue value);
  StreamingParameters &add(std::string name, const char *value);

  // Same entries, values stringified: booleans as true/false, collections joined with ','
  StringParams serialize() const;

  const std::vector<std::pair<std::string, ParameterValue>> &entries() const {
    return params_;
  }

  bool empty() const {
    return params_.empty();
  }

  size_t size() const {
    return params_.size();
  }

 private:
  std::vector<std::pair<std::string, ParameterValue>> params_;
};

// Stringified form of a single value
std::string serialize_value(const ParameterValue &value);

}  // namespace tweetstream::streaming
