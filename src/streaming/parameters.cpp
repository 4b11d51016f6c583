#include "tweetstream/streaming/parameters.hpp"

#include <stdexcept>
#include <type_traits>

namespace tweetstream::streaming {

namespace {

template <typename T>
std::string join(const std::vector<T> &items) {
  std::string out;
  for (const auto &item : items) {
    if (!out.empty()) out += ',';
    if constexpr (std::is_same_v<T, std::string>) {
      out += item;
    } else {
      out += std::to_string(item);
    }
  }
  return out;
}

ParameterValue value_from_json(const std::string &name, const json &v) {
  if (v.is_string()) return v.get<std::string>();
  if (v.is_boolean()) return v.get<bool>();
  if (v.is_number_integer()) return v.get<int64_t>();

  if (v.is_array()) {
    if (v.empty()) return std::vector<std::string>{};

    if (v.front().is_string()) {
      std::vector<std::string> items;
      for (const auto &item : v) {
        if (!item.is_string()) throw std::invalid_argument("Parameter '" + name + "' mixes strings with other types");
        items.push_back(item.get<std::string>());
      }
      return items;
    }

    if (v.front().is_number_integer()) {
      std::vector<int64_t> items;
      for (const auto &item : v) {
        if (!item.is_number_integer()) throw std::invalid_argument("Parameter '" + name + "' mixes integers with other types");
        items.push_back(item.get<int64_t>());
      }
      return items;
    }
  }

  throw std::invalid_argument("Unsupported value for parameter '" + name + "': " + v.dump());
}

}  // namespace

StreamingParameters::StreamingParameters(std::initializer_list<std::pair<std::string, ParameterValue>> params) : params_(params) {}

StreamingParameters StreamingParameters::from_json(const json &j) {
  if (!j.is_object()) {
    throw std::invalid_argument("Streaming parameters must be a JSON object");
  }

  StreamingParameters params;
  for (auto &[name, value] : j.items()) {
    params.add(name, value_from_json(name, value));
  }
  return params;
}

StreamingParameters &StreamingParameters::add(std::string name, ParameterValue value) {
  params_.emplace_back(std::move(name), std::move(value));
  return *this;
}

StreamingParameters &StreamingParameters::add(std::string name, const char *value) {
  return add(std::move(name), ParameterValue(std::string(value)));
}

StringParams StreamingParameters::serialize() const {
  StringParams out;
  out.reserve(params_.size());
  for (const auto &[name, value] : params_) {
    out.emplace_back(name, serialize_value(value));
  }
  return out;
}

std::string serialize_value(const ParameterValue &value) {
  return std::visit(
      [](const auto &v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
          return v;
        } else if constexpr (std::is_same_v<T, bool>) {
          return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
          return std::to_string(v);
        } else {
          return join(v);
        }
      },
      value);
}

}  // namespace tweetstream::streaming
