#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "tweetstream/core/types.hpp"

namespace tweetstream {

// Endpoints and transport limits used when opening a stream
struct ConnectionOptions {
  std::string user_stream_url = "https://userstream.twitter.com";
  std::string site_stream_url = "https://sitestream.twitter.com";
  std::string stream_url = "https://stream.twitter.com";
  std::string api_version = "1.1";

  std::string user_agent = "tweetstream";

  // Resolve + connect + handshake + response headers
  std::chrono::seconds connect_timeout{30};
  // Longest silence tolerated between body reads (the server sends keep-alive newlines)
  std::chrono::seconds read_timeout{90};

  // A line growing past this without a terminator aborts the stream
  size_t max_line_bytes = 1024 * 1024;
};

// Application configuration
struct Config {
  ConnectionOptions connection;

  // Static token sent as "Authorization: Bearer ..."
  std::optional<std::string> bearer_token;

  // Extra headers added to every streaming request
  std::map<std::string, std::string> headers;

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;

  // Load from file
  static Config load(const std::filesystem::path &path);
  static Config load_default();

  // load_default() overridden by TWEETSTREAM_* environment variables
  static Config from_env();

  // Save to file
  void save(const std::filesystem::path &path) const;
};

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();
std::filesystem::path config_dir();
std::filesystem::path default_config_file();
std::filesystem::path project_config_file();
}  // namespace config_paths

}  // namespace tweetstream
