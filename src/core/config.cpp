#include "tweetstream/core/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace tweetstream {

namespace fs = std::filesystem;

namespace {

void load_connection(const json &j, ConnectionOptions &options) {
  options.user_stream_url = j.value("user_stream_url", options.user_stream_url);
  options.site_stream_url = j.value("site_stream_url", options.site_stream_url);
  options.stream_url = j.value("stream_url", options.stream_url);
  options.api_version = j.value("api_version", options.api_version);
  options.user_agent = j.value("user_agent", options.user_agent);
  options.connect_timeout = std::chrono::seconds(j.value("connect_timeout", static_cast<int64_t>(options.connect_timeout.count())));
  options.read_timeout = std::chrono::seconds(j.value("read_timeout", static_cast<int64_t>(options.read_timeout.count())));
  options.max_line_bytes = j.value("max_line_bytes", options.max_line_bytes);
}

}  // namespace

Config Config::load(const fs::path &path) {
  Config config;

  if (!fs::exists(path)) {
    return config;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::warn("Cannot open config file {}", path.string());
    return config;
  }

  try {
    json j = json::parse(file);

    if (j.contains("connection")) {
      load_connection(j["connection"], config.connection);
    }

    if (j.contains("bearer_token")) {
      config.bearer_token = j["bearer_token"].get<std::string>();
    }

    if (j.contains("headers")) {
      for (auto &[k, v] : j["headers"].items()) {
        config.headers[k] = v.get<std::string>();
      }
    }

    config.log_level = j.value("log_level", "info");
    if (j.contains("log_file")) {
      config.log_file = j["log_file"].get<std::string>();
    }
  } catch (const json::exception &e) {
    spdlog::warn("Ignoring malformed config file {}: {}", path.string(), e.what());
    return Config{};
  }

  return config;
}

Config Config::load_default() {
  // Try to load from project config first, then global
  auto project_config = config_paths::project_config_file();
  if (fs::exists(project_config)) {
    return load(project_config);
  }

  auto global_config = config_paths::default_config_file();
  if (fs::exists(global_config)) {
    return load(global_config);
  }

  return Config{};
}

Config Config::from_env() {
  Config config = load_default();

  if (const char *token = std::getenv("TWEETSTREAM_BEARER_TOKEN")) {
    config.bearer_token = token;
  }
  if (const char *url = std::getenv("TWEETSTREAM_STREAM_URL")) {
    config.connection.stream_url = url;
  }
  if (const char *url = std::getenv("TWEETSTREAM_USER_STREAM_URL")) {
    config.connection.user_stream_url = url;
  }
  if (const char *url = std::getenv("TWEETSTREAM_SITE_STREAM_URL")) {
    config.connection.site_stream_url = url;
  }
  if (const char *level = std::getenv("TWEETSTREAM_LOG_LEVEL")) {
    config.log_level = level;
  }

  return config;
}

void Config::save(const fs::path &path) const {
  json j;

  j["connection"] = {{"user_stream_url", connection.user_stream_url},
                     {"site_stream_url", connection.site_stream_url},
                     {"stream_url", connection.stream_url},
                     {"api_version", connection.api_version},
                     {"user_agent", connection.user_agent},
                     {"connect_timeout", connection.connect_timeout.count()},
                     {"read_timeout", connection.read_timeout.count()},
                     {"max_line_bytes", connection.max_line_bytes}};

  if (bearer_token) {
    j["bearer_token"] = *bearer_token;
  }
  if (!headers.empty()) {
    j["headers"] = headers;
  }

  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }

  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
  }

  std::ofstream file(path);
  if (!file.is_open()) {
    spdlog::warn("Cannot write config file {}", path.string());
    return;
  }
  file << j.dump(2);
}

namespace config_paths {

fs::path home_dir() {
  const char *home = std::getenv("HOME");
  if (home) {
    return fs::path(home);
  }
#ifdef _WIN32
  const char *userprofile = std::getenv("USERPROFILE");
  if (userprofile) {
    return fs::path(userprofile);
  }
#endif
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "tweetstream";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

fs::path project_config_file() {
  return fs::current_path() / ".tweetstream" / "config.json";
}

}  // namespace config_paths

}  // namespace tweetstream
