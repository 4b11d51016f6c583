#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "tweetstream/core/config.hpp"

using namespace tweetstream;

namespace fs = std::filesystem;

namespace {

fs::path temp_config_path(const std::string &name) {
  return fs::temp_directory_path() / ("tweetstream_test_" + name) / "config.json";
}

}  // namespace

// --- ConfigTest ---

TEST(ConfigTest, Defaults) {
  Config config;

  EXPECT_EQ(config.connection.user_stream_url, "https://userstream.twitter.com");
  EXPECT_EQ(config.connection.site_stream_url, "https://sitestream.twitter.com");
  EXPECT_EQ(config.connection.stream_url, "https://stream.twitter.com");
  EXPECT_EQ(config.connection.api_version, "1.1");
  EXPECT_EQ(config.connection.connect_timeout, std::chrono::seconds(30));
  EXPECT_EQ(config.connection.read_timeout, std::chrono::seconds(90));
  EXPECT_EQ(config.connection.max_line_bytes, 1024u * 1024u);
  EXPECT_FALSE(config.bearer_token.has_value());
  EXPECT_TRUE(config.headers.empty());
  EXPECT_EQ(config.log_level, "info");
}

TEST(ConfigTest, MissingFileGivesDefaults) {
  auto config = Config::load("/nonexistent/tweetstream/config.json");
  EXPECT_EQ(config.connection.stream_url, "https://stream.twitter.com");
  EXPECT_FALSE(config.bearer_token.has_value());
}

TEST(ConfigTest, SaveAndLoad) {
  auto path = temp_config_path("roundtrip");

  Config config;
  config.connection.stream_url = "http://127.0.0.1:8080";
  config.connection.read_timeout = std::chrono::seconds(5);
  config.connection.max_line_bytes = 4096;
  config.bearer_token = "secret";
  config.headers["X-Trace"] = "1";
  config.log_level = "debug";
  config.log_file = "/tmp/tweetstream.log";
  config.save(path);

  auto loaded = Config::load(path);
  EXPECT_EQ(loaded.connection.stream_url, "http://127.0.0.1:8080");
  EXPECT_EQ(loaded.connection.user_stream_url, "https://userstream.twitter.com");
  EXPECT_EQ(loaded.connection.read_timeout, std::chrono::seconds(5));
  EXPECT_EQ(loaded.connection.max_line_bytes, 4096u);
  ASSERT_TRUE(loaded.bearer_token.has_value());
  EXPECT_EQ(*loaded.bearer_token, "secret");
  EXPECT_EQ(loaded.headers.at("X-Trace"), "1");
  EXPECT_EQ(loaded.log_level, "debug");
  ASSERT_TRUE(loaded.log_file.has_value());
  EXPECT_EQ(*loaded.log_file, fs::path("/tmp/tweetstream.log"));

  fs::remove_all(path.parent_path());
}

TEST(ConfigTest, PartialFileKeepsOtherDefaults) {
  auto path = temp_config_path("partial");
  fs::create_directories(path.parent_path());
  {
    std::ofstream out(path);
    out << R"({"connection": {"site_stream_url": "https://site.example"}})";
  }

  auto config = Config::load(path);
  EXPECT_EQ(config.connection.site_stream_url, "https://site.example");
  EXPECT_EQ(config.connection.stream_url, "https://stream.twitter.com");
  EXPECT_EQ(config.connection.connect_timeout, std::chrono::seconds(30));

  fs::remove_all(path.parent_path());
}

TEST(ConfigTest, MalformedFileGivesDefaults) {
  auto path = temp_config_path("malformed");
  fs::create_directories(path.parent_path());
  {
    std::ofstream out(path);
    out << R"({"bearer_token": 42, "log_level": "trace"})";
  }

  auto config = Config::load(path);
  EXPECT_FALSE(config.bearer_token.has_value());
  EXPECT_EQ(config.log_level, "info");

  fs::remove_all(path.parent_path());
}

TEST(ConfigTest, EnvironmentOverrides) {
  setenv("TWEETSTREAM_BEARER_TOKEN", "env-token", 1);
  setenv("TWEETSTREAM_STREAM_URL", "http://localhost:9000", 1);
  setenv("TWEETSTREAM_LOG_LEVEL", "warn", 1);

  auto config = Config::from_env();
  ASSERT_TRUE(config.bearer_token.has_value());
  EXPECT_EQ(*config.bearer_token, "env-token");
  EXPECT_EQ(config.connection.stream_url, "http://localhost:9000");
  EXPECT_EQ(config.log_level, "warn");

  unsetenv("TWEETSTREAM_BEARER_TOKEN");
  unsetenv("TWEETSTREAM_STREAM_URL");
  unsetenv("TWEETSTREAM_LOG_LEVEL");
}

// --- ConfigPathsTest ---

TEST(ConfigPathsTest, HomeDir) {
  auto home = config_paths::home_dir();

  EXPECT_FALSE(home.empty());
}

TEST(ConfigPathsTest, ConfigDir) {
  auto config_dir = config_paths::config_dir();

  EXPECT_EQ(config_dir.filename(), "tweetstream");
  EXPECT_EQ(config_dir.parent_path().filename(), ".config");
  EXPECT_EQ(config_paths::default_config_file().filename(), "config.json");
}
