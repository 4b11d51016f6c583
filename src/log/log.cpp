#include "log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

#include "tweetstream/core/config.hpp"

namespace tweetstream {

namespace {

// tweetstream.log -> tweetstream.0.log -> ... -> tweetstream.{max_files-1}.log (oldest deleted)
void rotate_logs_on_startup(const std::filesystem::path& log_dir, const std::string& stem, size_t max_files) {
  namespace fs = std::filesystem;

  fs::path current_log = log_dir / (stem + ".log");
  if (!fs::exists(current_log) || max_files == 0) {
    return;
  }

  std::error_code ec;
  fs::path oldest = log_dir / (stem + "." + std::to_string(max_files - 1) + ".log");
  if (fs::exists(oldest)) {
    fs::remove(oldest, ec);
  }

  for (int i = static_cast<int>(max_files) - 2; i >= 0; --i) {
    fs::path old_name = log_dir / (stem + "." + std::to_string(i) + ".log");
    fs::path new_name = log_dir / (stem + "." + std::to_string(i + 1) + ".log");
    if (fs::exists(old_name)) {
      fs::rename(old_name, new_name, ec);
    }
  }

  fs::rename(current_log, log_dir / (stem + ".0.log"), ec);
}

}  // namespace

void init_log(const std::string& log_path, size_t max_files, const std::string& level) {
  try {
    namespace fs = std::filesystem;

    fs::path actual_path;
    if (log_path.empty()) {
      actual_path = config_paths::config_dir() / "log" / "tweetstream.log";
    } else {
      actual_path = log_path;
    }
    fs::path log_dir = actual_path.parent_path();

    std::error_code ec;
    if (!log_dir.empty()) {
      fs::create_directories(log_dir, ec);
      if (ec) {
        std::cerr << "Failed to create log directory: " << ec.message() << "\n";
        return;
      }
    }

    rotate_logs_on_startup(log_dir, actual_path.stem().string(), max_files);

    // Fresh file on every start
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true);
    auto logger = std::make_shared<spdlog::logger>("tweetstream", file_sink);

    auto log_level = spdlog::level::from_str(level);
    // from_str maps unknown names to off
    if (log_level == spdlog::level::off && level != "off") {
      log_level = spdlog::level::info;
    }
    logger->set_level(log_level);

    // [time] [level] [thread id] message
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
    logger->flush_on(spdlog::level::info);

    spdlog::drop("tweetstream");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::info("=== tweetstream started (log: {}) ===", actual_path.string());
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

std::shared_ptr<spdlog::logger> get_logger() {
  return spdlog::default_logger();
}

}  // namespace tweetstream
