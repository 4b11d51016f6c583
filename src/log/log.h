#ifndef TWEETSTREAM_LOG_H
#define TWEETSTREAM_LOG_H

#include <cstddef>
#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace tweetstream {

/**
 * Initialize logging.
 *
 * Rotation happens once per start-up:
 * - the previous tweetstream.log becomes tweetstream.0.log
 * - older files shift: tweetstream.0.log -> tweetstream.1.log -> ... -> tweetstream.{max_files-1}.log
 * - the oldest file is deleted
 *
 * @param log_path log file path (optional, defaults to ~/.config/tweetstream/log/tweetstream.log)
 * @param max_files number of rotated files kept
 * @param level trace, debug, info, warn, err, critical or off
 */
void init_log(const std::string& log_path = "", size_t max_files = 10, const std::string& level = "info");

/**
 * Default logger
 */
std::shared_ptr<spdlog::logger> get_logger();

}  // namespace tweetstream

#endif  // TWEETSTREAM_LOG_H
