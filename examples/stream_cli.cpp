// Prints one line per message of a stream:
//   tweetstream_cli filter track=cpp,rust stall_warnings=true
//   tweetstream_cli sample --max 100
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

#include "log/log.h"
#include "tweetstream/tweetstream.hpp"

using namespace tweetstream;
using namespace tweetstream::streaming;

static std::atomic<bool> g_stop{false};

static void sigint_handler(int) {
  g_stop = true;
}

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

static std::string summarize(const StreamingMessage &message) {
  return std::visit(overloaded{
                        [](const StatusMessage &m) { return "@" + m.user_screen_name + ": " + m.text; },
                        [](const DeleteMessage &m) { return "id=" + std::to_string(m.id); },
                        [](const ScrubGeoMessage &m) { return "user=" + std::to_string(m.user_id) + " up_to=" + std::to_string(m.up_to_status_id); },
                        [](const LimitMessage &m) { return "track=" + std::to_string(m.track); },
                        [](const WithheldMessage &m) { return "id=" + std::to_string(m.id); },
                        [](const DisconnectMessage &m) { return std::to_string(m.code) + " " + m.reason; },
                        [](const WarningMessage &m) { return m.code + " " + m.message; },
                        [](const FriendsMessage &m) { return std::to_string(m.friend_ids.size()) + " friends"; },
                        [](const EventMessage &m) { return m.event; },
                        [](const DirectMessageMessage &m) { return m.text; },
                        [](const EnvelopesMessage &m) {
                          return "for_user=" + std::to_string(m.for_user) + " " + (m.message ? to_string(m.message->type()) : std::string("?"));
                        },
                        [](const ControlMessage &m) { return m.control_uri; },
                        [](const RawJsonMessage &m) { return std::string(m.error.what()) + ": " + m.raw_json; },
                    },
                    message.value());
}

static void print_usage(const char *argv0) {
  std::cerr << "tweetstream " << version() << "\n"
            << "Usage: " << argv0 << " <user|site|filter|sample|firehose> [name=value ...] [--max N]\n"
            << "Credentials and endpoints come from ~/.config/tweetstream/config.json and TWEETSTREAM_* variables.\n";
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    print_usage(argv[0]);
    return 2;
  }

  auto type = stream_type_from_string(argv[1]);
  if (!type) {
    std::cerr << "Unknown stream type: " << argv[1] << "\n";
    print_usage(argv[0]);
    return 2;
  }

  StreamingParameters parameters;
  long max_messages = -1;
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--max" && i + 1 < argc) {
      max_messages = std::strtol(argv[++i], nullptr, 10);
      continue;
    }
    auto eq = arg.find('=');
    if (eq == std::string::npos || eq == 0) {
      std::cerr << "Expected name=value, got: " << arg << "\n";
      return 2;
    }
    parameters.add(arg.substr(0, eq), arg.substr(eq + 1));
  }

  auto config = Config::from_env();
  init_log(config.log_file ? config.log_file->string() : "", 10, config.log_level);

  std::signal(SIGINT, sigint_handler);

  auto api = make_streaming_api(config);
  try {
    auto stream = api.start_stream(*type, parameters);
    long count = 0;
    // Checked between messages; a blocked read returns at the latest after read_timeout
    while (!g_stop) {
      auto message = stream.next();
      if (!message) break;
      std::cout << to_string(message->type()) << "\t" << summarize(*message) << "\n" << std::flush;
      if (max_messages >= 0 && ++count >= max_messages) break;
    }
    stream.close();
  } catch (const ConnectionError &e) {
    std::cerr << "Connection error: " << e.what();
    if (e.status_code() != 0) {
      std::cerr << " (HTTP " << e.status_code() << ")";
    }
    if (!e.body().empty()) {
      std::cerr << "\n" << e.body();
    }
    std::cerr << "\n";
    return 1;
  }

  return 0;
}
