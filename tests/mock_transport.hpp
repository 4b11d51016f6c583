#pragma once

#include <algorithm>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tweetstream/core/error.hpp"
#include "tweetstream/net/transport.hpp"

namespace tweetstream::testing {

// Observable state of a MockResponseStream; outlives the stream so tests can inspect it
struct MockStreamState {
  std::vector<std::string> chunks;
  // Thrown as ConnectionError after the last chunk instead of ending the body
  std::optional<std::string> fail_with;

  size_t next_chunk = 0;
  int read_calls = 0;
  int close_calls = 0;
};

// Delivers one queued chunk per read_some call
class MockResponseStream : public net::ResponseStream {
 public:
  explicit MockResponseStream(std::shared_ptr<MockStreamState> state) : state_(std::move(state)) {}

  size_t read_some(char *buffer, size_t size) override {
    state_->read_calls++;
    if (closed_) return 0;

    auto &chunks = state_->chunks;
    while (state_->next_chunk < chunks.size()) {
      auto &chunk = chunks[state_->next_chunk];
      if (chunk.empty()) {
        state_->next_chunk++;
        continue;
      }
      size_t n = std::min(size, chunk.size());
      std::memcpy(buffer, chunk.data(), n);
      chunk.erase(0, n);
      if (chunk.empty()) state_->next_chunk++;
      return n;
    }

    if (state_->fail_with) {
      throw ConnectionError(*state_->fail_with);
    }
    return 0;
  }

  void close() override {
    if (closed_) return;
    closed_ = true;
    state_->close_calls++;
  }

  bool is_open() const override {
    return !closed_;
  }

 private:
  std::shared_ptr<MockStreamState> state_;
  bool closed_ = false;
};

// Records requests and hands out MockResponseStreams over a shared state
class MockTransport : public net::Transport {
 public:
  std::shared_ptr<MockStreamState> state = std::make_shared<MockStreamState>();

  // When set, send_streaming_request throws ConnectionError with this message and status
  std::optional<std::string> reject_with;
  int reject_status = 0;

  HttpMethod last_method = HttpMethod::Get;
  std::string last_url;
  StringParams last_params;
  int call_count = 0;

  std::unique_ptr<net::ResponseStream> send_streaming_request(HttpMethod method, const std::string &url, const StringParams &params) override {
    call_count++;
    last_method = method;
    last_url = url;
    last_params = params;
    if (reject_with) {
      throw ConnectionError(*reject_with, reject_status);
    }
    return std::make_unique<MockResponseStream>(state);
  }
};

inline std::unique_ptr<net::ResponseStream> make_stream(std::shared_ptr<MockStreamState> state) {
  return std::make_unique<MockResponseStream>(std::move(state));
}

inline std::shared_ptr<MockStreamState> make_state(std::vector<std::string> chunks, std::optional<std::string> fail_with = std::nullopt) {
  auto state = std::make_shared<MockStreamState>();
  state->chunks = std::move(chunks);
  state->fail_with = std::move(fail_with);
  return state;
}

}  // namespace tweetstream::testing
