#include "tweetstream/net/asio_transport.hpp"

#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <asio.hpp>
#include <asio/ssl.hpp>
#include <cctype>
#include <charconv>
#include <chrono>
#include <regex>
#include <sstream>

#include "net/body_decoder.hpp"
#include "tweetstream/core/error.hpp"
#include "tweetstream/net/url.hpp"

namespace tweetstream::net {

namespace {

// Bytes of a rejected response's body kept in the error
constexpr size_t kMaxErrorBody = 512;

// Upper bound on the status line plus headers
constexpr size_t kMaxHeaderBytes = 64 * 1024;

using Clock = std::chrono::steady_clock;

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// Header fields are written verbatim, so a line break would start a new header
void check_header_field(const std::string &name, const std::string &value) {
  if (name.empty() || name.find_first_of("\r\n: ") != std::string::npos) {
    throw ConnectionError("Invalid header name: " + name);
  }
  if (value.find_first_of("\r\n") != std::string::npos) {
    throw ConnectionError("Invalid value for header " + name);
  }
}

// One open streaming response. Blocking calls are built from asio async operations
// driven by io_context::run_until, so every step can be bounded by a deadline.
class AsioResponseStream : public ResponseStream {
 public:
  AsioResponseStream(const ParsedUrl &url, const ConnectionOptions &options)
      : ssl_ctx_(asio::ssl::context::tls_client), resolver_(io_ctx_), read_timeout_(options.read_timeout), decoder_(BodyDecoder::until_close()) {
    if (url.is_https()) {
      ssl_ctx_.set_default_verify_paths();
      ssl_ctx_.set_verify_mode(asio::ssl::verify_peer);
      // The certificate must also be issued for the host we asked for
#if ASIO_VERSION >= 102800
      ssl_ctx_.set_verify_callback(asio::ssl::host_name_verification(url.host));
#else
      ssl_ctx_.set_verify_callback(asio::ssl::rfc2818_verification(url.host));
#endif
      ssl_socket_ = std::make_unique<asio::ssl::stream<asio::ip::tcp::socket>>(io_ctx_, ssl_ctx_);
      // Set SNI hostname
      SSL_set_tlsext_host_name(ssl_socket_->native_handle(), url.host.c_str());
    } else {
      tcp_socket_ = std::make_unique<asio::ip::tcp::socket>(io_ctx_);
    }
  }

  ~AsioResponseStream() override {
    close();
  }

  AsioResponseStream(const AsioResponseStream &) = delete;
  AsioResponseStream &operator=(const AsioResponseStream &) = delete;

  // Connects, sends the request and consumes the response head
  void open(const ParsedUrl &url, const std::string &request, std::chrono::seconds connect_timeout) {
    const auto deadline = Clock::now() + connect_timeout;

    asio::error_code ec = asio::error::would_block;
    asio::ip::tcp::resolver::results_type endpoints;
    resolver_.async_resolve(url.host, url.port_or_default(), [&](const asio::error_code &e, asio::ip::tcp::resolver::results_type results) {
      ec = e;
      endpoints = std::move(results);
    });
    run_until(deadline, "DNS resolution");
    if (ec) fail("DNS resolution failed: " + ec.message());

    ec = asio::error::would_block;
    asio::async_connect(lowest_layer(), endpoints, [&](const asio::error_code &e, const asio::ip::tcp::endpoint &) {
      ec = e;
    });
    run_until(deadline, "Connection");
    if (ec) fail("Connection failed: " + ec.message());

    if (ssl_socket_) {
      ec = asio::error::would_block;
      ssl_socket_->async_handshake(asio::ssl::stream_base::client, [&](const asio::error_code &e) {
        ec = e;
      });
      run_until(deadline, "SSL handshake");
      if (ec) fail("SSL handshake failed: " + ec.message());
    }

    ec = asio::error::would_block;
    with_stream([&](auto &stream) {
      asio::async_write(stream, asio::buffer(request), [&](const asio::error_code &e, size_t) {
        ec = e;
      });
    });
    run_until(deadline, "Request write");
    if (ec) fail("Write failed: " + ec.message());

    ec = asio::error::would_block;
    with_stream([&](auto &stream) {
      asio::async_read_until(stream, buffer_, "\r\n\r\n", [&](const asio::error_code &e, size_t) {
        ec = e;
      });
    });
    run_until(deadline, "Response header read");
    if (ec) fail("Read headers failed: " + ec.message());

    parse_head();
  }

  size_t read_some(char *buffer, size_t size) override {
    if (size == 0) return 0;

    while (decoded_pos_ >= decoded_.size()) {
      decoded_.clear();
      decoded_pos_ = 0;
      if (!open_ || decoder_.finished()) return 0;
      fill();
    }

    size_t n = std::min(size, decoded_.size() - decoded_pos_);
    std::copy_n(decoded_.data() + decoded_pos_, n, buffer);
    decoded_pos_ += n;
    return n;
  }

  void close() override {
    if (!open_) return;
    open_ = false;

    asio::error_code ignored;
    resolver_.cancel();
    if (ssl_socket_) ssl_socket_->lowest_layer().close(ignored);
    if (tcp_socket_) tcp_socket_->close(ignored);
    spdlog::debug("Streaming connection closed");
  }

  bool is_open() const override {
    return open_;
  }

 private:
  asio::ip::tcp::socket::lowest_layer_type &lowest_layer() {
    if (ssl_socket_) return ssl_socket_->lowest_layer();
    return tcp_socket_->lowest_layer();
  }

  template <typename Fn>
  void with_stream(Fn &&fn) {
    if (ssl_socket_) {
      fn(*ssl_socket_);
    } else {
      fn(*tcp_socket_);
    }
  }

  // Runs the pending operation to completion. On deadline expiry the socket is closed,
  // the aborted handler is drained and ConnectionError is thrown.
  void run_until(Clock::time_point deadline, const std::string &what) {
    io_ctx_.restart();
    io_ctx_.run_until(deadline);
    if (!io_ctx_.stopped()) {
      close();
      io_ctx_.run();
      spdlog::warn("{} timed out", what);
      throw ConnectionError(what + " timed out");
    }
  }

  [[noreturn]] void fail(const std::string &message, int status_code = 0, std::string body = {}) {
    close();
    spdlog::warn("Streaming connection failed: {}", message);
    throw ConnectionError(message, status_code, std::move(body));
  }

  void parse_head() {
    std::istream stream(&buffer_);
    std::string status_line;
    std::getline(stream, status_line);

    static const std::regex status_regex(R"(HTTP/[\d.]+ (\d+))");
    std::smatch match;
    if (!std::regex_search(status_line, match, status_regex)) {
      fail("Invalid HTTP response: cannot parse status line");
    }
    auto status = match[1].str();
    auto [ptr, err] = std::from_chars(status.data(), status.data() + status.size(), status_code_);
    if (err != std::errc()) {
      fail("Invalid HTTP response: cannot parse status code");
    }

    std::string header_line;
    while (std::getline(stream, header_line) && header_line != "\r" && !header_line.empty()) {
      auto colon = header_line.find(':');
      if (colon != std::string::npos) {
        std::string key = to_lower(header_line.substr(0, colon));
        std::string value = header_line.substr(colon + 1);
        // Trim whitespace
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);
        headers_[key] = value;
      }
    }

    std::string leftover = take_buffered();

    if (status_code_ < 200 || status_code_ >= 300) {
      fail("HTTP error " + std::to_string(status_code_), status_code_, leftover.substr(0, kMaxErrorBody));
    }

    auto te = headers_.find("transfer-encoding");
    auto cl = headers_.find("content-length");
    if (te != headers_.end() && to_lower(te->second).find("chunked") != std::string::npos) {
      decoder_ = BodyDecoder::chunked();
    } else if (cl != headers_.end()) {
      size_t length = 0;
      auto [p, e] = std::from_chars(cl->second.data(), cl->second.data() + cl->second.size(), length);
      if (e != std::errc() || p != cl->second.data() + cl->second.size()) {
        fail("Invalid Content-Length: " + cl->second);
      }
      decoder_ = BodyDecoder::content_length(length);
    } else {
      decoder_ = BodyDecoder::until_close();
    }

    spdlog::debug("Stream opened: status {}, framing {}", status_code_,
                  decoder_.framing() == BodyDecoder::Framing::Chunked ? "chunked" : "identity");

    decode(leftover.data(), leftover.size());
  }

  std::string take_buffered() {
    auto data = buffer_.data();
    std::string raw(asio::buffers_begin(data), asio::buffers_end(data));
    buffer_.consume(buffer_.size());
    return raw;
  }

  void decode(const char *data, size_t size) {
    try {
      decoder_.feed(data, size, decoded_);
    } catch (const ConnectionError &e) {
      close();
      spdlog::warn("Malformed response body: {}", e.what());
      throw;
    }
  }

  // Reads one batch of raw bytes and decodes it
  void fill() {
    asio::error_code ec = asio::error::would_block;
    size_t bytes = 0;
    with_stream([&](auto &stream) {
      stream.async_read_some(asio::buffer(raw_), [&](const asio::error_code &e, size_t n) {
        ec = e;
        bytes = n;
      });
    });
    run_until(Clock::now() + read_timeout_, "Read");

    if (bytes > 0) {
      decode(raw_.data(), bytes);
    }

    if (ec == asio::error::eof || ec == asio::ssl::error::stream_truncated) {
      if (!decoder_.on_eof()) {
        fail("Connection closed before the end of the response body");
      }
      spdlog::info("Server closed the stream");
      return;
    }
    if (ec) fail("Read failed: " + ec.message());
  }

  asio::io_context io_ctx_;
  asio::ssl::context ssl_ctx_;
  asio::ip::tcp::resolver resolver_;

  std::unique_ptr<asio::ssl::stream<asio::ip::tcp::socket>> ssl_socket_;
  std::unique_ptr<asio::ip::tcp::socket> tcp_socket_;

  asio::streambuf buffer_{kMaxHeaderBytes};
  std::array<char, 8192> raw_{};
  std::chrono::seconds read_timeout_;

  int status_code_ = 0;
  std::map<std::string, std::string> headers_;

  BodyDecoder decoder_;
  std::string decoded_;
  size_t decoded_pos_ = 0;

  bool open_ = true;
};

}  // namespace

AsioTransport::AsioTransport(ConnectionOptions options, AuthProviderPtr auth, std::map<std::string, std::string> headers)
    : options_(std::move(options)), auth_(std::move(auth)), headers_(std::move(headers)) {}

AsioTransport::~AsioTransport() = default;

std::string AsioTransport::build_request(HttpMethod method, const std::string &url, const StringParams &params) const {
  auto parsed = ParsedUrl::parse(url);
  if (!parsed) {
    throw ConnectionError("Invalid URL: " + url);
  }

  std::string encoded = form_encode(params);
  std::string target = parsed->path + parsed->query;
  if (method == HttpMethod::Get && !encoded.empty()) {
    target += parsed->query.empty() ? "?" : "&";
    target += encoded;
  }

  std::ostringstream req;
  req << to_string(method) << " " << target << " HTTP/1.1\r\n";
  req << "Host: " << parsed->host;
  if (!parsed->port.empty() && parsed->port != (parsed->is_https() ? "443" : "80")) {
    req << ":" << parsed->port;
  }
  req << "\r\n";
  check_header_field("User-Agent", options_.user_agent);
  req << "User-Agent: " << options_.user_agent << "\r\n";
  req << "Accept: */*\r\n";
  req << "Connection: close\r\n";

  if (auth_) {
    if (auto auth_header = auth_->get_auth_header(method, url, params)) {
      req << "Authorization: " << *auth_header << "\r\n";
    }
  }

  for (const auto &[key, value] : headers_) {
    check_header_field(key, value);
    req << key << ": " << value << "\r\n";
  }

  if (method == HttpMethod::Post) {
    req << "Content-Type: application/x-www-form-urlencoded\r\n";
    req << "Content-Length: " << encoded.size() << "\r\n";
  }

  req << "\r\n";
  if (method == HttpMethod::Post) {
    req << encoded;
  }
  return req.str();
}

std::unique_ptr<ResponseStream> AsioTransport::send_streaming_request(HttpMethod method, const std::string &url, const StringParams &params) {
  auto parsed = ParsedUrl::parse(url);
  if (!parsed) {
    throw ConnectionError("Invalid URL: " + url);
  }

  std::string request = build_request(method, url, params);
  spdlog::info("Opening stream: {} {}", to_string(method), url);

  auto stream = std::make_unique<AsioResponseStream>(*parsed, options_);
  stream->open(*parsed, request, options_.connect_timeout);
  return stream;
}

}  // namespace tweetstream::net
