#include "bgcore/exchange/stream_connection.hpp"

#include "bgcore/domain/errors.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/ssl.h>

#include <cstdint>

namespace bgcore {

namespace asio = boost::asio;
namespace ssl = asio::ssl;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;

namespace {

constexpr std::int64_t kWriteTimeoutMs = 5000;

std::int64_t steadyMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

// -----------------------------------------------------------------------------
// TlsStreamConnection
// -----------------------------------------------------------------------------
// Reads are asynchronous so that the owner can interleave pings, queued
// outbound frames and its stop flag; the io_context is driven in short
// slices on the caller's thread only.
// -----------------------------------------------------------------------------
class TlsStreamConnection final : public IStreamConnection {
 public:
  explicit TlsStreamConnection(const StreamEndpoint& endpoint)
      : ctx_(ssl::context::tls_client), ws_(ioc_, ctx_) {
    ctx_.set_default_verify_paths();

    tcp::resolver resolver(ioc_);
    const auto results = resolver.resolve(endpoint.host, endpoint.port);
    asio::connect(ws_.next_layer().next_layer(), results.begin(), results.end());

    // SNI must be set before the TLS handshake.
    if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(),
                                  endpoint.host.c_str())) {
      throw TransientNetworkError("failed to set SNI host name");
    }
    ws_.next_layer().set_verify_mode(ssl::verify_peer);
    ws_.next_layer().set_verify_callback(
        ssl::host_name_verification(endpoint.host));
    ws_.next_layer().handshake(ssl::stream_base::client);
    ws_.handshake(endpoint.host, endpoint.path);
    ws_.text(true);

    startRead();
  }

  ~TlsStreamConnection() override { close(); }

  std::optional<std::string> poll(std::chrono::milliseconds wait) override {
    runSlice(wait);
    if (!read_done_) {
      return std::nullopt;
    }
    if (read_ec_) {
      throw beast::system_error{read_ec_};
    }
    std::string text = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    startRead();
    return text;
  }

  void write(const std::string& text) override {
    bool done = false;
    beast::error_code ec;
    ws_.async_write(asio::buffer(text), [&](beast::error_code e, std::size_t) {
      ec = e;
      done = true;
    });
    const std::int64_t deadline = steadyMs() + kWriteTimeoutMs;
    while (!done) {
      if (steadyMs() > deadline) {
        throw TransientNetworkError("websocket write timed out");
      }
      runSlice(std::chrono::milliseconds(50));
    }
    if (ec) {
      throw beast::system_error{ec};
    }
  }

  void close() noexcept override {
    beast::error_code ignored;
    ws_.next_layer().next_layer().close(ignored);
  }

 private:
  void startRead() {
    read_done_ = false;
    ws_.async_read(buffer_, [this](beast::error_code ec, std::size_t) {
      read_ec_ = ec;
      read_done_ = true;
    });
  }

  void runSlice(std::chrono::milliseconds wait) {
    if (ioc_.stopped()) {
      ioc_.restart();
    }
    ioc_.run_for(wait);
  }

  asio::io_context ioc_;
  ssl::context ctx_;
  websocket::stream<ssl::stream<tcp::socket>> ws_;
  beast::flat_buffer buffer_;
  bool read_done_{false};
  beast::error_code read_ec_;
};

}  // namespace

std::unique_ptr<IStreamConnection> connectTls(const StreamEndpoint& endpoint) {
  return std::make_unique<TlsStreamConnection>(endpoint);
}

}  // namespace bgcore
