#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace bgcore {

struct StreamEndpoint {
  std::string host{"ws.bitget.com"};
  std::string port{"443"};
  std::string path;  // "/v2/ws/public" or "/v2/ws/private"
};

// -----------------------------------------------------------------------------
// IStreamConnection: one open websocket, text frames only
// -----------------------------------------------------------------------------
// All calls come from the owning channel's thread. Any failure is thrown
// (TransientNetworkError or boost::system::system_error); the channel then
// drops the connection and builds a new one.
// -----------------------------------------------------------------------------
class IStreamConnection {
 public:
  virtual ~IStreamConnection() = default;

  // Waits at most `wait` for the next complete frame.
  virtual std::optional<std::string> poll(std::chrono::milliseconds wait) = 0;

  virtual void write(const std::string& text) = 0;

  // Drops the socket without a close handshake. Never throws.
  virtual void close() noexcept = 0;
};

// Opens a connection (handshakes included) or throws.
using ConnectionFactory =
    std::function<std::unique_ptr<IStreamConnection>(const StreamEndpoint&)>;

// TLS websocket over Boost.Beast, verifying the peer against the system
// trust store.
std::unique_ptr<IStreamConnection> connectTls(const StreamEndpoint& endpoint);

}  // namespace bgcore
