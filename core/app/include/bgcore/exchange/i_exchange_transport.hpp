#pragma once

#include "bgcore/domain/balance.hpp"
#include "bgcore/domain/instrument.hpp"
#include "bgcore/domain/order.hpp"
#include "bgcore/domain/order_book.hpp"
#include "bgcore/events/event.hpp"
#include "bgcore/events/exchange_events.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace bgcore {

// Synchronous result of a successful submitOrder().
struct OrderAck {
  domain::OrderId client_id{0};
  std::string exchange_id;
};

// Synchronous result of a successful cancelOrder(). The terminal state still
// arrives as a CancelAckEvent through the stream (or a resync).
struct CancelAck {
  domain::OrderId client_id{0};
  std::string exchange_id;
};

// Where a transport delivers stream events. May block (bounded channel).
using EventSink = std::function<void(Event)>;

// -----------------------------------------------------------------------------
// IExchangeTransport: exchange abstraction
// -----------------------------------------------------------------------------
//
// @brief  Everything the engine needs from an exchange: signed order entry,
//         authoritative queries for resync, and a restartable event stream.
//
// @details
// Implementations:
//   - BitgetTransport:    REST v2 over libcurl + websocket v2 over Beast.
//   - SimulatedTransport: in-memory paper trading.
//
// Error contract (all calls that touch the network):
//   - TransientNetworkError / RateLimitExceeded: nothing is known about the
//     outcome; retry later or reconcile.
//   - AuthError: credentials or clock are unusable; trading must halt.
//   - ExchangeRejection: the exchange refused this specific request.
//
// Transport never mutates the ledger or cache. Stream events go to the sink
// passed to startStream(), from the transport's own I/O threads.
// -----------------------------------------------------------------------------
class IExchangeTransport {
 public:
  virtual ~IExchangeTransport() = default;

  virtual OrderAck submitOrder(const domain::Order& order) = 0;
  virtual CancelAck cancelOrder(const domain::Order& order) = 0;

  // Final or current state of one order. std::nullopt when the exchange has
  // no record of it.
  virtual std::optional<OrderStatusReport> queryOrder(
      const domain::Order& order) = 0;

  virtual std::vector<OrderStatusReport> fetchOpenOrders() = 0;
  virtual domain::OrderBookSnapshot fetchBook(const std::string& symbol) = 0;
  virtual std::vector<domain::Balance> fetchBalances() = 0;
  virtual std::vector<domain::Instrument> fetchInstruments() = 0;

  // Opens the stream and keeps it open (reconnecting) until stopStream().
  virtual void startStream(EventSink sink) = 0;
  virtual void stopStream() = 0;

  // Asks the stream side for a fresh book of `symbol`. Non-blocking.
  virtual void requestResync(const std::string& symbol) = 0;
};

}  // namespace bgcore
