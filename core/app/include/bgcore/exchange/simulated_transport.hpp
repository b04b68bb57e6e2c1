#pragma once

#include "bgcore/exchange/i_exchange_transport.hpp"
#include "bgcore/session/exchange_session.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bgcore {

struct SimulatedTransportConfig {
  double initial_balance{1000.0};
  double fee_rate{0.0006};  // Taker fee on notional, Bitget USDT-M default
  std::vector<domain::Instrument> instruments;
};

// -----------------------------------------------------------------------------
// SimulatedTransport: paper trading exchange
// -----------------------------------------------------------------------------
//
// @brief  In-memory IExchangeTransport: accepts orders, acknowledges them and
//         fills them at the order price when they are marketable.
//
// @details
// Fill rule:
//   - Market orders fill in full immediately.
//   - Limit orders fill in full immediately if they cross the last known
//     book (buy >= best ask, sell <= best bid); otherwise they rest and fill
//     when a later book or trade crosses them.
//
// Market data: with a `market_data` transport (normally BitgetTransport
// without credentials) the public stream is real and flows through this
// class, which watches it to fill resting orders. Without one, tests feed
// books through onMarketEvent().
//
// The simulated account mirrors the ledger's linear-contract model so that
// a resync's fetchBalances() agrees with the ledger: equity moves by
// realized P&L and fees, available = equity - position margin - resting
// order notional.
//
// Failure injection (setNextSubmitFailure) lets tests exercise the
// coordinator's transient, auth and reject paths, including "accepted by
// the exchange but the response was lost".
//
// Thread model:
//   All state is guarded by one mutex; events are emitted to the sink after
//   the lock is released.
// -----------------------------------------------------------------------------
class SimulatedTransport final : public IExchangeTransport {
 public:
  enum class SubmitFailure {
    None,
    Transient,              // Not sent; outcome "unknown" to the caller
    AcceptedThenTransient,  // Exchange has the order; response lost
    Auth,
    Reject,
  };

  SimulatedTransport(ExchangeSession& session, SimulatedTransportConfig config,
                     IExchangeTransport* market_data = nullptr);
  ~SimulatedTransport() override;

  OrderAck submitOrder(const domain::Order& order) override;
  CancelAck cancelOrder(const domain::Order& order) override;
  std::optional<OrderStatusReport> queryOrder(const domain::Order& order) override;
  std::vector<OrderStatusReport> fetchOpenOrders() override;
  domain::OrderBookSnapshot fetchBook(const std::string& symbol) override;
  std::vector<domain::Balance> fetchBalances() override;
  std::vector<domain::Instrument> fetchInstruments() override;

  void startStream(EventSink sink) override;
  void stopStream() override;
  void requestResync(const std::string& symbol) override;

  // Observes one market event: updates the book/last price and fills any
  // resting order it crosses. Market events are forwarded to the sink.
  void onMarketEvent(const Event& event);

  void setNextSubmitFailure(SubmitFailure failure);

  // With auto-emit off, order events are held back instead of going to the
  // sink; takeHeldEvents() hands them over (tests reorder or drop them).
  void setAutoEmit(bool auto_emit);
  std::vector<Event> takeHeldEvents();

  std::size_t submittedCount() const;
  std::size_t resyncRequests() const;

 private:
  struct SimOrder {
    domain::Order order;
    std::string exchange_id;
    domain::OrderStatus status{domain::OrderStatus::Acknowledged};
  };

  struct SimPosition {
    double net{0.0};
    double average_price{0.0};
  };

  // Caller holds mutex_. Appends the resulting events to `out`.
  void fillLocked(SimOrder& sim, double price, std::vector<Event>& out);
  bool crossesLocked(const domain::Order& order) const;
  void sweepRestingLocked(const std::string& symbol, std::vector<Event>& out);
  double availableLocked() const;
  OrderStatusReport reportLocked(const SimOrder& sim) const;
  void emit(std::vector<Event> events);

  ExchangeSession& session_;
  const SimulatedTransportConfig config_;
  IExchangeTransport* market_data_;

  mutable std::mutex mutex_;
  EventSink sink_;
  bool streaming_{false};
  bool auto_emit_{true};
  std::vector<Event> held_;
  SubmitFailure next_failure_{SubmitFailure::None};

  std::map<domain::OrderId, SimOrder> orders_;  // Every order ever accepted
  struct Quote {
    double bid{0.0};
    double ask{0.0};
    double last{0.0};
  };

  std::map<std::string, domain::OrderBookSnapshot> books_;
  std::map<std::string, Quote> quotes_;
  std::map<std::string, SimPosition> positions_;
  double equity_;
  std::uint64_t next_exchange_id_{1};
  std::uint64_t next_fill_id_{1};
  std::size_t submitted_{0};
  std::size_t resync_requests_{0};
};

}  // namespace bgcore
