#pragma once

#include "bgcore/domain/balance.hpp"
#include "bgcore/domain/order.hpp"
#include "bgcore/domain/position.hpp"
#include "bgcore/eventbus/event_bus.hpp"
#include "bgcore/events/event.hpp"
#include "bgcore/ledger/ledger_snapshot.hpp"
#include "bgcore/ledger/ledger_view.hpp"
#include "bgcore/session/exchange_session.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace bgcore {

// -----------------------------------------------------------------------------
// OrderLedger: authoritative local view of orders, positions and balances
// -----------------------------------------------------------------------------
//
// @brief  Applies exchange events to a per-order state machine and keeps
//         positions and the margin-coin balance consistent with every fill.
//
// @details
// State machine:
//   Pending → Acknowledged → PartiallyFilled* → Filled
//   Pending | Acknowledged | PartiallyFilled → Cancelled
//   Pending → Rejected
//
//   - A fill on a Pending order acknowledges it implicitly.
//   - Duplicate acks and duplicate fill ids change nothing.
//   - A fill on a Cancelled order (cancel ack overtook the fill) is applied
//     once and the order stays Cancelled. This is how "partially filled,
//     then cancelled" resolves regardless of arrival order.
//   - Fills on Filled or Rejected orders are refused and logged.
//   Illegal transitions are logged and skipped; the order keeps its state.
//
// Balance model (linear contracts, leverage 1):
//   registerOrder  available -= price*qty, reserved += price*qty
//                  (reduce-only orders reserve nothing)
//   fill q @ p     reserved  -= q*order_price (up to what is still reserved)
//                  margin     = |net| * average_price after the fill
//                  available += released + (old margin - new margin)
//                               + realized pnl - fee
//   cancel/reject  remaining reservation returned to available
//
// Reconciliation: reconcile() force-converges orders to exchange reports.
// Missing fill quantity is applied once as a synthetic fill. A terminal
// reconciled order ignores later stream fills. An open order that was
// caught up records the synthetic quantity as unattributed, and the next
// real fills absorb it first so nothing is counted twice.
//
// Telemetry: every order transition publishes an OrderUpdateEvent and every
// fill a PositionUpdateEvent on the optional EventBus, after the lock is
// released.
//
// Thread model:
//   One std::shared_mutex. applyEvent(), registerOrder(), reconcile() and
//   markToMarket() take it exclusively for the whole step; view() and the
//   other readers copy under a shared lock.
// -----------------------------------------------------------------------------
class OrderLedger {
 public:
  enum class ApplyResult {
    Applied,
    Duplicate,     // Already seen; state unchanged
    Refused,       // Illegal transition; logged, state unchanged
    UnknownOrder,  // No local order matches the event
    Ignored,       // Not a ledger event
  };

  explicit OrderLedger(const ExchangeSession& session, EventBus* bus = nullptr);

  OrderLedger(const OrderLedger&) = delete;
  OrderLedger& operator=(const OrderLedger&) = delete;

  // -------------------------------------------------------------------------
  // registerOrder(order)
  // -------------------------------------------------------------------------
  // @brief  Records an approved order as Pending and reserves its notional.
  //
  // @return false if the client id is already known (nothing changes).
  // -------------------------------------------------------------------------
  bool registerOrder(const domain::Order& order);

  // -------------------------------------------------------------------------
  // applyEvent(event)
  // -------------------------------------------------------------------------
  // @brief  Single writer entry point for stream events: OrderAckEvent,
  //         FillEvent, CancelAckEvent, RejectEvent, BalanceEvent and
  //         ReconcileEvent. Ticker and trade events mark positions to
  //         market. Everything else is Ignored.
  // -------------------------------------------------------------------------
  ApplyResult applyEvent(const Event& event);

  // Force-converges local orders to the exchange reports in one locked step.
  void reconcile(const ReconcileEvent& event);

  // -------------------------------------------------------------------------
  // reconciliationCandidates(open_orders)
  // -------------------------------------------------------------------------
  // @brief  Orders whose final state must be queried after a resync.
  //
  // @param  open_orders  The exchange's current open-order list.
  //
  // @return Non-terminal local orders absent from open_orders, plus
  //         cancelled orders whose cancel ack reported more filled quantity
  //         than the ledger has applied.
  // -------------------------------------------------------------------------
  std::vector<domain::Order> reconciliationCandidates(
      const std::vector<OrderStatusReport>& open_orders) const;

  // Pending orders created before cutoff_ms.
  std::vector<domain::Order> pendingOlderThan(std::int64_t cutoff_ms) const;

  // Updates unrealized P&L of the symbol's position.
  void markToMarket(const std::string& symbol, double mark_price);

  // Replaces the whole state with a persisted snapshot. Warm start only,
  // before any event is applied.
  void hydrate(const LedgerSnapshot& snapshot);

  // Sets the margin-coin balance directly (warm start, tests).
  void setBalance(const domain::Balance& balance);

  LedgerView view() const;
  LedgerSnapshot snapshot() const;

  std::optional<domain::Order> order(domain::OrderId id) const;
  std::vector<domain::Order> openOrders() const;
  std::size_t openOrderCount() const;
  domain::Position position(const std::string& symbol) const;
  domain::Balance balance() const;
  double realizedPnl() const;
  std::uint64_t lastSequence() const;
  domain::OrderId maxOrderId() const;

 private:
  struct Entry {
    domain::Order order;
    double reserved{0.0};            // Still held against this order
    std::set<std::string> fill_ids;
    double unattributed_quantity{0.0};
    double reported_cumulative{0.0}; // From the cancel ack, if larger
    bool settle_pending{false};
    bool reconciled{false};
    int synthetic_fills{0};
  };

  // Collected under the lock, published after it is released.
  using Outbox = std::vector<Event>;

  Entry* findLocked(domain::OrderId client_id, const std::string& exchange_id);
  Entry* findLocked(const OrderStatusReport& report);

  ApplyResult onAck(const OrderAckEvent& event, Outbox& out);
  ApplyResult onFill(const FillEvent& event, Outbox& out);
  ApplyResult onCancel(const CancelAckEvent& event, Outbox& out);
  ApplyResult onReject(const RejectEvent& event, Outbox& out);
  ApplyResult onBalance(const BalanceEvent& event);
  void reconcileLocked(const ReconcileEvent& event, Outbox& out);
  void catchUpLocked(Entry& entry, const OrderStatusReport& report,
                     Outbox& out);
  void adoptLocked(const OrderStatusReport& report, Outbox& out);

  // Applies quantity q at price p to the order, its position and the
  // balance. Caller has checked q fits the remaining quantity.
  void applyFillLocked(Entry& entry, double quantity, double price, double fee,
                       Outbox& out);
  void releaseLocked(Entry& entry);
  void setStatusLocked(Entry& entry, domain::OrderStatus next, Outbox& out);
  void indexExchangeIdLocked(Entry& entry, const std::string& exchange_id);
  void markLocked(const std::string& symbol, double mark_price);

  domain::Balance& marginBalanceLocked();
  domain::Position& positionLocked(const std::string& symbol);
  std::int64_t nowMs() const;

  void publish(Outbox& out);

  const ExchangeSession& session_;
  EventBus* bus_;

  mutable std::shared_mutex mutex_;
  std::map<domain::OrderId, Entry> orders_;
  std::unordered_map<std::string, domain::OrderId> by_exchange_id_;
  std::map<std::string, domain::Position> positions_;
  std::map<std::string, domain::Balance> balances_;
  std::map<std::string, double> margin_;  // Position margin by symbol
  std::map<std::string, double> marks_;   // Last mark price by symbol
  std::uint64_t last_sequence_{0};
};

const char* toString(OrderLedger::ApplyResult result);

// Three-case position math (increase, reduce, reverse). Returns the realized
// P&L of the fill. signed_quantity is positive for buys.
double applyFillToPosition(domain::Position& position, double signed_quantity,
                           double price);

}  // namespace bgcore
