// =============================================================================
// order_ledger_test.cpp
// =============================================================================
// Unit tests for bgcore::OrderLedger and applyFillToPosition().
//
// Validates:
//   - Reservation on register, release on fill / cancel / reject
//   - The available 100 / notional 40 balance walk-through
//   - Duplicate fill ids never double-count (fixed and randomized sequences)
//   - Partial fill then cancel, in both arrival orders
//   - Reconcile after a disconnect converges an Acknowledged order to Filled
//     exactly once, and absorbs stream fills that arrive afterwards
//   - Unknown orders are forced to Rejected; foreign open orders are adopted
//   - Illegal transitions are refused without changing state
//   - realizedPnl() sums every instrument; that sum is what trips the
//     drawdown floor
//   - Telemetry: OrderUpdateEvent / PositionUpdateEvent on the bus
//   - Snapshot / hydrate round trip of the open state
//
// All tests drive the ledger directly on the test thread with a simulated
// clock; no transport is involved.
// =============================================================================

#include "bgcore/eventbus/event_bus.hpp"
#include "bgcore/events/order_update_event.hpp"
#include "bgcore/events/position_update_event.hpp"
#include "bgcore/ledger/order_ledger.hpp"
#include "bgcore/risk/risk_gate.hpp"
#include "bgcore/session/exchange_session.hpp"
#include "bgcore/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <random>
#include <set>
#include <string>
#include <vector>

using bgcore::OrderLedger;
using bgcore::domain::OrderStatus;
using bgcore::domain::Side;

namespace {

constexpr double kEps = 1e-9;

}  // namespace

class OrderLedgerTest : public ::testing::Test {
 protected:
  OrderLedgerTest()
      : clock(1'000'000),
        session(bgcore::Credentials{}, "USDT-FUTURES", "USDT", clock),
        ledger(session, &bus) {}

  void fund(double available, double total = 0.0) {
    bgcore::domain::Balance b;
    b.asset = "USDT";
    b.available = available;
    b.total = total;
    ledger.setBalance(b);
  }

  bgcore::domain::Order makeOrder(bgcore::domain::OrderId id, Side side,
                                  double price, double qty) {
    bgcore::domain::Order o;
    o.id = id;
    o.strategy_id = "test";
    o.symbol = "BTCUSDT";
    o.side = side;
    o.price = price;
    o.quantity = qty;
    return o;
  }

  OrderLedger::ApplyResult ack(bgcore::domain::OrderId id,
                               const std::string& exchange_id) {
    bgcore::OrderAckEvent e;
    e.client_id = id;
    e.exchange_id = exchange_id;
    e.symbol = "BTCUSDT";
    return ledger.applyEvent(e);
  }

  OrderLedger::ApplyResult fill(bgcore::domain::OrderId id,
                                const std::string& fill_id, double price,
                                double qty, Side side = Side::Buy) {
    bgcore::FillEvent e;
    e.client_id = id;
    e.fill_id = fill_id;
    e.symbol = "BTCUSDT";
    e.side = side;
    e.price = price;
    e.quantity = qty;
    return ledger.applyEvent(e);
  }

  OrderLedger::ApplyResult cancel(bgcore::domain::OrderId id,
                                  double cumulative_filled = -1.0) {
    bgcore::CancelAckEvent e;
    e.client_id = id;
    e.symbol = "BTCUSDT";
    e.cumulative_filled = cumulative_filled;
    return ledger.applyEvent(e);
  }

  OrderStatus statusOf(bgcore::domain::OrderId id) {
    auto o = ledger.order(id);
    EXPECT_TRUE(o.has_value());
    return o ? o->status : OrderStatus::Pending;
  }

  bgcore::SimulationTimeProvider clock;
  bgcore::ExchangeSession session;
  bgcore::EventBus bus;
  OrderLedger ledger;
};

// -----------------------------------------------------------------------------
// available 100, reserved 0. A 40 notional order moves 40 into reserved; the
// full fill releases it into the position, leaving available at 60.
// -----------------------------------------------------------------------------
TEST_F(OrderLedgerTest, ReserveThenFullFillMovesFundsIntoPosition) {
  fund(100.0);
  ASSERT_TRUE(ledger.registerOrder(makeOrder(1, Side::Buy, 100.0, 0.4)));

  auto b = ledger.balance();
  EXPECT_NEAR(b.available, 60.0, kEps);
  EXPECT_NEAR(b.reserved, 40.0, kEps);
  EXPECT_EQ(statusOf(1), OrderStatus::Pending);

  EXPECT_EQ(ack(1, "ex-1"), OrderLedger::ApplyResult::Applied);
  EXPECT_EQ(fill(1, "t-1", 100.0, 0.4), OrderLedger::ApplyResult::Applied);

  b = ledger.balance();
  EXPECT_NEAR(b.available, 60.0, kEps);
  EXPECT_NEAR(b.reserved, 0.0, kEps);
  EXPECT_EQ(statusOf(1), OrderStatus::Filled);

  auto pos = ledger.position("BTCUSDT");
  EXPECT_NEAR(pos.net_quantity, 0.4, kEps);
  EXPECT_NEAR(pos.average_price, 100.0, kEps);
  EXPECT_EQ(ledger.openOrderCount(), 0u);
}

TEST_F(OrderLedgerTest, RegisterRejectsDuplicateClientId) {
  fund(1000.0);
  ASSERT_TRUE(ledger.registerOrder(makeOrder(1, Side::Buy, 100.0, 1.0)));
  EXPECT_FALSE(ledger.registerOrder(makeOrder(1, Side::Buy, 100.0, 1.0)));
  EXPECT_NEAR(ledger.balance().reserved, 100.0, kEps);
}

TEST_F(OrderLedgerTest, ReduceOnlyOrdersReserveNothing) {
  fund(1000.0);
  auto order = makeOrder(1, Side::Sell, 100.0, 1.0);
  order.reduce_only = true;
  ASSERT_TRUE(ledger.registerOrder(order));

  auto b = ledger.balance();
  EXPECT_NEAR(b.available, 1000.0, kEps);
  EXPECT_NEAR(b.reserved, 0.0, kEps);
}

// -----------------------------------------------------------------------------
// Partial fill, then cancel: the unfilled 40% of the reservation comes back.
// -----------------------------------------------------------------------------
TEST_F(OrderLedgerTest, PartialFillThenCancelReleasesRemainder) {
  fund(1000.0);
  ledger.registerOrder(makeOrder(1, Side::Buy, 100.0, 1.0));
  ack(1, "ex-1");

  EXPECT_EQ(fill(1, "t-1", 100.0, 0.6), OrderLedger::ApplyResult::Applied);
  EXPECT_EQ(statusOf(1), OrderStatus::PartiallyFilled);
  EXPECT_NEAR(ledger.balance().reserved, 40.0, kEps);
  EXPECT_NEAR(ledger.balance().available, 900.0, kEps);

  EXPECT_EQ(cancel(1, 0.6), OrderLedger::ApplyResult::Applied);
  EXPECT_EQ(statusOf(1), OrderStatus::Cancelled);

  auto b = ledger.balance();
  EXPECT_NEAR(b.reserved, 0.0, kEps);
  EXPECT_NEAR(b.available, 940.0, kEps);
  EXPECT_NEAR(ledger.order(1)->filled_quantity, 0.6, kEps);
  EXPECT_NEAR(ledger.position("BTCUSDT").net_quantity, 0.6, kEps);
}

// -----------------------------------------------------------------------------
// Same outcome when the cancel ack overtakes the fill: the late fill is
// applied once and the order stays Cancelled.
// -----------------------------------------------------------------------------
TEST_F(OrderLedgerTest, CancelBeforeFillConvergesToSameState) {
  fund(1000.0);
  ledger.registerOrder(makeOrder(1, Side::Buy, 100.0, 1.0));
  ack(1, "ex-1");

  EXPECT_EQ(cancel(1, 0.6), OrderLedger::ApplyResult::Applied);
  EXPECT_EQ(statusOf(1), OrderStatus::Cancelled);
  EXPECT_NEAR(ledger.balance().reserved, 0.0, kEps);

  EXPECT_EQ(fill(1, "t-1", 100.0, 0.6), OrderLedger::ApplyResult::Applied);
  EXPECT_EQ(fill(1, "t-1", 100.0, 0.6), OrderLedger::ApplyResult::Duplicate);
  EXPECT_EQ(statusOf(1), OrderStatus::Cancelled);

  auto b = ledger.balance();
  EXPECT_NEAR(b.reserved, 0.0, kEps);
  EXPECT_NEAR(b.available, 940.0, kEps);
  EXPECT_NEAR(ledger.position("BTCUSDT").net_quantity, 0.6, kEps);
}

TEST_F(OrderLedgerTest, DuplicateFillIdsDoNotDoubleCount) {
  fund(1000.0);
  ledger.registerOrder(makeOrder(1, Side::Buy, 100.0, 1.0));
  ack(1, "ex-1");

  EXPECT_EQ(fill(1, "t-1", 100.0, 0.2), OrderLedger::ApplyResult::Applied);
  EXPECT_EQ(fill(1, "t-2", 100.0, 0.3), OrderLedger::ApplyResult::Applied);
  EXPECT_EQ(fill(1, "t-1", 100.0, 0.2), OrderLedger::ApplyResult::Duplicate);
  EXPECT_EQ(fill(1, "t-3", 100.0, 0.1), OrderLedger::ApplyResult::Applied);

  EXPECT_NEAR(ledger.order(1)->filled_quantity, 0.6, kEps);
  EXPECT_NEAR(ledger.position("BTCUSDT").net_quantity, 0.6, kEps);
}

// -----------------------------------------------------------------------------
// Property: for any delivery sequence with repeats, filled quantity equals
// the sum of the distinct fill ids delivered.
// -----------------------------------------------------------------------------
TEST_F(OrderLedgerTest, RandomizedFillSequencesCountEachFillIdOnce) {
  fund(1'000'000.0);
  std::mt19937 rng(20240501);
  std::uniform_int_distribution<int> pick(0, 9);

  for (int round = 0; round < 50; ++round) {
    const bgcore::domain::OrderId id = 100 + round;
    ledger.registerOrder(makeOrder(id, Side::Buy, 100.0, 1.0));

    std::set<int> distinct;
    const int deliveries = 5 + round % 20;
    for (int i = 0; i < deliveries; ++i) {
      const int n = pick(rng);
      distinct.insert(n);
      fill(id, "f-" + std::to_string(id) + "-" + std::to_string(n), 100.0, 0.1);
    }
    EXPECT_NEAR(ledger.order(id)->filled_quantity, 0.1 * distinct.size(), 1e-6)
        << "round " << round;
  }
}

TEST_F(OrderLedgerTest, OverfillIsClampedToOrderQuantity) {
  fund(1000.0);
  ledger.registerOrder(makeOrder(1, Side::Buy, 100.0, 1.0));
  EXPECT_EQ(fill(1, "t-1", 100.0, 1.5), OrderLedger::ApplyResult::Applied);
  EXPECT_NEAR(ledger.order(1)->filled_quantity, 1.0, kEps);
  EXPECT_EQ(statusOf(1), OrderStatus::Filled);

  EXPECT_EQ(fill(1, "t-2", 100.0, 0.1), OrderLedger::ApplyResult::Refused);
  EXPECT_NEAR(ledger.position("BTCUSDT").net_quantity, 1.0, kEps);
}

// -----------------------------------------------------------------------------
// A fill before the ack acknowledges the order implicitly.
// -----------------------------------------------------------------------------
TEST_F(OrderLedgerTest, FillBeforeAckAndLateAckIsDuplicate) {
  fund(1000.0);
  ledger.registerOrder(makeOrder(1, Side::Buy, 100.0, 1.0));
  EXPECT_EQ(fill(1, "t-1", 100.0, 0.5), OrderLedger::ApplyResult::Applied);
  EXPECT_EQ(statusOf(1), OrderStatus::PartiallyFilled);
  EXPECT_EQ(ack(1, "ex-1"), OrderLedger::ApplyResult::Duplicate);
  EXPECT_EQ(ledger.order(1)->exchange_id, "ex-1");
}

TEST_F(OrderLedgerTest, RejectReleasesReservationAndIsTerminal) {
  fund(1000.0);
  ledger.registerOrder(makeOrder(1, Side::Buy, 100.0, 1.0));

  bgcore::RejectEvent reject;
  reject.client_id = 1;
  reject.code = "40762";
  reject.reason = "insufficient balance";
  EXPECT_EQ(ledger.applyEvent(reject), OrderLedger::ApplyResult::Applied);
  EXPECT_EQ(ledger.applyEvent(reject), OrderLedger::ApplyResult::Duplicate);

  EXPECT_EQ(statusOf(1), OrderStatus::Rejected);
  EXPECT_NEAR(ledger.balance().available, 1000.0, kEps);
  EXPECT_NEAR(ledger.balance().reserved, 0.0, kEps);

  EXPECT_EQ(fill(1, "t-1", 100.0, 1.0), OrderLedger::ApplyResult::Refused);
  EXPECT_EQ(cancel(1), OrderLedger::ApplyResult::Refused);
}

TEST_F(OrderLedgerTest, RejectAfterAckIsRefused) {
  fund(1000.0);
  ledger.registerOrder(makeOrder(1, Side::Buy, 100.0, 1.0));
  ack(1, "ex-1");

  bgcore::RejectEvent reject;
  reject.client_id = 1;
  EXPECT_EQ(ledger.applyEvent(reject), OrderLedger::ApplyResult::Refused);
  EXPECT_EQ(statusOf(1), OrderStatus::Acknowledged);
}

TEST_F(OrderLedgerTest, EventsForUnknownOrdersAreReported) {
  EXPECT_EQ(ack(99, "ex-99"), OrderLedger::ApplyResult::UnknownOrder);
  EXPECT_EQ(fill(99, "t-1", 100.0, 1.0), OrderLedger::ApplyResult::UnknownOrder);
  EXPECT_EQ(cancel(99), OrderLedger::ApplyResult::UnknownOrder);
  EXPECT_EQ(ledger.applyEvent(bgcore::HeartbeatEvent{"public", "pong"}),
            OrderLedger::ApplyResult::Ignored);
}

TEST_F(OrderLedgerTest, FillMatchedByExchangeIdAfterAck) {
  fund(1000.0);
  ledger.registerOrder(makeOrder(1, Side::Buy, 100.0, 1.0));
  ack(1, "ex-1");

  bgcore::FillEvent e;
  e.exchange_id = "ex-1";
  e.fill_id = "t-1";
  e.symbol = "BTCUSDT";
  e.price = 100.0;
  e.quantity = 1.0;
  EXPECT_EQ(ledger.applyEvent(e), OrderLedger::ApplyResult::Applied);
  EXPECT_EQ(statusOf(1), OrderStatus::Filled);
}

// -----------------------------------------------------------------------------
// Reconnect scenario: the order was Acknowledged locally, the stream dropped,
// the resync reports it Filled. The ledger applies the missing quantity once;
// repeating the reconcile or replaying the stream fill changes nothing.
// -----------------------------------------------------------------------------
TEST_F(OrderLedgerTest, ReconcileConvergesAcknowledgedOrderToFilledOnce) {
  fund(1000.0);
  ledger.registerOrder(makeOrder(1, Side::Buy, 100.0, 1.0));
  ack(1, "ex-1");

  bgcore::OrderStatusReport report;
  report.client_id = 1;
  report.exchange_id = "ex-1";
  report.symbol = "BTCUSDT";
  report.quantity = 1.0;
  report.price = 100.0;
  report.filled_quantity = 1.0;
  report.average_fill_price = 100.0;
  report.status = OrderStatus::Filled;

  bgcore::ReconcileEvent reconcile;
  reconcile.final_reports.push_back(report);
  EXPECT_EQ(ledger.applyEvent(reconcile), OrderLedger::ApplyResult::Applied);

  EXPECT_EQ(statusOf(1), OrderStatus::Filled);
  EXPECT_NEAR(ledger.position("BTCUSDT").net_quantity, 1.0, kEps);
  EXPECT_NEAR(ledger.balance().reserved, 0.0, kEps);
  EXPECT_NEAR(ledger.balance().available, 900.0, kEps);

  ledger.reconcile(reconcile);
  EXPECT_EQ(fill(1, "t-late", 100.0, 1.0), OrderLedger::ApplyResult::Duplicate);

  EXPECT_NEAR(ledger.order(1)->filled_quantity, 1.0, kEps);
  EXPECT_NEAR(ledger.position("BTCUSDT").net_quantity, 1.0, kEps);
  EXPECT_NEAR(ledger.balance().available, 900.0, kEps);
}

// -----------------------------------------------------------------------------
// An open order caught up by reconcile: the synthetic quantity is absorbed by
// the first real fills so the total is still the exchange's.
// -----------------------------------------------------------------------------
TEST_F(OrderLedgerTest, ReconciledOpenOrderAbsorbsReplayedFills) {
  fund(1000.0);
  ledger.registerOrder(makeOrder(1, Side::Buy, 100.0, 1.0));

  bgcore::OrderStatusReport open;
  open.client_id = 1;
  open.exchange_id = "ex-1";
  open.symbol = "BTCUSDT";
  open.quantity = 1.0;
  open.price = 100.0;
  open.filled_quantity = 0.4;
  open.average_fill_price = 100.0;
  open.status = OrderStatus::PartiallyFilled;

  bgcore::ReconcileEvent reconcile;
  reconcile.open_orders.push_back(open);
  ledger.reconcile(reconcile);

  EXPECT_EQ(statusOf(1), OrderStatus::PartiallyFilled);
  EXPECT_NEAR(ledger.order(1)->filled_quantity, 0.4, kEps);
  EXPECT_EQ(ledger.order(1)->exchange_id, "ex-1");

  EXPECT_EQ(fill(1, "t-1", 100.0, 0.4), OrderLedger::ApplyResult::Duplicate);
  EXPECT_NEAR(ledger.order(1)->filled_quantity, 0.4, kEps);

  EXPECT_EQ(fill(1, "t-2", 100.0, 0.6), OrderLedger::ApplyResult::Applied);
  EXPECT_EQ(statusOf(1), OrderStatus::Filled);
  EXPECT_NEAR(ledger.position("BTCUSDT").net_quantity, 1.0, kEps);
}

TEST_F(OrderLedgerTest, PendingOrderAcknowledgedByOpenReport) {
  fund(1000.0);
  ledger.registerOrder(makeOrder(1, Side::Buy, 100.0, 1.0));

  bgcore::OrderStatusReport open;
  open.client_id = 1;
  open.exchange_id = "ex-1";
  open.symbol = "BTCUSDT";
  open.quantity = 1.0;
  open.status = OrderStatus::Acknowledged;

  bgcore::ReconcileEvent reconcile;
  reconcile.open_orders.push_back(open);
  ledger.reconcile(reconcile);
  EXPECT_EQ(statusOf(1), OrderStatus::Acknowledged);
}

TEST_F(OrderLedgerTest, UnknownOrdersAreForcedToRejected) {
  fund(1000.0);
  ledger.registerOrder(makeOrder(1, Side::Buy, 100.0, 1.0));

  bgcore::ReconcileEvent reconcile;
  reconcile.unknown_orders.push_back(1);
  ledger.reconcile(reconcile);

  EXPECT_EQ(statusOf(1), OrderStatus::Rejected);
  EXPECT_NEAR(ledger.balance().available, 1000.0, kEps);
  EXPECT_NEAR(ledger.balance().reserved, 0.0, kEps);
}

TEST_F(OrderLedgerTest, OpenOrderPlacedBeforeRestartIsAdopted) {
  fund(1000.0);

  bgcore::OrderStatusReport open;
  open.client_id = 77;
  open.exchange_id = "ex-77";
  open.symbol = "BTCUSDT";
  open.quantity = 2.0;
  open.price = 50.0;
  open.filled_quantity = 0.5;
  open.status = OrderStatus::PartiallyFilled;

  bgcore::OrderStatusReport foreign = open;
  foreign.client_id = 0;
  foreign.exchange_id = "manual-1";

  bgcore::ReconcileEvent reconcile;
  reconcile.open_orders.push_back(open);
  reconcile.open_orders.push_back(foreign);
  ledger.reconcile(reconcile);

  auto adopted = ledger.order(77);
  ASSERT_TRUE(adopted.has_value());
  EXPECT_EQ(adopted->status, OrderStatus::PartiallyFilled);
  EXPECT_EQ(adopted->strategy_id, "adopted");
  EXPECT_EQ(ledger.openOrderCount(), 1u);
  EXPECT_NEAR(ledger.balance().reserved, 75.0, kEps);
  EXPECT_EQ(ledger.maxOrderId(), 77u);
}

// -----------------------------------------------------------------------------
// Orders missing from the exchange's open list need a final-state query;
// cancelled orders with fills still outstanding do too.
// -----------------------------------------------------------------------------
TEST_F(OrderLedgerTest, ReconciliationCandidatesExcludeOpenAndSettled) {
  fund(10'000.0);
  ledger.registerOrder(makeOrder(1, Side::Buy, 100.0, 1.0));
  ledger.registerOrder(makeOrder(2, Side::Buy, 100.0, 1.0));
  ledger.registerOrder(makeOrder(3, Side::Buy, 100.0, 1.0));
  ledger.registerOrder(makeOrder(4, Side::Buy, 100.0, 1.0));
  ack(1, "ex-1");
  ack(2, "ex-2");
  ack(3, "ex-3");
  ack(4, "ex-4");
  cancel(3, 0.5);                 // Fill of 0.5 not seen yet
  cancel(4, 0.0);                 // Settled

  bgcore::OrderStatusReport still_open;
  still_open.exchange_id = "ex-1";
  auto candidates = ledger.reconciliationCandidates({still_open});

  std::set<bgcore::domain::OrderId> ids;
  for (const auto& o : candidates) {
    ids.insert(o.id);
  }
  EXPECT_EQ(ids, (std::set<bgcore::domain::OrderId>{2, 3}));
}

TEST_F(OrderLedgerTest, PendingOlderThanUsesCreationTime) {
  fund(10'000.0);
  ledger.registerOrder(makeOrder(1, Side::Buy, 100.0, 1.0));
  clock.advance_by(5'000);
  ledger.registerOrder(makeOrder(2, Side::Buy, 100.0, 1.0));
  ack(2, "ex-2");
  ledger.registerOrder(makeOrder(3, Side::Buy, 100.0, 1.0));

  auto stale = ledger.pendingOlderThan(clock.now_ms() - 1'000);
  ASSERT_EQ(stale.size(), 1u);
  EXPECT_EQ(stale[0].id, 1u);
  EXPECT_EQ(ledger.pendingOlderThan(clock.now_ms() + 1).size(), 2u);
}

// -----------------------------------------------------------------------------
// Exchange balance reports win, but never hand back funds that are reserved.
// -----------------------------------------------------------------------------
TEST_F(OrderLedgerTest, BalanceReportKeepsReservationsOut) {
  ledger.registerOrder(makeOrder(1, Side::Buy, 100.0, 1.0));

  bgcore::BalanceEvent report;
  report.asset = "USDT";
  report.available = 1000.0;
  report.total = 1000.0;
  EXPECT_EQ(ledger.applyEvent(report), OrderLedger::ApplyResult::Applied);

  auto b = ledger.balance();
  EXPECT_NEAR(b.total, 1000.0, kEps);
  EXPECT_NEAR(b.reserved, 100.0, kEps);
  EXPECT_NEAR(b.available, 900.0, kEps);
  EXPECT_LE(b.available + b.reserved, b.total + kEps);
}

TEST_F(OrderLedgerTest, RoundTripRealizesPnlAndFees) {
  fund(1000.0, 1000.0);
  ledger.registerOrder(makeOrder(1, Side::Buy, 100.0, 1.0));
  fill(1, "t-1", 100.0, 1.0);
  ledger.registerOrder(makeOrder(2, Side::Sell, 110.0, 1.0));

  bgcore::FillEvent sell;
  sell.client_id = 2;
  sell.fill_id = "t-2";
  sell.symbol = "BTCUSDT";
  sell.side = Side::Sell;
  sell.price = 110.0;
  sell.quantity = 1.0;
  sell.fee = 0.5;
  EXPECT_EQ(ledger.applyEvent(sell), OrderLedger::ApplyResult::Applied);

  auto pos = ledger.position("BTCUSDT");
  EXPECT_TRUE(pos.isFlat());
  EXPECT_NEAR(pos.realized_pnl, 10.0, kEps);
  EXPECT_NEAR(ledger.realizedPnl(), 10.0, kEps);

  auto b = ledger.balance();
  EXPECT_NEAR(b.reserved, 0.0, kEps);
  EXPECT_NEAR(b.available, 1009.5, kEps);
  EXPECT_NEAR(b.total, 1009.5, kEps);
}

// -----------------------------------------------------------------------------
// Two instruments lose 30 each. Neither alone breaks a -50 floor; their sum,
// which is what the coordinator hands to the kill switch, does.
// -----------------------------------------------------------------------------
TEST_F(OrderLedgerTest, RealizedPnlSumsInstrumentsForDrawdown) {
  fund(1000.0, 1000.0);

  auto roundTrip = [this](bgcore::domain::OrderId first, const std::string& symbol,
                          double entry, double exit) {
    auto buy = makeOrder(first, Side::Buy, entry, 1.0);
    buy.symbol = symbol;
    ledger.registerOrder(buy);
    auto sell = makeOrder(first + 1, Side::Sell, exit, 1.0);
    sell.symbol = symbol;
    ledger.registerOrder(sell);

    bgcore::FillEvent e;
    e.symbol = symbol;
    e.quantity = 1.0;
    e.client_id = first;
    e.fill_id = symbol + "-open";
    e.side = Side::Buy;
    e.price = entry;
    EXPECT_EQ(ledger.applyEvent(e), OrderLedger::ApplyResult::Applied);
    e.client_id = first + 1;
    e.fill_id = symbol + "-close";
    e.side = Side::Sell;
    e.price = exit;
    EXPECT_EQ(ledger.applyEvent(e), OrderLedger::ApplyResult::Applied);
  };
  roundTrip(1, "BTCUSDT", 100.0, 70.0);
  roundTrip(3, "ETHUSDT", 50.0, 20.0);

  const double btc = ledger.position("BTCUSDT").realized_pnl;
  const double eth = ledger.position("ETHUSDT").realized_pnl;
  EXPECT_NEAR(btc, -30.0, kEps);
  EXPECT_NEAR(eth, -30.0, kEps);
  EXPECT_NEAR(ledger.realizedPnl(), -60.0, kEps);

  bgcore::domain::RiskLimits limits;
  limits.max_drawdown = -50.0;
  bgcore::RiskGate gate(limits, clock);
  EXPECT_FALSE(gate.checkDrawdown(btc).has_value());
  EXPECT_FALSE(gate.checkDrawdown(eth).has_value());
  auto violation = gate.checkDrawdown(ledger.realizedPnl());
  ASSERT_TRUE(violation.has_value());
  EXPECT_NEAR(violation->current_value, -60.0, kEps);
}

TEST_F(OrderLedgerTest, TickerMarksUnrealizedPnl) {
  fund(1000.0);
  ledger.registerOrder(makeOrder(1, Side::Buy, 100.0, 2.0));
  fill(1, "t-1", 100.0, 2.0);

  bgcore::TickerEvent ticker;
  ticker.symbol = "BTCUSDT";
  ticker.last_price = 105.0;
  ticker.sequence_id = 42;
  EXPECT_EQ(ledger.applyEvent(ticker), OrderLedger::ApplyResult::Applied);

  EXPECT_NEAR(ledger.position("BTCUSDT").unrealized_pnl, 10.0, kEps);
  EXPECT_EQ(ledger.lastSequence(), 42u);
}

TEST_F(OrderLedgerTest, PublishesOrderAndPositionUpdates) {
  std::vector<OrderStatus> transitions;
  int position_updates = 0;
  bus.subscribe<bgcore::OrderUpdateEvent>(
      [&](const bgcore::OrderUpdateEvent& e) {
        transitions.push_back(e.order.status);
      });
  bus.subscribe<bgcore::PositionUpdateEvent>(
      [&](const bgcore::PositionUpdateEvent& e) {
        ++position_updates;
        EXPECT_EQ(e.position.symbol, "BTCUSDT");
      });

  fund(1000.0);
  ledger.registerOrder(makeOrder(1, Side::Buy, 100.0, 1.0));
  ack(1, "ex-1");
  fill(1, "t-1", 100.0, 0.5);
  fill(1, "t-2", 100.0, 0.5);

  EXPECT_EQ(transitions,
            (std::vector<OrderStatus>{OrderStatus::Pending,
                                      OrderStatus::Acknowledged,
                                      OrderStatus::PartiallyFilled,
                                      OrderStatus::Filled}));
  EXPECT_EQ(position_updates, 2);
}

TEST_F(OrderLedgerTest, SnapshotAndHydrateRestoreOpenState) {
  fund(1000.0);
  ledger.registerOrder(makeOrder(1, Side::Buy, 100.0, 1.0));
  ack(1, "ex-1");
  fill(1, "t-1", 100.0, 0.5);
  ledger.registerOrder(makeOrder(5, Side::Buy, 100.0, 1.0));
  cancel(5);

  auto snap = ledger.snapshot();
  EXPECT_EQ(snap.open_orders.size(), 1u);
  EXPECT_EQ(snap.next_order_id, 6u);

  OrderLedger restored(session);
  restored.hydrate(snap);

  auto o = restored.order(1);
  ASSERT_TRUE(o.has_value());
  EXPECT_EQ(o->status, OrderStatus::PartiallyFilled);
  EXPECT_NEAR(restored.position("BTCUSDT").net_quantity, 0.5, kEps);
  EXPECT_NEAR(restored.balance().reserved, ledger.balance().reserved, kEps);

  // The restored ledger keeps accepting events for the hydrated order.
  bgcore::FillEvent rest;
  rest.exchange_id = "ex-1";
  rest.fill_id = "t-2";
  rest.symbol = "BTCUSDT";
  rest.price = 100.0;
  rest.quantity = 0.5;
  EXPECT_EQ(restored.applyEvent(rest), OrderLedger::ApplyResult::Applied);
  EXPECT_EQ(restored.order(1)->status, OrderStatus::Filled);
}

// -----------------------------------------------------------------------------
// applyFillToPosition: increase, reduce, reverse.
// -----------------------------------------------------------------------------
TEST(ApplyFillToPositionTest, IncreaseAveragesEntryPrice) {
  bgcore::domain::Position pos;
  EXPECT_NEAR(bgcore::applyFillToPosition(pos, 1.0, 100.0), 0.0, kEps);
  EXPECT_NEAR(bgcore::applyFillToPosition(pos, 1.0, 110.0), 0.0, kEps);
  EXPECT_NEAR(pos.net_quantity, 2.0, kEps);
  EXPECT_NEAR(pos.average_price, 105.0, kEps);
}

TEST(ApplyFillToPositionTest, ReduceRealizesPnlAgainstAverage) {
  bgcore::domain::Position pos;
  bgcore::applyFillToPosition(pos, -2.0, 110.0);
  const double pnl = bgcore::applyFillToPosition(pos, 1.0, 100.0);
  EXPECT_NEAR(pnl, 10.0, kEps);
  EXPECT_NEAR(pos.net_quantity, -1.0, kEps);
  EXPECT_NEAR(pos.average_price, 110.0, kEps);
  EXPECT_NEAR(pos.realized_pnl, 10.0, kEps);
}

TEST(ApplyFillToPositionTest, ReversalClosesThenOpensAtFillPrice) {
  bgcore::domain::Position pos;
  bgcore::applyFillToPosition(pos, 1.0, 100.0);
  const double pnl = bgcore::applyFillToPosition(pos, -3.0, 110.0);
  EXPECT_NEAR(pnl, 10.0, kEps);
  EXPECT_NEAR(pos.net_quantity, -2.0, kEps);
  EXPECT_NEAR(pos.average_price, 110.0, kEps);
}

TEST(ApplyFillToPositionTest, ExactCloseGoesFlat) {
  bgcore::domain::Position pos;
  bgcore::applyFillToPosition(pos, 1.5, 100.0);
  bgcore::applyFillToPosition(pos, -1.5, 90.0);
  EXPECT_TRUE(pos.isFlat());
  EXPECT_NEAR(pos.average_price, 0.0, kEps);
  EXPECT_NEAR(pos.realized_pnl, -15.0, kEps);
}
