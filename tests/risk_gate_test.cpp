// =============================================================================
// risk_gate_test.cpp
// =============================================================================
// Unit tests for bgcore::RiskGate.
//
// Validates:
//   - Each pre-trade check rejects with its own reason
//   - Minimum order interval: rejected at 0.5 s, approved at 1.1 s
//   - Reduce-only intents skip the position and balance checks
//   - Randomized states: nothing that would breach the position limit is ever
//     approved
//   - checkDrawdown() kill switch
//
// Time is driven by a SimulationTimeProvider so the interval tests never
// sleep.
// =============================================================================

#include "bgcore/risk/risk_gate.hpp"
#include "bgcore/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <random>
#include <string>

using bgcore::domain::Side;

namespace {

bgcore::domain::RiskLimits defaultLimits() {
  bgcore::domain::RiskLimits limits;
  limits.allowed_instruments = {"BTCUSDT", "ETHUSDT"};
  limits.max_position_per_instrument = 1.0;
  limits.max_order_notional = 1000.0;
  limits.max_open_orders = 2;
  limits.min_order_interval_ms = 1000;
  limits.max_drawdown = -500.0;
  return limits;
}

bgcore::domain::OrderIntent intent(const std::string& symbol, Side side,
                                   double price, double qty) {
  bgcore::domain::OrderIntent i;
  i.strategy_id = "test";
  i.symbol = symbol;
  i.side = side;
  i.price = price;
  i.quantity = qty;
  return i;
}

bgcore::domain::Balance funds(double available) {
  bgcore::domain::Balance b;
  b.asset = "USDT";
  b.available = available;
  return b;
}

bgcore::domain::Order openOrder(bgcore::domain::OrderId id,
                                const std::string& symbol, Side side,
                                double qty) {
  bgcore::domain::Order o;
  o.id = id;
  o.symbol = symbol;
  o.side = side;
  o.price = 100.0;
  o.quantity = qty;
  o.status = bgcore::domain::OrderStatus::Acknowledged;
  return o;
}

}  // namespace

class RiskGateTest : public ::testing::Test {
 protected:
  RiskGateTest() : clock(1'000'000), gate(defaultLimits(), clock) {}

  bgcore::SimulationTimeProvider clock;
  bgcore::RiskGate gate;
  bgcore::LedgerView view;
};

TEST_F(RiskGateTest, ApprovesWellFormedIntent) {
  auto decision = gate.evaluate(intent("BTCUSDT", Side::Buy, 100.0, 0.5), view,
                                funds(1000.0));
  EXPECT_TRUE(decision.approved);
  EXPECT_TRUE(decision.reason.empty());
}

TEST_F(RiskGateTest, RejectsMalformedIntent) {
  EXPECT_FALSE(gate.evaluate(intent("BTCUSDT", Side::Buy, 100.0, 0.0), view,
                             funds(1000.0)));
  EXPECT_FALSE(gate.evaluate(intent("BTCUSDT", Side::Buy, -1.0, 0.1), view,
                             funds(1000.0)));
  EXPECT_FALSE(gate.evaluate(intent("", Side::Buy, 100.0, 0.1), view,
                             funds(1000.0)));
}

TEST_F(RiskGateTest, RejectsInstrumentOutsideAllowList) {
  auto decision = gate.evaluate(intent("DOGEUSDT", Side::Buy, 0.1, 10.0), view,
                                funds(1000.0));
  EXPECT_FALSE(decision.approved);
  EXPECT_NE(decision.reason.find("not allowed"), std::string::npos);
}

TEST_F(RiskGateTest, RejectsPostTradePositionAboveLimit) {
  view.positions["BTCUSDT"].symbol = "BTCUSDT";
  view.positions["BTCUSDT"].net_quantity = 0.8;

  auto decision = gate.evaluate(intent("BTCUSDT", Side::Buy, 100.0, 0.3), view,
                                funds(1000.0));
  EXPECT_FALSE(decision.approved);
  EXPECT_NE(decision.reason.find("max position"), std::string::npos);

  // Selling moves the position towards zero: fine.
  EXPECT_TRUE(gate.evaluate(intent("BTCUSDT", Side::Sell, 100.0, 0.3), view,
                            funds(1000.0)));
}

// -----------------------------------------------------------------------------
// Same-side open orders count as if they had already filled.
// -----------------------------------------------------------------------------
TEST_F(RiskGateTest, CountsSameSideOpenOrdersTowardsPosition) {
  view.open_orders.push_back(openOrder(1, "BTCUSDT", Side::Buy, 0.8));
  auto decision = gate.evaluate(intent("BTCUSDT", Side::Buy, 100.0, 0.3), view,
                                funds(1000.0));
  EXPECT_FALSE(decision.approved);
  EXPECT_NE(decision.reason.find("max position"), std::string::npos);
}

TEST_F(RiskGateTest, RejectsOrderNotionalAboveLimit) {
  auto decision = gate.evaluate(intent("BTCUSDT", Side::Buy, 2000.0, 0.6), view,
                                funds(10'000.0));
  EXPECT_FALSE(decision.approved);
  EXPECT_NE(decision.reason.find("notional"), std::string::npos);
}

TEST_F(RiskGateTest, RejectsWhenOpenOrderLimitReached) {
  view.open_orders.push_back(openOrder(1, "ETHUSDT", Side::Buy, 0.1));
  view.open_orders.push_back(openOrder(2, "ETHUSDT", Side::Sell, 0.1));
  auto decision = gate.evaluate(intent("BTCUSDT", Side::Buy, 100.0, 0.1), view,
                                funds(1000.0));
  EXPECT_FALSE(decision.approved);
  EXPECT_NE(decision.reason.find("max open orders"), std::string::npos);
}

TEST_F(RiskGateTest, RejectsWhenAvailableBalanceTooSmall) {
  auto decision = gate.evaluate(intent("BTCUSDT", Side::Buy, 100.0, 0.5), view,
                                funds(40.0));
  EXPECT_FALSE(decision.approved);
  EXPECT_NE(decision.reason.find("insufficient"), std::string::npos);
}

// -----------------------------------------------------------------------------
// Submit (price 100, qty 1) with a 1 s minimum interval; a second intent
// 0.5 s later is rejected for the interval; at 1.1 s it is approved.
// -----------------------------------------------------------------------------
TEST_F(RiskGateTest, MinimumOrderIntervalPerInstrument) {
  const auto first = intent("BTCUSDT", Side::Buy, 100.0, 1.0);
  ASSERT_TRUE(gate.evaluate(first, view, funds(1000.0)));

  clock.advance_by(500);
  auto second = gate.evaluate(first, view, funds(1000.0));
  EXPECT_FALSE(second.approved);
  EXPECT_NE(second.reason.find("min order interval"), std::string::npos);

  // Other instruments are not throttled by BTCUSDT's last order.
  EXPECT_TRUE(gate.evaluate(intent("ETHUSDT", Side::Buy, 100.0, 1.0), view,
                            funds(1000.0)));

  clock.advance_by(600);
  EXPECT_TRUE(gate.evaluate(first, view, funds(1000.0)));
}

TEST_F(RiskGateTest, RejectedIntentDoesNotRestartInterval) {
  ASSERT_TRUE(gate.evaluate(intent("BTCUSDT", Side::Buy, 100.0, 0.1), view,
                            funds(1000.0)));
  clock.advance_by(500);
  EXPECT_FALSE(gate.evaluate(intent("BTCUSDT", Side::Buy, 100.0, 0.1), view,
                             funds(1000.0)));
  clock.advance_by(500);
  EXPECT_TRUE(gate.evaluate(intent("BTCUSDT", Side::Buy, 100.0, 0.1), view,
                            funds(1000.0)));
}

TEST_F(RiskGateTest, ReduceOnlySkipsPositionAndBalanceChecks) {
  view.positions["BTCUSDT"].symbol = "BTCUSDT";
  view.positions["BTCUSDT"].net_quantity = 1.0;
  view.open_orders.push_back(openOrder(1, "BTCUSDT", Side::Sell, 0.5));

  auto close = intent("BTCUSDT", Side::Sell, 100.0, 1.0);
  close.reduce_only = true;
  EXPECT_TRUE(gate.evaluate(close, view, funds(0.0)));
}

TEST_F(RiskGateTest, ReduceOnlyThatWouldFlipIsStillChecked) {
  view.positions["BTCUSDT"].symbol = "BTCUSDT";
  view.positions["BTCUSDT"].net_quantity = 0.5;

  auto flip = intent("BTCUSDT", Side::Sell, 100.0, 2.0);
  flip.reduce_only = true;
  auto decision = gate.evaluate(flip, view, funds(0.0));
  EXPECT_FALSE(decision.approved);
  EXPECT_NE(decision.reason.find("max position"), std::string::npos);
}

// -----------------------------------------------------------------------------
// Property: over randomized positions, open orders and balances, an approved
// intent never leaves |position + same-side open + intent| above the limit.
// -----------------------------------------------------------------------------
TEST(RiskGatePropertyTest, NeverApprovesBreachOfPositionLimit) {
  bgcore::SimulationTimeProvider clock(0);
  auto limits = defaultLimits();
  limits.min_order_interval_ms = 0;
  limits.max_open_orders = 100;
  limits.max_order_notional = 1e9;
  bgcore::RiskGate gate(limits, clock);

  std::mt19937 rng(1234);
  std::uniform_real_distribution<double> position(-1.5, 1.5);
  std::uniform_real_distribution<double> quantity(0.001, 1.5);
  std::uniform_real_distribution<double> balance(0.0, 500.0);
  std::uniform_int_distribution<int> coin(0, 1);

  int approvals = 0;
  for (int i = 0; i < 5000; ++i) {
    bgcore::LedgerView view;
    const double net = position(rng);
    view.positions["BTCUSDT"].symbol = "BTCUSDT";
    view.positions["BTCUSDT"].net_quantity = net;

    const Side open_side = coin(rng) ? Side::Buy : Side::Sell;
    const double open_qty = coin(rng) ? quantity(rng) : 0.0;
    if (open_qty > 0.0) {
      view.open_orders.push_back(openOrder(1, "BTCUSDT", open_side, open_qty));
    }

    const Side side = coin(rng) ? Side::Buy : Side::Sell;
    auto candidate = intent("BTCUSDT", side, 100.0, quantity(rng));
    clock.advance_by(1);

    auto decision = gate.evaluate(candidate, view, funds(balance(rng)));
    if (!decision.approved) {
      continue;
    }
    ++approvals;
    const double sign = bgcore::domain::sideSign(side);
    const double same_side = open_side == side ? open_qty : 0.0;
    const double post = net + sign * (same_side + candidate.quantity);
    ASSERT_LE(std::abs(post), limits.max_position_per_instrument + 1e-9)
        << "iteration " << i << " net=" << net << " qty=" << candidate.quantity;
  }
  EXPECT_GT(approvals, 0);
}

TEST(RiskGateDrawdownTest, ViolationOnlyBelowFloor) {
  bgcore::SimulationTimeProvider clock(0);
  bgcore::RiskGate gate(defaultLimits(), clock);

  EXPECT_FALSE(gate.checkDrawdown(-100.0).has_value());
  EXPECT_FALSE(gate.checkDrawdown(-500.0).has_value());

  auto violation = gate.checkDrawdown(-500.01);
  ASSERT_TRUE(violation.has_value());
  EXPECT_EQ(violation->reason, "Max Drawdown Exceeded");
  EXPECT_DOUBLE_EQ(violation->limit_value, -500.0);
  EXPECT_DOUBLE_EQ(violation->current_value, -500.01);
}
