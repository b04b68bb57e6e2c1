#include "bgcore/risk/risk_gate.hpp"

#include <cmath>
#include <iostream>
#include <sstream>

namespace bgcore {

namespace {

// Absorbs floating-point noise in quantity and notional comparisons.
constexpr double kTolerance = 1e-9;

}  // namespace

RiskGate::RiskGate(domain::RiskLimits limits, const ITimeProvider& clock)
    : limits_(std::move(limits)), clock_(clock) {}

RiskDecision RiskGate::evaluate(const domain::OrderIntent& intent,
                                const LedgerView& view,
                                const domain::Balance& balance) {
  std::lock_guard lock(mutex_);
  const std::int64_t now_ms = clock_.now_ms();

  RiskDecision decision = check(intent, view, balance, now_ms);
  if (decision.approved) {
    last_approval_ms_[intent.symbol] = now_ms;
  } else {
    std::cerr << "[RiskGate] Rejected " << domain::toString(intent.side) << " "
              << intent.quantity << " " << intent.symbol << " @ "
              << intent.price << " from " << intent.strategy_id << ": "
              << decision.reason << "\n";
  }
  return decision;
}

RiskDecision RiskGate::check(const domain::OrderIntent& intent,
                             const LedgerView& view,
                             const domain::Balance& balance,
                             std::int64_t now_ms) const {
  // --- 0. Well-formed --------------------------------------------------------
  if (!(intent.quantity > 0.0) || !(intent.price > 0.0) ||
      intent.symbol.empty()) {
    return RiskDecision::reject("malformed intent: quantity and price must be "
                                "positive");
  }

  // --- 1. Allow-list ---------------------------------------------------------
  if (!limits_.allowed_instruments.empty() &&
      limits_.allowed_instruments.count(intent.symbol) == 0) {
    return RiskDecision::reject("instrument " + intent.symbol +
                                " not allowed");
  }

  // --- 2. Post-trade position ------------------------------------------------
  const double net = view.position(intent.symbol).net_quantity;
  const double sign = domain::sideSign(intent.side);
  const bool reduces = intent.reduce_only && net * sign < 0.0 &&
                       intent.quantity <= std::abs(net) + kTolerance;
  if (!reduces) {
    const double open_same_side = view.openQuantity(intent.symbol, intent.side);
    const double post_trade = net + sign * (open_same_side + intent.quantity);
    if (std::abs(post_trade) > limits_.max_position_per_instrument + kTolerance) {
      std::ostringstream reason;
      reason << "max position " << limits_.max_position_per_instrument
             << " exceeded (post-trade " << post_trade << ")";
      return RiskDecision::reject(reason.str());
    }
  }

  // --- 3. Order notional -----------------------------------------------------
  const double notional = intent.notional();
  if (notional > limits_.max_order_notional + kTolerance) {
    std::ostringstream reason;
    reason << "order notional " << notional << " exceeds max "
           << limits_.max_order_notional;
    return RiskDecision::reject(reason.str());
  }

  // --- 4. Open orders --------------------------------------------------------
  if (view.openOrderCount() >= limits_.max_open_orders) {
    return RiskDecision::reject("max open orders (" +
                                std::to_string(limits_.max_open_orders) +
                                ") reached");
  }

  // --- 5. Order interval -----------------------------------------------------
  auto last = last_approval_ms_.find(intent.symbol);
  if (last != last_approval_ms_.end()) {
    const std::int64_t elapsed = now_ms - last->second;
    if (elapsed < limits_.min_order_interval_ms) {
      return RiskDecision::reject(
          "min order interval: " + std::to_string(elapsed) + " ms since last "
          "order, need " + std::to_string(limits_.min_order_interval_ms));
    }
  }

  // --- 6. Available balance --------------------------------------------------
  if (!intent.reduce_only && notional > balance.available + kTolerance) {
    std::ostringstream reason;
    reason << "insufficient available balance: need " << notional << ", have "
           << balance.available;
    return RiskDecision::reject(reason.str());
  }

  return RiskDecision::approve();
}

std::optional<RiskViolationEvent> RiskGate::checkDrawdown(
    double realized_pnl) const {
  if (realized_pnl >= limits_.max_drawdown) {
    return std::nullopt;
  }
  RiskViolationEvent violation;
  violation.reason = "Max Drawdown Exceeded";
  violation.current_value = realized_pnl;
  violation.limit_value = limits_.max_drawdown;
  violation.timestamp = std::chrono::system_clock::now();
  return violation;
}

}  // namespace bgcore
