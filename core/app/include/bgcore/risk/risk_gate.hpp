#pragma once

#include "bgcore/domain/balance.hpp"
#include "bgcore/domain/order_intent.hpp"
#include "bgcore/domain/risk_limits.hpp"
#include "bgcore/events/risk_events.hpp"
#include "bgcore/ledger/ledger_view.hpp"
#include "bgcore/time/i_time_provider.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace bgcore {

struct RiskDecision {
  bool approved{false};
  std::string reason;  // Empty when approved

  static RiskDecision approve() { return RiskDecision{true, {}}; }
  static RiskDecision reject(std::string reason) {
    return RiskDecision{false, std::move(reason)};
  }

  explicit operator bool() const { return approved; }
};

// -----------------------------------------------------------------------------
// RiskGate
// -----------------------------------------------------------------------------
//
// @brief  Pre-trade validation of every OrderIntent. A rejection is a return
//         value, never an exception: the intent is dropped and logged by the
//         caller.
//
// @details
// Checks, in order, stopping at the first failure:
//
//   0. Well-formed: quantity > 0 and price > 0.
//   1. Instrument is in the allow-list (an empty list allows all).
//   2. |net position + same-side open quantity + intent| stays within
//      max_position_per_instrument. A reduce-only intent that shrinks the
//      current position skips this check.
//   3. price * quantity <= max_order_notional.
//   4. Open orders < max_open_orders.
//   5. Time since this instrument's last approved intent >=
//      min_order_interval_ms.
//   6. price * quantity <= available balance (skipped for reduce-only).
//
// The only state is the per-instrument time of the last approval, updated
// when an intent is approved.
//
// checkDrawdown() is the post-trade kill switch: the coordinator calls it
// after fills with the ledger's summed realized P&L and halts the session
// on a violation.
//
// Thread model:
//   evaluate() may be called from any thread; a mutex guards the approval
//   times so check (5) and its update are one step.
// -----------------------------------------------------------------------------
class RiskGate {
 public:
  RiskGate(domain::RiskLimits limits, const ITimeProvider& clock);

  RiskGate(const RiskGate&) = delete;
  RiskGate& operator=(const RiskGate&) = delete;

  RiskDecision evaluate(const domain::OrderIntent& intent,
                        const LedgerView& view,
                        const domain::Balance& balance);

  // Violation when the summed realized P&L is strictly below max_drawdown.
  std::optional<RiskViolationEvent> checkDrawdown(double realized_pnl) const;

  const domain::RiskLimits& limits() const { return limits_; }

 private:
  RiskDecision check(const domain::OrderIntent& intent, const LedgerView& view,
                     const domain::Balance& balance, std::int64_t now_ms) const;

  const domain::RiskLimits limits_;
  const ITimeProvider& clock_;

  mutable std::mutex mutex_;
  std::map<std::string, std::int64_t> last_approval_ms_;
};

}  // namespace bgcore
