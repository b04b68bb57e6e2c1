#pragma once

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>

namespace bgcore {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLimits: engine-wide hard risk thresholds
// -----------------------------------------------------------------------------
//
// @brief  Parameters for the pre-trade RiskGate and the coordinator's
//         drawdown kill switch.
//
// @details
// Loaded once from the "risk" section of the configuration file and copied
// by value into the components that need them; never modified during a run.
//
// Sign convention:
//   max_drawdown is a NEGATIVE realized P&L floor. When the realized P&L
//   summed over all instruments drops below it, the coordinator halts new
//   submissions. Unrealized P&L and fees outside realized_pnl do not count.
// -----------------------------------------------------------------------------
struct RiskLimits {
  /// Instruments the engine may trade. An intent for any other symbol is
  /// rejected by the first RiskGate check.
  std::set<std::string> allowed_instruments;

  /// Maximum absolute post-trade net position per instrument (base units).
  double max_position_per_instrument{1.0};

  /// Maximum price * quantity of a single order (quote units).
  double max_order_notional{1000.0};

  /// Maximum number of simultaneously open (non-terminal) orders.
  std::size_t max_open_orders{4};

  /// Minimum time between two approved orders on the same instrument.
  std::int64_t min_order_interval_ms{1000};

  /// Realized P&L floor that trips the kill switch (negative).
  double max_drawdown{-500.0};
};

}  // namespace domain
}  // namespace bgcore
