#pragma once

#include "bgcore/domain/order.hpp"

#include <string>

namespace bgcore {
namespace domain {

// -----------------------------------------------------------------------------
// OrderIntent
// -----------------------------------------------------------------------------
// Responsibility: A proposed order produced by a strategy. Nothing has been
// checked or sent yet; the ExecutionCoordinator normalizes it to the
// instrument's precision and hands it to the RiskGate.
//
// For market intents `price` carries the reference price (usually the
// opposite best quote) used for notional and balance checks.
// -----------------------------------------------------------------------------
struct OrderIntent {
  std::string strategy_id;
  std::string symbol;
  Side side{Side::Buy};
  OrderType type{OrderType::Limit};
  double price{0.0};
  double quantity{0.0};
  bool reduce_only{false};
  std::string reason;

  double notional() const { return price * quantity; }
};

}  // namespace domain
}  // namespace bgcore
