#pragma once

#include "bgcore/domain/order_intent.hpp"
#include "bgcore/domain/position.hpp"
#include "bgcore/ledger/ledger_view.hpp"
#include "bgcore/marketdata/market_snapshot.hpp"

#include <string>
#include <vector>

namespace bgcore {

// -----------------------------------------------------------------------------
// IStrategy: decision capability
// -----------------------------------------------------------------------------
//
// @brief  Turns one instrument's market snapshot plus the ledger state into
//         zero or more OrderIntents.
//
// @details
// decide() must be a pure function of its arguments: no transport access,
// no clocks, no hidden mutable state. The ExecutionCoordinator calls it on
// the decision loop thread and sends every intent through the RiskGate, so
// a strategy never needs to re-check limits itself.
// -----------------------------------------------------------------------------
class IStrategy {
 public:
  virtual ~IStrategy() = default;

  virtual std::string id() const = 0;

  virtual std::vector<domain::OrderIntent> decide(
      const MarketSnapshot& market, const LedgerView& ledger,
      const domain::Position& position) const = 0;
};

}  // namespace bgcore
