#pragma once

#include "bgcore/strategy/i_strategy.hpp"

namespace bgcore {

// Never trades. Useful for running the engine as a pure market-data and
// ledger mirror.
class HoldStrategy : public IStrategy {
 public:
  std::string id() const override { return "hold"; }

  std::vector<domain::OrderIntent> decide(
      const MarketSnapshot&, const LedgerView&,
      const domain::Position&) const override {
    return {};
  }
};

}  // namespace bgcore
