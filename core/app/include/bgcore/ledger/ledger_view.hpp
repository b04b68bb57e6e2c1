#pragma once

#include "bgcore/domain/balance.hpp"
#include "bgcore/domain/order.hpp"
#include "bgcore/domain/position.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace bgcore {

// -----------------------------------------------------------------------------
// LedgerView: consistent read-only copy of the ledger
// -----------------------------------------------------------------------------
//
// Taken under the ledger's shared lock in one step, so open orders,
// positions and balances always belong to the same point in the event
// stream. Strategies and the RiskGate only ever see a LedgerView.
// -----------------------------------------------------------------------------
struct LedgerView {
  std::vector<domain::Order> open_orders;
  std::map<std::string, domain::Position> positions;  // By symbol
  std::map<std::string, domain::Balance> balances;    // By asset
  std::string margin_coin;
  double realized_pnl{0.0};  // Sum over all positions
  std::uint64_t last_sequence{0};

  std::size_t openOrderCount() const { return open_orders.size(); }

  bool hasOpenOrders(const std::string& symbol) const {
    for (const auto& o : open_orders) {
      if (o.symbol == symbol) {
        return true;
      }
    }
    return false;
  }

  // Unfilled quantity of open orders on one side of an instrument.
  double openQuantity(const std::string& symbol, domain::Side side) const {
    double total = 0.0;
    for (const auto& o : open_orders) {
      if (o.symbol == symbol && o.side == side) {
        total += o.remainingQuantity();
      }
    }
    return total;
  }

  // Flat position when the symbol has never traded.
  domain::Position position(const std::string& symbol) const {
    auto it = positions.find(symbol);
    if (it != positions.end()) {
      return it->second;
    }
    domain::Position flat;
    flat.symbol = symbol;
    return flat;
  }

  domain::Balance balance(const std::string& asset) const {
    auto it = balances.find(asset);
    if (it != balances.end()) {
      return it->second;
    }
    domain::Balance empty;
    empty.asset = asset;
    return empty;
  }

  domain::Balance marginBalance() const { return balance(margin_coin); }
};

}  // namespace bgcore
