#pragma once

#include <string>

namespace bgcore {
namespace domain {

// -----------------------------------------------------------------------------
// Position: per-instrument trading state
// -----------------------------------------------------------------------------
//
// @brief  Net position, average entry price and P&L for one instrument.
//
// @details
// Sign convention for net_quantity:
//   positive → long, negative → short, zero → flat.
//
// average_price is the weighted entry price of the open position. It moves
// only when the position grows; a reducing fill realizes P&L against it; a
// fill that crosses zero resets it to the fill price.
//
// unrealized_pnl is marked from the last traded price seen by the market data
// cache: net_quantity * (mark - average_price).
//
// Only the OrderLedger mutates a Position, and only from fill events.
// -----------------------------------------------------------------------------
struct Position {
  std::string symbol;
  double net_quantity{0.0};
  double average_price{0.0};
  double realized_pnl{0.0};
  double unrealized_pnl{0.0};

  bool isFlat() const { return net_quantity == 0.0; }
};

}  // namespace domain
}  // namespace bgcore
