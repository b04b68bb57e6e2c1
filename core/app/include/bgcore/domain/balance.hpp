#pragma once

#include <string>

namespace bgcore {
namespace domain {

// -----------------------------------------------------------------------------
// Balance: funds of one asset as seen by the OrderLedger
// -----------------------------------------------------------------------------
//
// @brief  Available and reserved amounts of a margin asset (USDT).
//
// @details
// reserved is locked against open orders: it grows when an order is
// registered and shrinks when the order fills, is cancelled or is rejected.
//
// total is the last equity figure reported by the exchange (0 until the first
// report). Invariant maintained by the ledger once a total is known:
//
//   available + reserved <= total
//
// Funds committed to open positions are neither available nor reserved.
// -----------------------------------------------------------------------------
struct Balance {
  std::string asset;
  double available{0.0};
  double reserved{0.0};
  double total{0.0};
};

}  // namespace domain
}  // namespace bgcore
