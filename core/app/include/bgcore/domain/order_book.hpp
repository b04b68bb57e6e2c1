#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace bgcore {
namespace domain {

struct PriceLevel {
  double price{0.0};
  double quantity{0.0};
};

// -----------------------------------------------------------------------------
// OrderBookSnapshot: immutable view of one instrument's book
// -----------------------------------------------------------------------------
//
// @brief  Ordered bid and ask levels plus the version they correspond to.
//
// @details
// Invariants (checked by isConsistent()):
//   - bid prices strictly decreasing
//   - ask prices strictly increasing
//   - best bid < best ask when both sides are present
//
// version identifies the data the book was built from: the exchange time of
// a snapshot, or the stream sequence of the last applied update. The
// MarketDataCache builds a new snapshot for every applied update and never
// mutates a published one.
// -----------------------------------------------------------------------------
struct OrderBookSnapshot {
  std::string symbol;
  std::vector<PriceLevel> bids;  // Best (highest) first
  std::vector<PriceLevel> asks;  // Best (lowest) first
  std::uint64_t version{0};
  std::int64_t timestamp_ms{0};

  bool empty() const { return bids.empty() && asks.empty(); }

  const PriceLevel* bestBid() const {
    return bids.empty() ? nullptr : &bids.front();
  }

  const PriceLevel* bestAsk() const {
    return asks.empty() ? nullptr : &asks.front();
  }

  // Mid price, or 0 when either side is missing.
  double mid() const {
    if (bids.empty() || asks.empty()) {
      return 0.0;
    }
    return (bids.front().price + asks.front().price) / 2.0;
  }

  bool isConsistent() const {
    for (std::size_t i = 1; i < bids.size(); ++i) {
      if (!(bids[i].price < bids[i - 1].price)) {
        return false;
      }
    }
    for (std::size_t i = 1; i < asks.size(); ++i) {
      if (!(asks[i].price > asks[i - 1].price)) {
        return false;
      }
    }
    if (!bids.empty() && !asks.empty() &&
        !(bids.front().price < asks.front().price)) {
      return false;
    }
    return true;
  }
};

}  // namespace domain
}  // namespace bgcore
