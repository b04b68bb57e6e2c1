#pragma once

#include "bgcore/domain/order_book.hpp"
#include "bgcore/domain/ticker.hpp"

#include <memory>
#include <optional>
#include <string>

namespace bgcore {

// What a strategy sees of one instrument's market at decision time. book is
// null while the cache has no valid book (never received, or awaiting a
// resync snapshot).
struct MarketSnapshot {
  std::string symbol;
  std::shared_ptr<const domain::OrderBookSnapshot> book;
  std::optional<domain::Ticker> ticker;
  double last_price{0.0};

  bool hasBook() const { return book && !book->empty(); }

  // Best available reference price: mid, else last trade/ticker price.
  double referencePrice() const {
    if (book) {
      const double m = book->mid();
      if (m > 0.0) {
        return m;
      }
    }
    return last_price;
  }
};

}  // namespace bgcore
