#pragma once

#include <cmath>
#include <string>

namespace bgcore {
namespace domain {

// -----------------------------------------------------------------------------
// Instrument: immutable contract metadata
// -----------------------------------------------------------------------------
//
// @brief  Trading rules for one instrument, loaded once from the exchange
//         contract list (or from configuration in paper mode).
//
// @details
// price_precision / quantity_precision are numbers of decimal places. The
// exchange rejects orders whose size has more decimals than allowed, so
// quantities are always rounded DOWN (never up: rounding up could breach a
// risk limit that was checked on the unrounded value).
// -----------------------------------------------------------------------------
struct Instrument {
  std::string symbol;             // e.g. "ETHUSDT"
  std::string base_asset;         // e.g. "ETH"
  std::string quote_asset;        // margin coin, e.g. "USDT"
  int price_precision{2};
  int quantity_precision{3};
  double min_quantity{0.001};
  double min_notional{5.0};
  double price_tick{0.01};
};

// Rounds quantity down to the instrument's quantity precision.
inline double roundQuantityDown(const Instrument& instrument, double quantity) {
  const double scale = std::pow(10.0, instrument.quantity_precision);
  // The small epsilon keeps values like 0.3 (0.29999...) from flooring to 0.2.
  return std::floor(quantity * scale + 1e-9) / scale;
}

// Rounds price to the nearest multiple of the tick, then to the price
// precision so the decimal string sent on the wire is exact.
inline double roundPrice(const Instrument& instrument, double price) {
  double ticked = price;
  if (instrument.price_tick > 0.0) {
    ticked = std::round(price / instrument.price_tick) * instrument.price_tick;
  }
  const double scale = std::pow(10.0, instrument.price_precision);
  return std::round(ticked * scale) / scale;
}

}  // namespace domain
}  // namespace bgcore
