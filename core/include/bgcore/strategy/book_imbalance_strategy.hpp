#pragma once

#include "bgcore/domain/instrument.hpp"
#include "bgcore/strategy/i_strategy.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace bgcore {

struct BookImbalanceConfig {
  std::string strategy_id{"book-imbalance"};
  std::size_t depth_levels{5};      // Levels per side summed for the signal
  int confidence_threshold{6};      // 0..10; trade only at or above
  double max_position_percent{5.0}; // Of available balance
  double max_position_value{1000.0};
  double min_order_value{10.0};     // Quote units
  double min_balance{10.0};         // Below this no new position is opened
  double stop_loss_percent{2.0};
  double take_profit_percent{6.0};
};

// -----------------------------------------------------------------------------
// BookImbalanceStrategy
// -----------------------------------------------------------------------------
//
// @brief  Directional strategy driven by top-of-book depth imbalance.
//
// @details
// Signal: imbalance = (bid volume - ask volume) / (bid volume + ask volume)
// over the first depth_levels levels; confidence = round(|imbalance| * 10).
// Positive imbalance means buy, negative means sell.
//
// Decision order for one instrument:
//   1. Open orders on the instrument → no intent.
//   2. Open position beyond its stop-loss or take-profit (percent from the
//      average entry) → reduce-only market close.
//   3. Confidence below the threshold → no intent.
//   4. Signal against the open position → reduce-only close first; the new
//      direction opens on a later decision once the close has filled.
//   5. Signal with the position already open that way → no intent.
//   6. Otherwise open: value = min(available * max_position_percent / 100,
//      max_position_value), quantity = value / price rounded down to the
//      instrument's quantity precision. Skipped when below the instrument's
//      minimum quantity or notional, or below min_order_value.
//
// Market intents carry the touch price (best ask to buy, best bid to sell)
// as their reference price.
// -----------------------------------------------------------------------------
class BookImbalanceStrategy : public IStrategy {
 public:
  BookImbalanceStrategy(BookImbalanceConfig config,
                        const std::vector<domain::Instrument>& instruments);

  std::string id() const override { return config_.strategy_id; }

  std::vector<domain::OrderIntent> decide(
      const MarketSnapshot& market, const LedgerView& ledger,
      const domain::Position& position) const override;

  // Signed imbalance in [-1, 1]; 0 for an empty or one-sided book.
  double imbalance(const domain::OrderBookSnapshot& book) const;

  static int confidence(double imbalance);

  // Order size for opening a position; 0 when too small to trade.
  double positionSize(const std::string& symbol, double available,
                      double price) const;

  const BookImbalanceConfig& config() const { return config_; }

 private:
  domain::OrderIntent closeIntent(const std::string& symbol,
                                  const domain::Position& position,
                                  double price, std::string reason) const;

  domain::Instrument instrumentFor(const std::string& symbol) const;

  BookImbalanceConfig config_;
  std::map<std::string, domain::Instrument> instruments_;
};

}  // namespace bgcore
