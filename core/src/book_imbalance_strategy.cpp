#include "bgcore/strategy/book_imbalance_strategy.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace bgcore {

BookImbalanceStrategy::BookImbalanceStrategy(
    BookImbalanceConfig config,
    const std::vector<domain::Instrument>& instruments)
    : config_(std::move(config)) {
  for (const auto& instrument : instruments) {
    instruments_[instrument.symbol] = instrument;
  }
}

domain::Instrument BookImbalanceStrategy::instrumentFor(
    const std::string& symbol) const {
  auto it = instruments_.find(symbol);
  if (it != instruments_.end()) {
    return it->second;
  }
  // Unknown contract: lot size 0.001, as on most Bitget USDT perpetuals.
  domain::Instrument fallback;
  fallback.symbol = symbol;
  fallback.quantity_precision = 3;
  fallback.min_quantity = 0.001;
  return fallback;
}

double BookImbalanceStrategy::imbalance(
    const domain::OrderBookSnapshot& book) const {
  double bid_volume = 0.0;
  double ask_volume = 0.0;
  const std::size_t bid_levels = std::min(config_.depth_levels, book.bids.size());
  const std::size_t ask_levels = std::min(config_.depth_levels, book.asks.size());
  for (std::size_t i = 0; i < bid_levels; ++i) {
    bid_volume += book.bids[i].quantity;
  }
  for (std::size_t i = 0; i < ask_levels; ++i) {
    ask_volume += book.asks[i].quantity;
  }
  if (bid_volume <= 0.0 || ask_volume <= 0.0) {
    return 0.0;
  }
  return (bid_volume - ask_volume) / (bid_volume + ask_volume);
}

int BookImbalanceStrategy::confidence(double imbalance) {
  const int value = static_cast<int>(std::lround(std::abs(imbalance) * 10.0));
  return std::clamp(value, 0, 10);
}

double BookImbalanceStrategy::positionSize(const std::string& symbol,
                                           double available,
                                           double price) const {
  if (price <= 0.0 || available <= 0.0) {
    return 0.0;
  }
  const domain::Instrument instrument = instrumentFor(symbol);
  const double value = std::min(available * config_.max_position_percent / 100.0,
                                config_.max_position_value);
  const double quantity = domain::roundQuantityDown(instrument, value / price);

  const double notional = quantity * price;
  if (quantity < instrument.min_quantity ||
      notional < instrument.min_notional ||
      notional < config_.min_order_value) {
    return 0.0;
  }
  return quantity;
}

domain::OrderIntent BookImbalanceStrategy::closeIntent(
    const std::string& symbol, const domain::Position& position, double price,
    std::string reason) const {
  domain::OrderIntent intent;
  intent.strategy_id = config_.strategy_id;
  intent.symbol = symbol;
  intent.side = position.net_quantity > 0.0 ? domain::Side::Sell
                                            : domain::Side::Buy;
  intent.type = domain::OrderType::Market;
  intent.price = price;
  intent.quantity = std::abs(position.net_quantity);
  intent.reduce_only = true;
  intent.reason = std::move(reason);
  return intent;
}

std::vector<domain::OrderIntent> BookImbalanceStrategy::decide(
    const MarketSnapshot& market, const LedgerView& ledger,
    const domain::Position& position) const {
  if (ledger.hasOpenOrders(market.symbol)) {
    return {};
  }
  const double price = market.referencePrice();
  if (price <= 0.0) {
    return {};
  }

  const bool is_long = position.net_quantity > 0.0;
  const bool is_short = position.net_quantity < 0.0;

  // --- Exits first -----------------------------------------------------------
  if ((is_long || is_short) && position.average_price > 0.0) {
    const double entry = position.average_price;
    const double sl = config_.stop_loss_percent / 100.0;
    const double tp = config_.take_profit_percent / 100.0;
    if (is_long) {
      if (sl > 0.0 && price <= entry * (1.0 - sl)) {
        return {closeIntent(market.symbol, position, price, "stop-loss")};
      }
      if (tp > 0.0 && price >= entry * (1.0 + tp)) {
        return {closeIntent(market.symbol, position, price, "take-profit")};
      }
    } else {
      if (sl > 0.0 && price >= entry * (1.0 + sl)) {
        return {closeIntent(market.symbol, position, price, "stop-loss")};
      }
      if (tp > 0.0 && price <= entry * (1.0 - tp)) {
        return {closeIntent(market.symbol, position, price, "take-profit")};
      }
    }
  }

  // --- Signal ----------------------------------------------------------------
  if (!market.hasBook()) {
    return {};
  }
  const domain::OrderBookSnapshot& book = *market.book;
  const double signal = imbalance(book);
  const int conf = confidence(signal);
  if (signal == 0.0 || conf < config_.confidence_threshold) {
    return {};
  }
  const domain::Side side = signal > 0.0 ? domain::Side::Buy : domain::Side::Sell;

  const domain::PriceLevel* touch =
      side == domain::Side::Buy ? book.bestAsk() : book.bestBid();
  const double touch_price = touch ? touch->price : price;

  std::ostringstream why;
  why << "imbalance " << signal << " confidence " << conf << "/10";

  if ((side == domain::Side::Buy && is_short) ||
      (side == domain::Side::Sell && is_long)) {
    return {closeIntent(market.symbol, position, touch_price,
                        "reverse: " + why.str())};
  }
  if ((side == domain::Side::Buy && is_long) ||
      (side == domain::Side::Sell && is_short)) {
    return {};
  }

  const double available = ledger.marginBalance().available;
  if (available < config_.min_balance) {
    return {};
  }
  const double quantity = positionSize(market.symbol, available, touch_price);
  if (quantity <= 0.0) {
    return {};
  }

  domain::OrderIntent intent;
  intent.strategy_id = config_.strategy_id;
  intent.symbol = market.symbol;
  intent.side = side;
  intent.type = domain::OrderType::Market;
  intent.price = touch_price;
  intent.quantity = quantity;
  intent.reason = why.str();
  return {intent};
}

}  // namespace bgcore
