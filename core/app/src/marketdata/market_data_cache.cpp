#include "bgcore/marketdata/market_data_cache.hpp"

#include "bgcore/domain/errors.hpp"

#include <iostream>
#include <type_traits>

namespace bgcore {

const char* toString(MarketDataCache::ApplyResult result) {
  switch (result) {
    case MarketDataCache::ApplyResult::Applied:
      return "Applied";
    case MarketDataCache::ApplyResult::Stale:
      return "Stale";
    case MarketDataCache::ApplyResult::AwaitingSnapshot:
      return "AwaitingSnapshot";
    case MarketDataCache::ApplyResult::Gap:
      return "Gap";
    case MarketDataCache::ApplyResult::Ignored:
      return "Ignored";
  }
  return "Unknown";
}

MarketDataCache::MarketDataCache(const ExchangeSession& session,
                                 std::size_t max_depth,
                                 ResyncRequester requester)
    : session_(session),
      max_depth_(max_depth),
      requester_(std::move(requester)) {}

void MarketDataCache::setResyncRequester(ResyncRequester requester) {
  requester_ = std::move(requester);
}

bool MarketDataCache::accepts(const std::string& symbol) const {
  if (symbol.empty()) {
    return false;
  }
  // With no instrument metadata loaded every symbol is accepted.
  return session_.instruments().empty() ||
         session_.instrument(symbol).has_value();
}

MarketDataCache::Entry* MarketDataCache::entry(const std::string& symbol,
                                               bool create) {
  std::lock_guard lock(entries_mutex_);
  auto it = entries_.find(symbol);
  if (it != entries_.end()) {
    return it->second.get();
  }
  if (!create) {
    return nullptr;
  }
  auto inserted = entries_.emplace(symbol, std::make_unique<Entry>());
  return inserted.first->second.get();
}

const MarketDataCache::Entry* MarketDataCache::findEntry(
    const std::string& symbol) const {
  std::lock_guard lock(entries_mutex_);
  auto it = entries_.find(symbol);
  return it == entries_.end() ? nullptr : it->second.get();
}

MarketDataCache::ApplyResult MarketDataCache::applyEvent(const Event& event) {
  return std::visit(
      [this](const auto& e) -> ApplyResult {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, BookSnapshotEvent>) {
          return applySnapshot(e);
        } else if constexpr (std::is_same_v<T, BookUpdateEvent>) {
          return applyUpdate(e);
        } else if constexpr (std::is_same_v<T, TickerEvent>) {
          return applyTicker(e);
        } else if constexpr (std::is_same_v<T, TradeEvent>) {
          return applyTrade(e);
        } else {
          return ApplyResult::Ignored;
        }
      },
      event);
}

// -----------------------------------------------------------------------------
// Books
// -----------------------------------------------------------------------------

MarketDataCache::ApplyResult MarketDataCache::applySnapshot(
    const BookSnapshotEvent& event) {
  const std::string& symbol = event.book.symbol;
  if (!accepts(symbol)) {
    return ApplyResult::Ignored;
  }
  Entry& e = *entry(symbol, true);

  std::string gap_reason;
  {
    std::lock_guard lock(e.write_mutex);
    if (e.valid && (event.book.version < e.snapshot_version ||
                    (event.book.timestamp_ms != 0 &&
                     event.book.timestamp_ms < e.timestamp_ms))) {
      return ApplyResult::Stale;
    }

    e.bids.clear();
    e.asks.clear();
    for (const auto& level : event.book.bids) {
      if (level.quantity > 0.0) {
        e.bids[level.price] = level.quantity;
      }
    }
    for (const auto& level : event.book.asks) {
      if (level.quantity > 0.0) {
        e.asks[level.price] = level.quantity;
      }
    }

    if (!e.bids.empty() && !e.asks.empty() &&
        !(e.bids.begin()->first < e.asks.begin()->first)) {
      gap_reason = "crossed snapshot";
      invalidateLocked(e);
    } else {
      e.version = event.book.version;
      e.snapshot_version = event.book.version;
      e.stream_seq = event.stream_seq;
      e.timestamp_ms = event.book.timestamp_ms;
      e.valid = true;
      publishLocked(e, symbol);
    }
  }

  if (!gap_reason.empty()) {
    requestResync(symbol, gap_reason);
    return ApplyResult::Gap;
  }
  return ApplyResult::Applied;
}

MarketDataCache::ApplyResult MarketDataCache::applyUpdate(
    const BookUpdateEvent& event) {
  if (!accepts(event.symbol)) {
    return ApplyResult::Ignored;
  }
  Entry& e = *entry(event.symbol, true);

  std::string gap_reason;
  {
    std::lock_guard lock(e.write_mutex);
    if (!e.valid) {
      return ApplyResult::AwaitingSnapshot;
    }
    try {
      if (isStaleLocked(e, event)) {
        return ApplyResult::Stale;
      }
      patchLocked(e, event);
      publishLocked(e, event.symbol);
    } catch (const SequenceGapError& err) {
      gap_reason = err.what();
      invalidateLocked(e);
    }
  }

  if (!gap_reason.empty()) {
    requestResync(event.symbol, gap_reason);
    return ApplyResult::Gap;
  }
  return ApplyResult::Applied;
}

bool MarketDataCache::isStaleLocked(const Entry& e,
                                    const BookUpdateEvent& event) const {
  // Chained to the stream: sequence numbers decide.
  if (e.stream_seq != 0 && event.version != 0) {
    if (event.version <= e.stream_seq) {
      return true;
    }
    if (event.previous_version != 0 && event.previous_version != e.stream_seq) {
      throw SequenceGapError("expected previous sequence " +
                             std::to_string(e.stream_seq) + ", got " +
                             std::to_string(event.previous_version));
    }
    return false;
  }

  // Book came from REST: rebase on the first push newer than it.
  if (event.timestamp_ms != 0 && e.timestamp_ms != 0) {
    return event.timestamp_ms <= e.timestamp_ms;
  }

  if (event.version <= e.version) {
    return true;
  }
  if (event.previous_version != 0 && event.previous_version != e.version) {
    throw SequenceGapError("expected previous version " +
                           std::to_string(e.version) + ", got " +
                           std::to_string(event.previous_version));
  }
  return false;
}

void MarketDataCache::patchLocked(Entry& e, const BookUpdateEvent& event) {

  for (const auto& level : event.bids) {
    if (level.quantity <= 0.0) {
      e.bids.erase(level.price);
    } else {
      e.bids[level.price] = level.quantity;
    }
  }
  for (const auto& level : event.asks) {
    if (level.quantity <= 0.0) {
      e.asks.erase(level.price);
    } else {
      e.asks[level.price] = level.quantity;
    }
  }

  if (!e.bids.empty() && !e.asks.empty() &&
      !(e.bids.begin()->first < e.asks.begin()->first)) {
    throw SequenceGapError("book crossed after update " +
                           std::to_string(event.version));
  }

  e.version = event.version;
  if (event.version != 0) {
    e.stream_seq = event.version;
  }
  if (event.timestamp_ms > e.timestamp_ms) {
    e.timestamp_ms = event.timestamp_ms;
  }
}

void MarketDataCache::publishLocked(Entry& e, const std::string& symbol) {
  auto book = std::make_shared<domain::OrderBookSnapshot>();
  book->symbol = symbol;
  book->version = e.version;
  book->timestamp_ms = e.timestamp_ms;

  for (const auto& [price, quantity] : e.bids) {
    if (max_depth_ != 0 && book->bids.size() >= max_depth_) {
      break;
    }
    book->bids.push_back({price, quantity});
  }
  for (const auto& [price, quantity] : e.asks) {
    if (max_depth_ != 0 && book->asks.size() >= max_depth_) {
      break;
    }
    book->asks.push_back({price, quantity});
  }

  std::shared_ptr<const domain::OrderBookSnapshot> published = std::move(book);
  std::atomic_store(&e.published, published);
}

void MarketDataCache::invalidateLocked(Entry& e) {
  e.valid = false;
  e.bids.clear();
  e.asks.clear();
  std::atomic_store(&e.published,
                    std::shared_ptr<const domain::OrderBookSnapshot>{});
}

void MarketDataCache::requestResync(const std::string& symbol,
                                    const std::string& reason) {
  std::cerr << "[MarketDataCache] " << symbol << " invalidated (" << reason
            << "), requesting resync" << std::endl;
  if (requester_) {
    requester_(symbol, reason);
  }
}

void MarketDataCache::invalidate(const std::string& symbol,
                                 const std::string& reason) {
  Entry* e = entry(symbol, false);
  if (e) {
    std::lock_guard lock(e->write_mutex);
    invalidateLocked(*e);
  }
  requestResync(symbol, reason);
}

// -----------------------------------------------------------------------------
// Ticker and trades
// -----------------------------------------------------------------------------

MarketDataCache::ApplyResult MarketDataCache::applyTicker(
    const TickerEvent& event) {
  if (!accepts(event.symbol)) {
    return ApplyResult::Ignored;
  }
  Entry& e = *entry(event.symbol, true);
  std::lock_guard lock(e.write_mutex);
  if (event.timestamp_ms != 0 && event.timestamp_ms < e.latest_ticker.timestamp_ms) {
    return ApplyResult::Stale;
  }
  e.latest_ticker.symbol = event.symbol;
  if (event.last_price > 0.0) {
    e.latest_ticker.last_price = event.last_price;
  }
  e.latest_ticker.best_bid = event.best_bid;
  e.latest_ticker.best_ask = event.best_ask;
  e.latest_ticker.volume_24h = event.volume_24h;
  e.latest_ticker.change_24h = event.change_24h;
  e.latest_ticker.timestamp_ms = event.timestamp_ms;
  std::atomic_store(&e.published_ticker,
                    std::shared_ptr<const domain::Ticker>(
                        std::make_shared<domain::Ticker>(e.latest_ticker)));
  return ApplyResult::Applied;
}

MarketDataCache::ApplyResult MarketDataCache::applyTrade(
    const TradeEvent& event) {
  if (!accepts(event.symbol) || event.price <= 0.0) {
    return ApplyResult::Ignored;
  }
  Entry& e = *entry(event.symbol, true);
  std::lock_guard lock(e.write_mutex);
  e.latest_ticker.symbol = event.symbol;
  e.latest_ticker.last_price = event.price;
  if (event.timestamp_ms > e.latest_ticker.timestamp_ms) {
    e.latest_ticker.timestamp_ms = event.timestamp_ms;
  }
  std::atomic_store(&e.published_ticker,
                    std::shared_ptr<const domain::Ticker>(
                        std::make_shared<domain::Ticker>(e.latest_ticker)));
  return ApplyResult::Applied;
}

// -----------------------------------------------------------------------------
// Readers
// -----------------------------------------------------------------------------

std::shared_ptr<const domain::OrderBookSnapshot> MarketDataCache::snapshot(
    const std::string& symbol) const {
  const Entry* e = findEntry(symbol);
  if (!e) {
    return nullptr;
  }
  return std::atomic_load(&e->published);
}

std::optional<domain::Ticker> MarketDataCache::ticker(
    const std::string& symbol) const {
  const Entry* e = findEntry(symbol);
  if (!e) {
    return std::nullopt;
  }
  auto t = std::atomic_load(&e->published_ticker);
  if (!t) {
    return std::nullopt;
  }
  return *t;
}

double MarketDataCache::lastPrice(const std::string& symbol) const {
  auto t = ticker(symbol);
  return t ? t->last_price : 0.0;
}

MarketSnapshot MarketDataCache::market(const std::string& symbol) const {
  MarketSnapshot m;
  m.symbol = symbol;
  m.book = snapshot(symbol);
  m.ticker = ticker(symbol);
  m.last_price = m.ticker ? m.ticker->last_price : 0.0;
  return m;
}

bool MarketDataCache::isValid(const std::string& symbol) const {
  return snapshot(symbol) != nullptr;
}

std::vector<std::string> MarketDataCache::symbols() const {
  std::lock_guard lock(entries_mutex_);
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto& kv : entries_) {
    out.push_back(kv.first);
  }
  return out;
}

}  // namespace bgcore
