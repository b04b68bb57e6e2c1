#pragma once

#include "bgcore/domain/order_book.hpp"
#include "bgcore/domain/ticker.hpp"
#include "bgcore/events/event.hpp"
#include "bgcore/marketdata/market_snapshot.hpp"
#include "bgcore/session/exchange_session.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bgcore {

// -----------------------------------------------------------------------------
// MarketDataCache
// -----------------------------------------------------------------------------
//
// @brief  Latest order book, ticker and last trade price per instrument,
//         built from stream events and read by strategies and the ledger's
//         mark-to-market.
//
// @details
// Book rules:
//   - A snapshot replaces the book, unless the book is valid and the
//     snapshot is older than it (by snapshot version or exchange time).
//   - Updates are ordered by stream sequence. Once the entry knows the last
//     applied stream sequence, an update with sequence <= it is stale and
//     dropped, which makes the cache idempotent under duplicates and
//     reordering. An update whose previous_version is set and differs from
//     that sequence is a sequence gap.
//   - A REST snapshot carries no stream sequence. The first update that is
//     newer by exchange time is applied without the chain check and sets
//     the sequence; older or same-time updates are stale.
//   - Feeds without timestamps fall back to comparing update versions with
//     the entry's version.
//   - A patch that leaves the book crossed or out of order is also a gap.
//     On a gap the entry is invalidated, readers get no book, and the
//     ResyncRequester is called. Updates are then dropped until a snapshot
//     arrives.
//
// Publication: each write builds an immutable OrderBookSnapshot (truncated
// to max_depth levels) and swaps it in with std::atomic_store. Readers use
// std::atomic_load and never wait for a writer.
//
// Thread model:
//   applyEvent() is called from the stream loop; a per-instrument mutex
//   serializes writers of one symbol. snapshot()/ticker()/market() are safe
//   from any thread.
// -----------------------------------------------------------------------------
class MarketDataCache {
 public:
  enum class ApplyResult {
    Applied,
    Stale,         // Version not newer than current
    AwaitingSnapshot,
    Gap,           // Entry invalidated, resync requested
    Ignored,       // Not a market data event, or unknown instrument
  };

  using ResyncRequester =
      std::function<void(const std::string& symbol, const std::string& reason)>;

  explicit MarketDataCache(const ExchangeSession& session,
                           std::size_t max_depth = 50,
                           ResyncRequester requester = nullptr);

  MarketDataCache(const MarketDataCache&) = delete;
  MarketDataCache& operator=(const MarketDataCache&) = delete;

  // Must be set before the stream starts.
  void setResyncRequester(ResyncRequester requester);

  ApplyResult applyEvent(const Event& event);

  // Null when no valid book exists for the symbol.
  std::shared_ptr<const domain::OrderBookSnapshot> snapshot(
      const std::string& symbol) const;

  std::optional<domain::Ticker> ticker(const std::string& symbol) const;

  // Last trade or ticker price; 0 if none seen.
  double lastPrice(const std::string& symbol) const;

  MarketSnapshot market(const std::string& symbol) const;

  bool isValid(const std::string& symbol) const;

  // Drops the book and asks for a resync.
  void invalidate(const std::string& symbol, const std::string& reason);

  std::vector<std::string> symbols() const;

 private:
  struct Entry {
    std::mutex write_mutex;
    std::map<double, double, std::greater<double>> bids;
    std::map<double, double> asks;
    std::uint64_t version{0};           // Published with the book
    std::uint64_t snapshot_version{0};  // Version of the last snapshot
    std::uint64_t stream_seq{0};        // 0: not chained to the stream yet
    std::int64_t timestamp_ms{0};
    bool valid{false};
    domain::Ticker latest_ticker;  // Writer-side copy

    // Read without write_mutex via std::atomic_load.
    std::shared_ptr<const domain::OrderBookSnapshot> published;
    std::shared_ptr<const domain::Ticker> published_ticker;
  };

  Entry* entry(const std::string& symbol, bool create);
  const Entry* findEntry(const std::string& symbol) const;

  ApplyResult applySnapshot(const BookSnapshotEvent& event);
  ApplyResult applyUpdate(const BookUpdateEvent& event);
  ApplyResult applyTicker(const TickerEvent& event);
  ApplyResult applyTrade(const TradeEvent& event);

  // Stale/gap classification of an update against a valid entry. Caller
  // holds e.write_mutex. Throws SequenceGapError.
  bool isStaleLocked(const Entry& e, const BookUpdateEvent& event) const;
  // Caller holds e.write_mutex. Throws SequenceGapError.
  void patchLocked(Entry& e, const BookUpdateEvent& event);
  void publishLocked(Entry& e, const std::string& symbol);
  void invalidateLocked(Entry& e);
  void requestResync(const std::string& symbol, const std::string& reason);
  bool accepts(const std::string& symbol) const;

  const ExchangeSession& session_;
  const std::size_t max_depth_;
  ResyncRequester requester_;

  mutable std::mutex entries_mutex_;  // Guards the map itself, not entries
  std::map<std::string, std::unique_ptr<Entry>> entries_;
};

const char* toString(MarketDataCache::ApplyResult result);

}  // namespace bgcore
