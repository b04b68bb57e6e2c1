#pragma once

#include "bgcore/domain/order_book.hpp"
#include "bgcore/domain/order.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace bgcore {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock time carried by every event for ordering and auditing. Domain
// structs store epoch milliseconds instead; time_utils.hpp converts.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// BookSnapshotEvent
// -----------------------------------------------------------------------------
// Responsibility: Full replacement of one instrument's order book, either
// pushed by the stream ("snapshot" action) or fetched over REST during a
// resync.
//
// book.version is the exchange timestamp of the data, so stream and REST
// snapshots compare. stream_seq is the push's sequence number; 0 for a REST
// snapshot, which makes the cache rebase on the next newer push.
// -----------------------------------------------------------------------------
struct BookSnapshotEvent {
  domain::OrderBookSnapshot book;
  std::uint64_t stream_seq{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// BookUpdateEvent
// -----------------------------------------------------------------------------
// Responsibility: Incremental patch of one instrument's book. A level with
// quantity 0 removes that price.
//
// version is the stream sequence number of the push and previous_version
// the sequence it was built on (Bitget "seq" / "pseq"). previous_version 0
// means the feed does not chain updates; only the stale-version rule
// applies then. timestamp_ms is the exchange time of the push and may
// repeat across updates.
// -----------------------------------------------------------------------------
struct BookUpdateEvent {
  std::string symbol;
  std::vector<domain::PriceLevel> bids;
  std::vector<domain::PriceLevel> asks;
  std::uint64_t version{0};
  std::uint64_t previous_version{0};
  std::int64_t timestamp_ms{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// Public trade print.
struct TradeEvent {
  std::string symbol;
  std::string trade_id;
  double price{0.0};
  double quantity{0.0};
  domain::Side aggressor{domain::Side::Buy};
  std::int64_t timestamp_ms{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

struct TickerEvent {
  std::string symbol;
  double last_price{0.0};
  double best_bid{0.0};
  double best_ask{0.0};
  double volume_24h{0.0};
  double change_24h{0.0};
  std::int64_t timestamp_ms{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// StreamStatusEvent
// -----------------------------------------------------------------------------
// Responsibility: Connectivity notifications from the transport's stream
// channels. Connected and ResyncRequired make the coordinator run a full
// resync (open orders, books, balances) before trusting incremental data
// again. symbol is set when a single instrument needs a new book.
// AuthFailed is fatal: the private channel's login was refused.
// -----------------------------------------------------------------------------
struct StreamStatusEvent {
  enum class Kind {
    Connected,
    Disconnected,
    ResyncRequired,
    AuthFailed
  } kind{Kind::Connected};
  std::string channel;  // "public", "private", "cache", ...
  std::string symbol;
  std::string reason;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// HeartbeatEvent
// -----------------------------------------------------------------------------
// Liveness message from a component (e.g. a stream channel answering pong).
// -----------------------------------------------------------------------------
struct HeartbeatEvent {
  std::string component_id;
  std::string status;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// DecisionTickEvent
// -----------------------------------------------------------------------------
// Responsibility: Wakes the decision loop. Produced for every market data
// event (symbol set) and by the coordinator's timer (symbol empty → every
// allowed instrument).
// -----------------------------------------------------------------------------
struct DecisionTickEvent {
  std::string symbol;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// CancelRequestEvent
// -----------------------------------------------------------------------------
// Asks the decision loop to cancel one working order (operator command or
// order time-to-live). The terminal state comes back from the exchange as a
// CancelAckEvent.
// -----------------------------------------------------------------------------
struct CancelRequestEvent {
  domain::OrderId client_id{0};
  std::string reason;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace bgcore
