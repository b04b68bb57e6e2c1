#pragma once

#include "bgcore/domain/order.hpp"
#include "bgcore/events/event_types.hpp"

#include <cstdint>
#include <string>

namespace bgcore {

// -----------------------------------------------------------------------------
// Exchange order events
// -----------------------------------------------------------------------------
//
// @brief  What the exchange reported about one of our orders. Produced by the
//         transport (REST responses and private stream pushes) and applied by
//         the OrderLedger on the stream loop.
//
// @details
// Orders are matched by client_id first (decoded from the exchange's
// clientOid) and by exchange_id second. client_id == 0 means the clientOid
// was absent or not one of ours.
//
// Thread model:
//   Plain values; created on transport threads, copied into the bounded event
//   channel, consumed on the stream loop thread.
// -----------------------------------------------------------------------------

// Exchange accepted the order and assigned an id.
struct OrderAckEvent {
  domain::OrderId client_id{0};
  std::string exchange_id;
  std::string symbol;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// FillEvent
// -----------------------------------------------------------------------------
// One execution against an order. fill_id is the exchange trade id and is the
// idempotency key: the ledger applies a given fill_id at most once.
// -----------------------------------------------------------------------------
struct FillEvent {
  domain::OrderId client_id{0};
  std::string exchange_id;
  std::string fill_id;
  std::string symbol;
  domain::Side side{domain::Side::Buy};
  double price{0.0};
  double quantity{0.0};
  double fee{0.0};             // Positive = paid, in the margin asset
  std::int64_t timestamp_ms{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// CancelAckEvent
// -----------------------------------------------------------------------------
// Order is no longer working. exchange_initiated distinguishes our own cancel
// request from e.g. self-trade prevention. cumulative_filled, when >= 0, is
// the exchange's filled quantity at cancel time; the ledger uses it to spot
// fills that have not arrived yet.
// -----------------------------------------------------------------------------
struct CancelAckEvent {
  domain::OrderId client_id{0};
  std::string exchange_id;
  std::string symbol;
  bool exchange_initiated{false};
  double cumulative_filled{-1.0};
  std::string reason;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// Exchange refused the order (insufficient balance, invalid price, ...).
struct RejectEvent {
  domain::OrderId client_id{0};
  std::string exchange_id;
  std::string symbol;
  std::string code;
  std::string reason;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// Exchange-reported funds for one asset (account channel or REST).
struct BalanceEvent {
  std::string asset;
  double available{0.0};
  double total{0.0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// OrderStatusReport
// -----------------------------------------------------------------------------
// Authoritative state of one order as returned by the exchange's order detail
// and open-order endpoints. Used for reconciliation, not carried on the bus.
// -----------------------------------------------------------------------------
struct OrderStatusReport {
  domain::OrderId client_id{0};
  std::string exchange_id;
  std::string symbol;
  domain::Side side{domain::Side::Buy};
  domain::OrderType type{domain::OrderType::Limit};
  double price{0.0};
  double quantity{0.0};
  double filled_quantity{0.0};
  double average_fill_price{0.0};
  domain::OrderStatus status{domain::OrderStatus::Acknowledged};
  std::int64_t updated_ms{0};
};

}  // namespace bgcore
