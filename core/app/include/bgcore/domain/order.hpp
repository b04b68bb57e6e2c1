#pragma once

#include "bgcore/domain/order_status.hpp"

#include <cstdint>
#include <string>

namespace bgcore {
namespace domain {

// -----------------------------------------------------------------------------
// OrderId
// -----------------------------------------------------------------------------
// Client-assigned order identifier, produced by OrderIdGenerator. On the wire
// it is encoded as the Bitget clientOid (see BitgetCodec::encodeClientOid).
// The exchange-assigned id is a separate string on the Order.
// -----------------------------------------------------------------------------
using OrderId = std::uint64_t;

enum class Side {
  Buy,
  Sell,
};

enum class OrderType {
  Limit,
  Market,
};

inline const char* toString(Side side) {
  return side == Side::Buy ? "Buy" : "Sell";
}

inline const char* toString(OrderType type) {
  return type == OrderType::Limit ? "Limit" : "Market";
}

// +1 for Buy, -1 for Sell. Used to turn unsigned quantities into signed
// position deltas.
inline double sideSign(Side side) { return side == Side::Buy ? 1.0 : -1.0; }

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
// Responsibility: Full state of one order: the approved intent (symbol, side,
// type, quantity, price) plus its lifecycle status and cumulative fills.
//
// @details
// Created in Pending state by the ExecutionCoordinator once the RiskGate has
// approved an intent. The authoritative copy lives inside the OrderLedger and
// is mutated only there, in response to exchange events. Copies handed out by
// the ledger (views, OrderUpdateEvent) are snapshots.
//
// `price` is the limit price for limit orders and the reference price used
// for reservation and notional checks for market orders.
//
// `exchange_id` is empty until the exchange acknowledges the order.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id{};                   // Client id
  std::string exchange_id;        // Exchange id, empty until acknowledged
  std::string strategy_id;        // Strategy that produced the intent
  std::string symbol;             // Instrument (e.g. "ETHUSDT")
  Side side{Side::Buy};
  OrderType type{OrderType::Limit};
  double price{0.0};
  double quantity{0.0};
  double filled_quantity{0.0};    // Sum of distinct fills
  double average_fill_price{0.0};
  bool reduce_only{false};
  OrderStatus status{OrderStatus::Pending};
  std::int64_t created_ms{0};
  std::int64_t updated_ms{0};

  double remainingQuantity() const {
    double remaining = quantity - filled_quantity;
    return remaining > 0.0 ? remaining : 0.0;
  }

  double notional() const { return price * quantity; }
};

}  // namespace domain
}  // namespace bgcore
