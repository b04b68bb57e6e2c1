#pragma once

namespace bgcore {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus: order lifecycle state machine
// -----------------------------------------------------------------------------
//
// @brief  Enumerates every state an order can occupy between registration in
//         the OrderLedger and its terminal outcome on the exchange.
//
// @details
// The OrderLedger enforces the transition graph:
//
//   Pending ──> Acknowledged ──> PartiallyFilled ──> Filled
//      │             │              │  ▲   │
//      │             │              └──┘   └──> Cancelled
//      │             ├──> Filled
//      │             └──> Cancelled
//      ├──> PartiallyFilled / Filled   (fill observed before the ack)
//      ├──> Cancelled
//      └──> Rejected
//
// Terminal states: Filled, Cancelled, Rejected. A terminal order keeps its
// status forever; the ledger moves it to the archive.
//
// Thread model:
//   Plain enum. Thread-safe to copy and compare from any thread.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Pending,          // Registered locally, submission in flight
  Acknowledged,     // Exchange assigned an order id
  PartiallyFilled,  // Some quantity filled, remainder still working
  Filled,           // Fully filled, terminal
  Cancelled,        // Cancelled by request or by the exchange, terminal
  Rejected,         // Refused by the exchange, terminal
};

inline bool isTerminal(OrderStatus status) {
  return status == OrderStatus::Filled ||
         status == OrderStatus::Cancelled ||
         status == OrderStatus::Rejected;
}

inline const char* toString(OrderStatus status) {
  switch (status) {
    case OrderStatus::Pending:         return "Pending";
    case OrderStatus::Acknowledged:    return "Acknowledged";
    case OrderStatus::PartiallyFilled: return "PartiallyFilled";
    case OrderStatus::Filled:          return "Filled";
    case OrderStatus::Cancelled:       return "Cancelled";
    case OrderStatus::Rejected:        return "Rejected";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace bgcore
