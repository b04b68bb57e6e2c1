#pragma once

#include "bgcore/domain/order.hpp"
#include "bgcore/events/event_types.hpp"
#include "bgcore/events/exchange_events.hpp"

#include <vector>

namespace bgcore {

// -----------------------------------------------------------------------------
// ReconcileEvent
// -----------------------------------------------------------------------------
//
// @brief  Authoritative order state fetched during a resync, handed to the
//         stream loop so the OrderLedger applies it in order with the stream
//         events around it.
//
// @details
//   - open_orders:    The exchange's current open-order list.
//   - final_reports:  Query results for local orders absent from that list.
//   - unknown_orders: Local orders the exchange has no record of.
//
// The network calls that build this happen on the decision loop; the
// ledger mutation happens on the stream loop.
// -----------------------------------------------------------------------------
struct ReconcileEvent {
  std::vector<OrderStatusReport> open_orders;
  std::vector<OrderStatusReport> final_reports;
  std::vector<domain::OrderId> unknown_orders;
  bool complete{true};  // False if some queries failed and should be retried
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace bgcore
