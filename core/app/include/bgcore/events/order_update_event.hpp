#pragma once

#include "bgcore/domain/order.hpp"
#include "bgcore/domain/order_status.hpp"
#include "bgcore/events/event_types.hpp"

namespace bgcore {

// -----------------------------------------------------------------------------
// OrderUpdateEvent
// -----------------------------------------------------------------------------
//
// @brief  Published by the OrderLedger whenever an order changes: a status
//         transition, a fill, or an exchange id assignment.
//
// @details
// order is a full copy taken after the change was applied; previous_status is
// the state before it. Subscribers (IPC telemetry, logging, tests) observe the
// lifecycle without touching the ledger.
//
// Thread model:
//   Published on whichever thread applied the change (normally the stream
//   loop). Plain data, safe to copy across threads.
// -----------------------------------------------------------------------------
struct OrderUpdateEvent {
  domain::Order order;
  domain::OrderStatus previous_status{domain::OrderStatus::Pending};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace bgcore
