#pragma once

#include "bgcore/events/event_types.hpp"
#include "bgcore/events/exchange_events.hpp"
#include "bgcore/events/order_update_event.hpp"
#include "bgcore/events/position_update_event.hpp"
#include "bgcore/events/reconcile_event.hpp"
#include "bgcore/events/risk_events.hpp"

#include <variant>

namespace bgcore {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope type for everything that moves through
// the engine: market data and order events from the exchange, stream
// connectivity notices, decision ticks, and the ledger/risk telemetry.
//
// One std::variant lets one EventBus and one ThreadSafeQueue carry every kind
// by value; subscribers dispatch with subscribe<T>() or std::get_if.
// -----------------------------------------------------------------------------
using Event = std::variant<
    BookSnapshotEvent,
    BookUpdateEvent,
    TradeEvent,
    TickerEvent,
    OrderAckEvent,
    FillEvent,
    CancelAckEvent,
    RejectEvent,
    BalanceEvent,
    ReconcileEvent,
    StreamStatusEvent,
    HeartbeatEvent,
    DecisionTickEvent,
    CancelRequestEvent,
    OrderUpdateEvent,
    PositionUpdateEvent,
    RiskRejectEvent,
    RiskViolationEvent>;

}  // namespace bgcore
