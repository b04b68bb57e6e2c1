#pragma once

#include "bgcore/domain/balance.hpp"
#include "bgcore/domain/position.hpp"
#include "bgcore/events/event_types.hpp"

namespace bgcore {

// -----------------------------------------------------------------------------
// PositionUpdateEvent
// -----------------------------------------------------------------------------
//
// @brief  Snapshot of a Position (and the margin balance it moved) after the
//         OrderLedger applied a fill.
//
// @details
// Both fields are copies taken inside the same locked reconciliation step, so
// a subscriber never sees a position that disagrees with the balance.
// -----------------------------------------------------------------------------
struct PositionUpdateEvent {
  domain::Position position;
  domain::Balance balance;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace bgcore
