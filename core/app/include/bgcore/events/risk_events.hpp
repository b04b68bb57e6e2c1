#pragma once

#include "bgcore/events/event_types.hpp"

#include <cstdint>
#include <string>

namespace bgcore {

// -----------------------------------------------------------------------------
// RiskRejectEvent
// -----------------------------------------------------------------------------
// An intent was dropped by the RiskGate before any exchange interaction.
// -----------------------------------------------------------------------------
struct RiskRejectEvent {
  std::string strategy_id;
  std::string symbol;
  std::string reason;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// RiskViolationEvent: trading halted
// -----------------------------------------------------------------------------
//
// @brief  Published by the ExecutionCoordinator when it halts new
//         submissions: drawdown floor breached, authentication failure,
//         operator HALT.
//
// @details
//   - symbol:        Instrument that triggered the halt (empty if global).
//   - reason:        Human-readable description.
//   - current_value: Offending value where one exists (e.g. realized P&L).
//   - limit_value:   Threshold that was crossed.
// -----------------------------------------------------------------------------
struct RiskViolationEvent {
  std::string symbol;
  std::string reason;
  double current_value{0.0};
  double limit_value{0.0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace bgcore
