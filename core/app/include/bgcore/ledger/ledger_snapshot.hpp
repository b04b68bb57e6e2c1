#pragma once

#include "bgcore/domain/balance.hpp"
#include "bgcore/domain/order.hpp"
#include "bgcore/domain/position.hpp"

#include <cstdint>
#include <vector>

namespace bgcore {

// Persistable ledger state: everything needed to resume after a restart
// without re-deriving positions from exchange history. Terminal orders are
// not included.
struct LedgerSnapshot {
  std::vector<domain::Order> open_orders;
  std::vector<domain::Position> positions;
  std::vector<domain::Balance> balances;
  std::uint64_t last_sequence{0};
  domain::OrderId next_order_id{1};
  std::int64_t saved_ms{0};
};

}  // namespace bgcore
