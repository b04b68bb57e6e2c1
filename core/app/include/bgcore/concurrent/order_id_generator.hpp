#pragma once

#include <atomic>
#include <cstdint>

namespace bgcore {

// -----------------------------------------------------------------------------
// OrderIdGenerator: thread-safe source of client order ids
// -----------------------------------------------------------------------------
//
// @brief  Produces unique, monotonically increasing client order ids. The id
//         is encoded into Bitget's clientOid so exchange events can be matched
//         back to the local order before the exchange id is known.
//
// @details
// Starts at 1 (0 is the "unset / not ours" sentinel). After a restart the
// ledger is hydrated from its snapshot and the coordinator calls
// advance_past() with the highest persisted id so new ids never collide with
// ones already sent to the exchange.
//
// Ownership:
//   Owned by the ExecutionCoordinator as a value member.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  OrderIdGenerator() = default;

  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // Ensures every later next_id() is greater than `id`.
  void advance_past(std::uint64_t id) {
    std::uint64_t current = next_id_.load(std::memory_order_relaxed);
    while (current <= id &&
           !next_id_.compare_exchange_weak(current, id + 1,
                                           std::memory_order_relaxed)) {
    }
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace bgcore
