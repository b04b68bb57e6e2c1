#pragma once

#include "bgcore/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace bgcore {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" only moves when advance_time() or
//         advance_by() is called.
//
// @details
// Used by tests that check time-dependent behaviour (token refill, minimum
// order interval, pending timeout) without sleeping. Backed by an atomic so
// readers on other threads see the latest value without locking.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  explicit SimulationTimeProvider(std::int64_t start_ms = 0)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Sets the clock. Caller keeps it monotonic.
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_;
};

}  // namespace bgcore
