#pragma once

#include <cstdint>

namespace bgcore {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source
// -----------------------------------------------------------------------------
//
// @brief  Abstracts "current time" away from std::chrono::system_clock so the
//         rate limiter, risk gate interval check, request signer and pending
//         order timeout can be driven deterministically in tests.
//
// @details
//   - LiveTimeProvider       → std::chrono::system_clock.
//   - SimulationTimeProvider → a value set explicitly by the caller.
//
// Epoch milliseconds matches the exchange's ACCESS-TIMESTAMP header and the
// `ts` fields of every Bitget payload.
//
// Thread-safety contract:
//   Implementations must be safe for concurrent reads from any thread.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Epoch time in milliseconds.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace bgcore
