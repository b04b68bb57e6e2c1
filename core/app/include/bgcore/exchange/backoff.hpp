#pragma once

#include <chrono>
#include <cstdint>
#include <random>

namespace bgcore {

struct BackoffConfig {
  std::int64_t base_ms{500};
  std::int64_t cap_ms{30000};
  double jitter{0.2};  // Fraction of the nominal delay, e.g. 0.2 = ±20%
};

// -----------------------------------------------------------------------------
// ExponentialBackoff
// -----------------------------------------------------------------------------
// Reconnect delay schedule. The nominal delay of attempt n is
// min(cap, base * 2^n); the returned delay is drawn uniformly from
// nominal * [1 - jitter, 1 + jitter]. reset() after a successful connect.
//
// Not thread-safe; each stream channel owns one.
// -----------------------------------------------------------------------------
class ExponentialBackoff {
 public:
  explicit ExponentialBackoff(const BackoffConfig& config,
                              std::uint32_t seed = std::random_device{}());

  std::chrono::milliseconds nextDelay();

  // Nominal (unjittered) delay for the given attempt number.
  std::int64_t nominalDelayMs(int attempt) const;

  void reset() { attempt_ = 0; }
  int attempt() const { return attempt_; }

 private:
  BackoffConfig config_;
  int attempt_{0};
  std::mt19937 rng_;
};

}  // namespace bgcore
