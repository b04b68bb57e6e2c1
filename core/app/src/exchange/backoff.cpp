#include "bgcore/exchange/backoff.hpp"

#include <algorithm>

namespace bgcore {

ExponentialBackoff::ExponentialBackoff(const BackoffConfig& config,
                                       std::uint32_t seed)
    : config_(config), rng_(seed) {}

std::int64_t ExponentialBackoff::nominalDelayMs(int attempt) const {
  std::int64_t delay = config_.base_ms;
  for (int i = 0; i < attempt && delay < config_.cap_ms; ++i) {
    delay *= 2;
  }
  return std::min(delay, config_.cap_ms);
}

std::chrono::milliseconds ExponentialBackoff::nextDelay() {
  const double nominal = static_cast<double>(nominalDelayMs(attempt_));
  ++attempt_;

  const double jitter = std::clamp(config_.jitter, 0.0, 1.0);
  std::uniform_real_distribution<double> dist(nominal * (1.0 - jitter),
                                              nominal * (1.0 + jitter));
  return std::chrono::milliseconds(static_cast<std::int64_t>(dist(rng_)));
}

}  // namespace bgcore
