#pragma once

#include "bgcore/time/i_time_provider.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>

namespace bgcore {

// -----------------------------------------------------------------------------
// TokenBucket
// -----------------------------------------------------------------------------
// Holds up to `capacity` tokens and refills continuously at `refill_per_sec`.
// Over any window of length t the bucket grants at most
// capacity + refill_per_sec * t tokens.
//
// Time comes from the injected ITimeProvider so tests can step the clock.
// Thread-safe.
// -----------------------------------------------------------------------------
class TokenBucket {
 public:
  TokenBucket(double capacity, double refill_per_sec,
              const ITimeProvider& clock);

  // Takes one token if available.
  bool tryAcquire();

  // Milliseconds until one token will be available (0 if one is now).
  std::int64_t msUntilAvailable();

  double available();
  double capacity() const { return capacity_; }
  double refillPerSec() const { return refill_per_sec_; }

 private:
  void refillLocked();

  const double capacity_;
  const double refill_per_sec_;
  const ITimeProvider& clock_;

  std::mutex mutex_;
  double tokens_;
  std::int64_t last_refill_ms_;
};

// Bitget rate limits are per endpoint, grouped here by what the call does.
enum class EndpointClass : std::size_t {
  PlaceOrder = 0,
  CancelOrder,
  Query,
  MarketData,
};

inline constexpr std::size_t kEndpointClassCount = 4;

const char* toString(EndpointClass endpoint);

struct BucketLimits {
  double capacity{10.0};
  double refill_per_sec{10.0};
};

struct RateLimitConfig {
  BucketLimits place_order{10.0, 10.0};
  BucketLimits cancel_order{10.0, 10.0};
  BucketLimits query{20.0, 20.0};
  BucketLimits market_data{20.0, 20.0};
  std::int64_t max_wait_ms{2000};
};

// -----------------------------------------------------------------------------
// RateLimiter
// -----------------------------------------------------------------------------
//
// @brief  One TokenBucket per EndpointClass with a bounded blocking acquire.
//
// @details
// acquire() waits (in short sleeps) until the class's bucket yields a token.
// If the next token is further away than the remaining wait budget, the call
// gives up immediately with RateLimitExceeded: the request is never sent,
// so the exchange never sees a burst above its limit.
//
// The sleep function is injectable; tests pass one that advances a
// SimulationTimeProvider instead of sleeping.
// -----------------------------------------------------------------------------
class RateLimiter {
 public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  RateLimiter(const RateLimitConfig& config, const ITimeProvider& clock,
              Sleeper sleeper = nullptr);

  // Throws RateLimitExceeded when no token can be had within max_wait_ms.
  void acquire(EndpointClass endpoint);

  bool tryAcquire(EndpointClass endpoint);

  TokenBucket& bucket(EndpointClass endpoint);

 private:
  const ITimeProvider& clock_;
  const std::int64_t max_wait_ms_;
  Sleeper sleeper_;
  std::array<TokenBucket, kEndpointClassCount> buckets_;
};

}  // namespace bgcore
