#include "bgcore/exchange/rate_limiter.hpp"

#include "bgcore/domain/errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <thread>

namespace bgcore {

TokenBucket::TokenBucket(double capacity, double refill_per_sec,
                         const ITimeProvider& clock)
    : capacity_(capacity),
      refill_per_sec_(refill_per_sec),
      clock_(clock),
      tokens_(capacity),
      last_refill_ms_(clock.now_ms()) {}

void TokenBucket::refillLocked() {
  const std::int64_t now = clock_.now_ms();
  if (now <= last_refill_ms_) {
    return;
  }
  const double elapsed_sec = static_cast<double>(now - last_refill_ms_) / 1000.0;
  tokens_ = std::min(capacity_, tokens_ + elapsed_sec * refill_per_sec_);
  last_refill_ms_ = now;
}

bool TokenBucket::tryAcquire() {
  std::lock_guard lock(mutex_);
  refillLocked();
  if (tokens_ >= 1.0) {
    tokens_ -= 1.0;
    return true;
  }
  return false;
}

std::int64_t TokenBucket::msUntilAvailable() {
  std::lock_guard lock(mutex_);
  refillLocked();
  if (tokens_ >= 1.0) {
    return 0;
  }
  if (refill_per_sec_ <= 0.0) {
    return INT64_MAX;
  }
  const double missing = 1.0 - tokens_;
  return static_cast<std::int64_t>(std::ceil(missing / refill_per_sec_ * 1000.0));
}

double TokenBucket::available() {
  std::lock_guard lock(mutex_);
  refillLocked();
  return tokens_;
}

const char* toString(EndpointClass endpoint) {
  switch (endpoint) {
    case EndpointClass::PlaceOrder:
      return "place-order";
    case EndpointClass::CancelOrder:
      return "cancel-order";
    case EndpointClass::Query:
      return "query";
    case EndpointClass::MarketData:
      return "market-data";
  }
  return "unknown";
}

RateLimiter::RateLimiter(const RateLimitConfig& config,
                         const ITimeProvider& clock, Sleeper sleeper)
    : clock_(clock),
      max_wait_ms_(config.max_wait_ms),
      sleeper_(std::move(sleeper)),
      buckets_{TokenBucket{config.place_order.capacity,
                           config.place_order.refill_per_sec, clock},
               TokenBucket{config.cancel_order.capacity,
                           config.cancel_order.refill_per_sec, clock},
               TokenBucket{config.query.capacity, config.query.refill_per_sec,
                           clock},
               TokenBucket{config.market_data.capacity,
                           config.market_data.refill_per_sec, clock}} {
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  }
}

TokenBucket& RateLimiter::bucket(EndpointClass endpoint) {
  return buckets_[static_cast<std::size_t>(endpoint)];
}

bool RateLimiter::tryAcquire(EndpointClass endpoint) {
  return bucket(endpoint).tryAcquire();
}

void RateLimiter::acquire(EndpointClass endpoint) {
  TokenBucket& b = bucket(endpoint);
  const std::int64_t deadline = clock_.now_ms() + max_wait_ms_;

  while (!b.tryAcquire()) {
    const std::int64_t wait = b.msUntilAvailable();
    const std::int64_t remaining = deadline - clock_.now_ms();
    if (wait > remaining) {
      throw RateLimitExceeded(std::string("rate limit for ") +
                              toString(endpoint) + " not available within " +
                              std::to_string(max_wait_ms_) + " ms");
    }
    sleeper_(std::chrono::milliseconds(std::max<std::int64_t>(wait, 1)));
  }
}

}  // namespace bgcore
