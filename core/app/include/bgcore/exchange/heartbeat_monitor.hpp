#pragma once

#include "bgcore/time/i_time_provider.hpp"

#include <cstdint>

namespace bgcore {

struct HeartbeatConfig {
  std::int64_t ping_interval_ms{25000};
  std::int64_t pong_timeout_ms{10000};
};

// -----------------------------------------------------------------------------
// HeartbeatMonitor: ping/pong bookkeeping of one websocket connection
// -----------------------------------------------------------------------------
//
// A ping is due ping_interval_ms after the connection came up or after the
// last ping, provided no ping is still waiting for its pong. Only one ping is
// ever outstanding. check() throws TransientNetworkError once a ping has
// waited longer than pong_timeout_ms.
//
// Not thread-safe; used only on the owning channel's thread.
// -----------------------------------------------------------------------------
class HeartbeatMonitor {
 public:
  HeartbeatMonitor(const HeartbeatConfig& config, const ITimeProvider& clock);

  // A fresh connection: no ping outstanding, interval restarts now.
  void reset();

  bool pingDue() const;
  void onPingSent();
  void onPong();

  bool awaitingPong() const { return ping_sent_ms_ != 0; }

  void check() const;

 private:
  HeartbeatConfig config_;
  const ITimeProvider& clock_;
  std::int64_t last_ping_ms_{0};
  std::int64_t ping_sent_ms_{0};  // 0 = no ping outstanding
};

}  // namespace bgcore
