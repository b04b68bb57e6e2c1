#include "bgcore/exchange/heartbeat_monitor.hpp"

#include "bgcore/domain/errors.hpp"

#include <string>

namespace bgcore {

HeartbeatMonitor::HeartbeatMonitor(const HeartbeatConfig& config,
                                   const ITimeProvider& clock)
    : config_(config), clock_(clock) {
  reset();
}

void HeartbeatMonitor::reset() {
  last_ping_ms_ = clock_.now_ms();
  ping_sent_ms_ = 0;
}

bool HeartbeatMonitor::pingDue() const {
  return ping_sent_ms_ == 0 &&
         clock_.now_ms() - last_ping_ms_ >= config_.ping_interval_ms;
}

void HeartbeatMonitor::onPingSent() {
  last_ping_ms_ = clock_.now_ms();
  ping_sent_ms_ = last_ping_ms_;
}

void HeartbeatMonitor::onPong() { ping_sent_ms_ = 0; }

void HeartbeatMonitor::check() const {
  if (ping_sent_ms_ != 0 &&
      clock_.now_ms() - ping_sent_ms_ > config_.pong_timeout_ms) {
    throw TransientNetworkError("heartbeat gap: no pong within " +
                                std::to_string(config_.pong_timeout_ms) +
                                " ms");
  }
}

}  // namespace bgcore
