// =============================================================================
// stream_channel_test.cpp
// =============================================================================
// Unit tests for bgcore::HeartbeatMonitor and bgcore::StreamChannel.
//
// Validates:
//   - HeartbeatMonitor: ping due after the interval, one ping outstanding at a
//     time, a late pong is a heartbeat gap, a pong clears the deadline
//   - StreamChannel: a missing pong tears the connection down (Disconnected),
//     waits the backoff, then logs in and subscribes again (Connected)
//   - A pong keeps the connection alive
//   - A failed connect before the first Connected emits no Disconnected
//   - A rejected login emits AuthFailed and stops retrying
//
// Design: The channel runs against scripted in-memory connections from an
// injected ConnectionFactory. Heartbeat time is a SimulationTimeProvider, so
// each test decides exactly when a ping is due and when a pong is late.
// =============================================================================

#include "bgcore/domain/errors.hpp"
#include "bgcore/exchange/heartbeat_monitor.hpp"
#include "bgcore/exchange/stream_channel.hpp"
#include "bgcore/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace std::chrono_literals;
using Kind = bgcore::StreamStatusEvent::Kind;

namespace {

// Both ends of one scripted connection.
struct Wire {
  std::mutex mutex;
  std::condition_variable cv;
  std::deque<std::string> inbound;
  std::vector<std::string> written;
  std::string login_reply{"login-ok"};

  void push(std::string frame) {
    {
      std::lock_guard lock(mutex);
      inbound.push_back(std::move(frame));
    }
    cv.notify_all();
  }

  std::vector<std::string> writes() {
    std::lock_guard lock(mutex);
    return written;
  }

  bool wrote(const std::string& frame) {
    std::lock_guard lock(mutex);
    return std::find(written.begin(), written.end(), frame) != written.end();
  }
};

class ScriptedConnection : public bgcore::IStreamConnection {
 public:
  explicit ScriptedConnection(std::shared_ptr<Wire> wire) : wire_(std::move(wire)) {}

  std::optional<std::string> poll(std::chrono::milliseconds wait) override {
    std::unique_lock lock(wire_->mutex);
    if (!wire_->cv.wait_for(lock, wait, [this] { return !wire_->inbound.empty(); })) {
      return std::nullopt;
    }
    std::string frame = std::move(wire_->inbound.front());
    wire_->inbound.pop_front();
    return frame;
  }

  void write(const std::string& text) override {
    std::lock_guard lock(wire_->mutex);
    wire_->written.push_back(text);
    if (text == "LOGIN") {
      wire_->inbound.push_back(wire_->login_reply);
      wire_->cv.notify_all();
    }
  }

  void close() noexcept override {}

 private:
  std::shared_ptr<Wire> wire_;
};

// Polls `done` until it holds or five seconds pass.
bool eventually(const std::function<bool()>& done) {
  for (int i = 0; i < 1000; ++i) {
    if (done()) {
      return true;
    }
    std::this_thread::sleep_for(5ms);
  }
  return done();
}

}  // namespace

// -----------------------------------------------------------------------------
// HeartbeatMonitor
// -----------------------------------------------------------------------------

TEST(HeartbeatMonitorTest, PingDueAfterIntervalAndPongDeadline) {
  bgcore::SimulationTimeProvider clock(10'000);
  bgcore::HeartbeatMonitor heartbeat({1000, 500}, clock);

  EXPECT_FALSE(heartbeat.pingDue());
  clock.advance_by(999);
  EXPECT_FALSE(heartbeat.pingDue());
  clock.advance_by(1);
  EXPECT_TRUE(heartbeat.pingDue());

  heartbeat.onPingSent();
  EXPECT_TRUE(heartbeat.awaitingPong());
  clock.advance_by(2000);
  EXPECT_FALSE(heartbeat.pingDue());  // Never a second ping in flight

  EXPECT_THROW(heartbeat.check(), bgcore::TransientNetworkError);
}

TEST(HeartbeatMonitorTest, PongClearsDeadline) {
  bgcore::SimulationTimeProvider clock(10'000);
  bgcore::HeartbeatMonitor heartbeat({1000, 500}, clock);

  clock.advance_by(1000);
  heartbeat.onPingSent();
  clock.advance_by(500);
  EXPECT_NO_THROW(heartbeat.check());  // Exactly at the limit is still fine

  heartbeat.onPong();
  EXPECT_FALSE(heartbeat.awaitingPong());
  clock.advance_by(400);
  EXPECT_NO_THROW(heartbeat.check());
  EXPECT_FALSE(heartbeat.pingDue());
  clock.advance_by(100);
  EXPECT_TRUE(heartbeat.pingDue());

  heartbeat.onPingSent();
  heartbeat.reset();
  clock.advance_by(10'000);
  EXPECT_NO_THROW(heartbeat.check());
}

// -----------------------------------------------------------------------------
// StreamChannel
// -----------------------------------------------------------------------------

class StreamChannelTest : public ::testing::Test {
 protected:
  StreamChannelTest() : clock(1'700'000'000'000) {
    backoff.base_ms = 10;
    backoff.cap_ms = 20;
    backoff.jitter = 0.0;
    heartbeat.ping_interval_ms = 1000;
    heartbeat.pong_timeout_ms = 500;
  }

  ~StreamChannelTest() override {
    if (channel) {
      channel->stop();
    }
  }

  void start(bool with_login) {
    bgcore::StreamChannel::Callbacks callbacks;
    if (with_login) {
      callbacks.login_message = [] { return std::string("LOGIN"); };
    }
    callbacks.subscribe_message = [] { return std::string("SUB"); };
    callbacks.on_message = [this](const std::string& frame) {
      if (frame == "login-ok") {
        return bgcore::InboundKind::LoginAccepted;
      }
      if (frame == "login-bad") {
        return bgcore::InboundKind::LoginRejected;
      }
      std::lock_guard lock(mutex);
      data.push_back(frame);
      return bgcore::InboundKind::Data;
    };

    channel = std::make_unique<bgcore::StreamChannel>(
        "test", bgcore::StreamEndpoint{"localhost", "443", "/ws"}, backoff,
        heartbeat, clock, std::move(callbacks),
        [this](bgcore::Event event) {
          if (const auto* status = std::get_if<bgcore::StreamStatusEvent>(&event)) {
            std::lock_guard lock(mutex);
            statuses.push_back(*status);
          }
        },
        [this](const bgcore::StreamEndpoint&) -> std::unique_ptr<bgcore::IStreamConnection> {
          std::lock_guard lock(mutex);
          ++connect_attempts;
          if (fail_connects > 0) {
            --fail_connects;
            throw bgcore::TransientNetworkError("connection refused");
          }
          auto wire = std::make_shared<Wire>();
          wire->login_reply = login_reply;
          wires.push_back(wire);
          return std::make_unique<ScriptedConnection>(wire);
        });
    channel->start();
  }

  std::vector<bgcore::StreamStatusEvent> statusLog() {
    std::lock_guard lock(mutex);
    return statuses;
  }

  std::shared_ptr<Wire> wire(std::size_t index) {
    std::lock_guard lock(mutex);
    return index < wires.size() ? wires[index] : nullptr;
  }

  bool sawData(const std::string& frame) {
    std::lock_guard lock(mutex);
    return std::find(data.begin(), data.end(), frame) != data.end();
  }

  bgcore::SimulationTimeProvider clock;
  bgcore::BackoffConfig backoff;
  bgcore::HeartbeatConfig heartbeat;

  std::mutex mutex;
  std::vector<bgcore::StreamStatusEvent> statuses;
  std::vector<std::shared_ptr<Wire>> wires;
  std::vector<std::string> data;
  int connect_attempts{0};
  int fail_connects{0};
  std::string login_reply{"login-ok"};

  std::unique_ptr<bgcore::StreamChannel> channel;
};

// -----------------------------------------------------------------------------
// 1. No pong → Disconnected → backoff → a new connection logs in and
//    subscribes again → Connected.
// -----------------------------------------------------------------------------
TEST_F(StreamChannelTest, MissingPongReconnectsWithLoginAndSubscribe) {
  start(true);
  ASSERT_TRUE(eventually([&] { return statusLog().size() == 1; }));
  EXPECT_EQ(statusLog()[0].kind, Kind::Connected);
  EXPECT_EQ(statusLog()[0].channel, "test");
  EXPECT_TRUE(channel->connected());
  EXPECT_EQ(wire(0)->writes(), (std::vector<std::string>{"LOGIN", "SUB"}));

  clock.advance_by(1000);
  ASSERT_TRUE(eventually([&] { return wire(0)->wrote("ping"); }));

  clock.advance_by(501);
  ASSERT_TRUE(eventually([&] { return statusLog().size() == 3; }));

  const auto log = statusLog();
  EXPECT_EQ(log[1].kind, Kind::Disconnected);
  EXPECT_NE(log[1].reason.find("heartbeat gap"), std::string::npos);
  EXPECT_EQ(log[2].kind, Kind::Connected);

  ASSERT_NE(wire(1), nullptr);
  EXPECT_EQ(wire(1)->writes(), (std::vector<std::string>{"LOGIN", "SUB"}));
  EXPECT_TRUE(channel->connected());

  channel->stop();
  EXPECT_FALSE(channel->connected());
  EXPECT_EQ(statusLog().size(), 3u);
}

// -----------------------------------------------------------------------------
// 2. A pong answers the ping; the connection survives past the deadline and
//    the next ping follows one interval later.
// -----------------------------------------------------------------------------
TEST_F(StreamChannelTest, PongKeepsConnectionAlive) {
  start(false);
  ASSERT_TRUE(eventually([&] { return statusLog().size() == 1; }));
  EXPECT_EQ(wire(0)->writes(), (std::vector<std::string>{"SUB"}));

  clock.advance_by(1000);
  ASSERT_TRUE(eventually([&] { return wire(0)->wrote("ping"); }));

  // Frames are handled in order, so once "tick" is seen the pong was too.
  wire(0)->push("pong");
  wire(0)->push("tick");
  ASSERT_TRUE(eventually([&] { return sawData("tick"); }));
  EXPECT_FALSE(sawData("pong"));

  clock.advance_by(600);
  std::this_thread::sleep_for(150ms);
  EXPECT_EQ(statusLog().size(), 1u);

  clock.advance_by(400);
  ASSERT_TRUE(eventually([&] {
    const auto w = wire(0)->writes();
    return std::count(w.begin(), w.end(), "ping") == 2;
  }));
  EXPECT_EQ(statusLog().size(), 1u);
  EXPECT_EQ(wire(1), nullptr);
}

// -----------------------------------------------------------------------------
// 3. Connect failures before the first Connected only retry; there was no
//    connection to report as lost.
// -----------------------------------------------------------------------------
TEST_F(StreamChannelTest, FailedConnectRetriesWithoutDisconnected) {
  fail_connects = 2;
  start(false);
  ASSERT_TRUE(eventually([&] { return statusLog().size() == 1; }));

  EXPECT_EQ(statusLog()[0].kind, Kind::Connected);
  std::lock_guard lock(mutex);
  EXPECT_EQ(connect_attempts, 3);
  EXPECT_EQ(wires.size(), 1u);
}

// -----------------------------------------------------------------------------
// 4. A refused login is not retried.
// -----------------------------------------------------------------------------
TEST_F(StreamChannelTest, RejectedLoginStopsRetrying) {
  login_reply = "login-bad";
  start(true);
  ASSERT_TRUE(eventually([&] { return statusLog().size() == 1; }));

  EXPECT_EQ(statusLog()[0].kind, Kind::AuthFailed);
  std::this_thread::sleep_for(100ms);
  EXPECT_EQ(statusLog().size(), 1u);
  EXPECT_FALSE(channel->connected());
  std::lock_guard lock(mutex);
  EXPECT_EQ(connect_attempts, 1);
  EXPECT_FALSE(wires[0]->wrote("SUB"));
}
