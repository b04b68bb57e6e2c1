#pragma once

#include "bgcore/exchange/backoff.hpp"
#include "bgcore/exchange/heartbeat_monitor.hpp"
#include "bgcore/exchange/i_exchange_transport.hpp"
#include "bgcore/exchange/stream_connection.hpp"
#include "bgcore/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace bgcore {

// What the owner made of one inbound text frame.
enum class InboundKind {
  Data,
  LoginAccepted,
  LoginRejected,
  Other,
};

// -----------------------------------------------------------------------------
// StreamChannel: one self-healing websocket connection
// -----------------------------------------------------------------------------
//
// @brief  Keeps a websocket open on its own thread: connect, optional
//         login, subscribe, read; on any failure wait an exponential backoff
//         and start again with the same login and subscriptions.
//
// @details
// The channel is protocol-light. The owner supplies:
//   - login_message:     builds a fresh login frame (empty function = public).
//   - subscribe_message: the subscription frame sent after every (re)connect.
//   - on_message:        handles each text frame and classifies it.
//
// Liveness: a text "ping" is sent every ping_interval_ms; if no "pong"
// arrives within pong_timeout_ms of a ping, the connection is considered
// dead (heartbeat gap) and is torn down for a reconnect. Heartbeat and login
// deadlines are measured on the supplied clock.
//
// Connections come from the ConnectionFactory; the default is connectTls().
//
// Status: every successful subscribe emits StreamStatusEvent::Connected and
// every teardown emits Disconnected through the sink. A rejected login emits
// AuthFailed and the channel stops retrying.
//
// Thread model:
//   start()/stop()/send() are thread-safe. on_message and the sink are called
//   on the channel thread; the sink may block (backpressure).
// -----------------------------------------------------------------------------
class StreamChannel {
 public:
  struct Callbacks {
    std::function<std::string()> login_message;
    std::function<std::string()> subscribe_message;
    std::function<InboundKind(const std::string&)> on_message;
  };

  StreamChannel(std::string name, StreamEndpoint endpoint,
                const BackoffConfig& backoff, const HeartbeatConfig& heartbeat,
                const ITimeProvider& clock, Callbacks callbacks,
                EventSink status_sink, ConnectionFactory connect = connectTls);
  ~StreamChannel();

  StreamChannel(const StreamChannel&) = delete;
  StreamChannel& operator=(const StreamChannel&) = delete;

  void start();
  void stop();

  // Queues a text frame for the live connection. Dropped if disconnected;
  // the next connect re-sends subscribe_message anyway.
  void send(std::string text);

  bool connected() const { return connected_.load(); }
  const std::string& name() const { return name_; }

 private:
  void run();
  void session(IStreamConnection& connection);
  void emitStatus(StreamStatusEvent::Kind kind, const std::string& reason);
  void waitBeforeReconnect(std::chrono::milliseconds delay);

  const std::string name_;
  const StreamEndpoint endpoint_;
  const ITimeProvider& clock_;
  Callbacks callbacks_;
  EventSink status_sink_;
  ConnectionFactory connect_;
  ExponentialBackoff backoff_;
  HeartbeatMonitor heartbeat_;

  std::atomic<bool> running_{false};
  std::atomic<bool> connected_{false};
  std::thread thread_;

  std::mutex mutex_;  // Guards outbox_ and the reconnect wait
  std::condition_variable wake_;
  std::deque<std::string> outbox_;
};

}  // namespace bgcore
