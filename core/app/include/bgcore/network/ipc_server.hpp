#pragma once

#include "bgcore/concurrent/thread_safe_queue.hpp"
#include "bgcore/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace bgcore {

// -----------------------------------------------------------------------------
// IpcServer: operator channel over ZeroMQ
// -----------------------------------------------------------------------------
//
// @brief  One worker thread serving a REP socket for operator commands and a
//         PUB socket for JSON telemetry.
//
// @details
// REP (commands): each request is a plain command string ("PING",
// "STATUS", "HALT"). It is trimmed and upper-cased, passed to the
// CommandHandler, and the handler's JSON string is sent back. The socket
// has a receive timeout so the worker alternates between commands and
// telemetry.
//
// PUB (telemetry): events handed to pushTelemetry() are formatted as one
// JSON object each with a "type" field:
//   order_update     OrderUpdateEvent
//   position_update  PositionUpdateEvent (position and margin balance)
//   risk_reject      RiskRejectEvent
//   halt             RiskViolationEvent (the session is halted)
//   stream_status    StreamStatusEvent
// Other event types are not published.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any thread;
//   it never blocks: when the bounded queue is full the event is dropped and
//   counted. The CommandHandler runs on the IPC worker thread.
//
// Ownership:
//   Owns the ZMQ context, both sockets, the telemetry queue and the thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  static constexpr std::size_t kTelemetryQueueCapacity = 10000;

  IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
            std::string pub_endpoint);
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;

  // Binds both sockets and starts the worker. Throws zmq::error_t if an
  // endpoint cannot be bound. No-op when already running.
  void start();

  // Publishes what is still queued, then closes the sockets. Idempotent.
  void stop();

  bool running() const { return running_.load(); }

  void pushTelemetry(Event event);

  std::size_t droppedTelemetry() const { return dropped_.load(); }

  // JSON line for a telemetry event; nullopt for non-telemetry events.
  static std::optional<std::string> formatTelemetry(const Event& event);

  // Trims surrounding whitespace and upper-cases.
  static std::string normalizeCommand(const std::string& raw);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_{kTelemetryQueueCapacity};
  std::atomic<std::size_t> dropped_{0};
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace bgcore
