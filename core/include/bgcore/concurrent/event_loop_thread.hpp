#pragma once

#include "bgcore/concurrent/thread_safe_queue.hpp"
#include "bgcore/eventbus/event_bus.hpp"
#include "bgcore/events/event.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <thread>

namespace bgcore {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: Owns a single worker thread that drains a
// ThreadSafeQueue<Event> and publishes each event to an EventBus on that
// thread. Other threads push events via push(); subscribers to the bus run
// only on this thread, so handling is serialized.
//
// The engine runs two of these: the stream loop (cache + ledger are mutated
// only there) and the decision loop (strategy, risk and submission).
//
// Thread model: start()/stop() may be called from any thread. push() is
// thread-safe and blocks while a bounded queue is full. All EventBus
// subscriber callbacks run on the loop thread.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  // capacity == 0 means an unbounded queue.
  explicit EventLoopThread(std::string name = "loop", std::size_t capacity = 0);

  // Stops and joins the worker so members are never destroyed under it.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Idempotent.
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // Signals the worker to exit and joins it. Events still queued are left in
  // the queue; call drain() first when they must be processed. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  void push(Event event);

  // Non-blocking variant for producers that prefer dropping to waiting.
  bool tryPush(Event event);

  // -------------------------------------------------------------------------
  // drain(timeout)
  // -------------------------------------------------------------------------
  // Waits until the queue is empty and the worker is idle, or until the
  // timeout expires. Must not be called from the loop thread itself.
  // Output: true if the loop went idle within the timeout.
  // -------------------------------------------------------------------------
  bool drain(std::chrono::milliseconds timeout);

  std::size_t pending() const { return queue_.size(); }
  bool running() const { return running_.load(); }
  const std::string& name() const { return name_; }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

 private:
  void run();

  std::string name_;
  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> enqueued_{0};
  std::atomic<std::uint64_t> completed_{0};  // Published (or failed) events
  std::thread thread_;
};

}  // namespace bgcore
