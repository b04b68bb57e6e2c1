#include "bgcore/concurrent/event_loop_thread.hpp"

#include <chrono>

namespace bgcore {

namespace {

// How long the worker blocks on an empty queue before re-checking running_.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::EventLoopThread(std::string name, std::size_t capacity)
    : name_(std::move(name)), queue_(capacity) {}

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  thread_.join();
}

void EventLoopThread::push(Event event) {
  enqueued_.fetch_add(1);
  queue_.push(std::move(event));
}

bool EventLoopThread::tryPush(Event event) {
  enqueued_.fetch_add(1);
  if (!queue_.try_push(std::move(event))) {
    enqueued_.fetch_sub(1);
    return false;
  }
  return true;
}

bool EventLoopThread::drain(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (completed_.load() >= enqueued_.load()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return completed_.load() >= enqueued_.load();
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
// completed_ is bumped only after publish() returns, so drain() never
// reports idle while an event is between pop and delivery.
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    std::optional<Event> event = queue_.pop_for(kIdleWaitTimeout);
    if (event) {
      bus_.publish(*event);
      completed_.fetch_add(1);
    }
  }
}

}  // namespace bgcore
