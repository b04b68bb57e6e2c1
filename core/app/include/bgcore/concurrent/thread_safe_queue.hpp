#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace bgcore {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: A FIFO queue that multiple threads can push to and pop from
// without data races. Optionally bounded: with a non-zero capacity, push()
// blocks while the queue is full so a fast producer (the exchange stream)
// cannot grow memory without limit when the consumer falls behind.
//
// Thread model: Not tied to any specific thread. Safe for multiple producers
// and multiple consumers. All methods are thread-safe.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  // capacity == 0 means unbounded.
  explicit ThreadSafeQueue(std::size_t capacity = 0) : capacity_(capacity) {}

  // Non-copyable, non-movable: owns a mutex and condition variables.
  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // What: Appends one item. On a bounded queue, waits until there is room.
  // Thread-safety: Safe from any thread. Notifies one waiting consumer after
  // the lock is released.
  // -------------------------------------------------------------------------
  void push(T value) {
    {
      std::unique_lock lock(mutex_);
      not_full_.wait(lock, [this] { return hasRoom(); });
      queue_.push_back(std::move(value));
    }
    not_empty_.notify_one();
  }

  // -------------------------------------------------------------------------
  // try_push(value)
  // -------------------------------------------------------------------------
  // What: Appends the item only if there is room right now.
  // Output: true if the item was queued, false if the queue was full.
  // -------------------------------------------------------------------------
  bool try_push(T value) {
    {
      std::lock_guard lock(mutex_);
      if (!hasRoom()) {
        return false;
      }
      queue_.push_back(std::move(value));
    }
    not_empty_.notify_one();
    return true;
  }

  // Blocking pop: waits until an item is available.
  T pop() {
    std::unique_lock lock(mutex_);
    not_empty_.wait(lock, [this] { return !queue_.empty(); });
    return takeFront(lock);
  }

  // -------------------------------------------------------------------------
  // pop_for(timeout)
  // -------------------------------------------------------------------------
  // What: Waits at most `timeout` for an item. Returns std::nullopt on
  // timeout. Lets loop threads stay responsive to their stop flag without
  // spinning.
  // -------------------------------------------------------------------------
  template <typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    if (!not_empty_.wait_for(lock, timeout,
                             [this] { return !queue_.empty(); })) {
      return std::nullopt;
    }
    return takeFront(lock);
  }

  // Non-blocking pop.
  std::optional<T> try_pop() {
    std::unique_lock lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    return takeFront(lock);
  }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

  std::size_t capacity() const { return capacity_; }

 private:
  bool hasRoom() const { return capacity_ == 0 || queue_.size() < capacity_; }

  // Caller holds `lock` and has checked the queue is non-empty. Releases the
  // lock before waking a blocked producer.
  T takeFront(std::unique_lock<std::mutex>& lock) {
    T value = std::move(queue_.front());
    queue_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return value;
  }

  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;  // Only waited on when bounded
  std::deque<T> queue_;
};

}  // namespace bgcore
