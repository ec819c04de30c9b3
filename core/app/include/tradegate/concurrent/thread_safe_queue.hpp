#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace tradegate {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: Unbounded FIFO shared between any number of producers and
// consumers. Blocking pop() waits for an item; try_pop() returns immediately.
//
// Why in architecture: The TradeProcessor's request queue. Signal sources,
// the operator surface and the FillWatcher all push TradeRequest values from
// their own threads; the processor's single consumer thread drains it. The
// TelemetryServer uses a second instance to hand JSON lines to its socket
// thread. Each queue is an object owned by the component that drains it.
//
// Thread model: Every method locks mutex_. Safe for concurrent use from any
// thread.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  // Non-copyable and non-movable: the mutex and condition variable pin the
  // object in place. Share it by reference.
  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // @brief  Appends value at the back and wakes one blocked pop().
  //
  // @param  value  Taken by value so callers can std::move into the queue.
  //
  // Thread-safety: Safe from any thread. The notify happens after the lock
  //                is released so the woken consumer does not block on it.
  // -------------------------------------------------------------------------
  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
  }

  // -------------------------------------------------------------------------
  // pop() — blocking
  // -------------------------------------------------------------------------
  // @brief  Removes and returns the front item, waiting until one exists.
  //
  // @details
  // The predicate form of wait() re-checks emptiness after every wakeup, so
  // spurious wakeups are harmless.
  // -------------------------------------------------------------------------
  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // try_pop() — non-blocking
  // -------------------------------------------------------------------------
  // @brief  Removes the front item if there is one.
  //
  // @return The front item, or std::nullopt when the queue was empty.
  //
  // @details
  // Consumer loops that must also watch a stop flag use this instead of
  // pop(), pairing it with a short timed wait of their own.
  // -------------------------------------------------------------------------
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Snapshot only: another thread may change the answer immediately.
  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  // Current depth. Reported as the queue-depth gauge by the processor.
  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  mutable std::mutex mutex_;           // Guards queue_
  std::condition_variable condition_;  // Signalled on every push
  std::deque<T> queue_;
};

}  // namespace tradegate
