#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace optrisk {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: FIFO hand-off between threads. Used for the notification
// loop (sweep/IPC threads push exit events, the loop thread pops them) and
// for the IPC telemetry buffer.
//
// Capacity: unbounded by default. A queue constructed with a capacity makes
// try_push() refuse new items once full, so a stalled consumer cannot grow
// memory without bound; push() always enqueues.
//
// Thread model: any number of producers and consumers. All methods are
// thread-safe; pop() blocks the caller until an item is available.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  // capacity == 0 means unbounded.
  explicit ThreadSafeQueue(std::size_t capacity) : capacity_(capacity) {}

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // Appends one item and wakes one blocked pop(). Ignores the capacity.
  // -------------------------------------------------------------------------
  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    // Notify outside the lock so the woken consumer does not immediately
    // block on the mutex we still hold.
    condition_.notify_one();
  }

  // -------------------------------------------------------------------------
  // try_push(value)
  // -------------------------------------------------------------------------
  // Appends one item unless the queue is bounded and full.
  // Output: false if the item was refused (value is dropped).
  // -------------------------------------------------------------------------
  bool try_push(T value) {
    {
      std::lock_guard lock(mutex_);
      if (capacity_ != 0 && queue_.size() >= capacity_) {
        return false;
      }
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
    return true;
  }

  // -------------------------------------------------------------------------
  // pop(): blocking
  // -------------------------------------------------------------------------
  // Removes and returns the front item, waiting until one is available.
  // The predicate form of wait() re-checks after spurious wakeups.
  // -------------------------------------------------------------------------
  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // try_pop(): non-blocking
  // -------------------------------------------------------------------------
  // Output: the front item, or std::nullopt if the queue was empty.
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

  // Snapshot only; another thread may change the queue right after.
  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable condition_;  // Signalled on every successful push
  std::deque<T> queue_;
  const std::size_t capacity_{0};
};

}  // namespace optrisk
