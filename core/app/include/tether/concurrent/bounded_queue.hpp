#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace tether {

// -----------------------------------------------------------------------------
// BoundedQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: A FIFO with a fixed capacity shared between a producer
// thread and a consumer thread. When full, push() evicts the OLDEST entry
// to make room for the new one and reports that it did so.
//
// Why in architecture: Telemetry (connection-state changes, backoff events)
// is produced from monitor and caller threads and drained by the
// StatusServer thread. If nobody is draining, the producer must never block
// and memory must stay bounded; the newest state is the most useful, so the
// oldest is dropped.
//
// Thread model: All methods are thread-safe. There is no blocking pop; the
// consumer polls with try_pop() inside its own loop.
// -----------------------------------------------------------------------------
template <typename T>
class BoundedQueue {
 public:
  explicit BoundedQueue(std::size_t capacity) : capacity_(capacity) {}

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;
  BoundedQueue(BoundedQueue&&) = delete;
  BoundedQueue& operator=(BoundedQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // What: Appends value. With capacity 0 the value is discarded.
  // Output: true if an older entry (or the value itself, capacity 0) was
  // dropped to honor the capacity.
  // -------------------------------------------------------------------------
  bool push(T value) {
    std::lock_guard lock(mutex_);
    if (capacity_ == 0) {
      ++dropped_;
      return true;
    }
    bool dropped = false;
    if (queue_.size() >= capacity_) {
      queue_.pop_front();
      ++dropped_;
      dropped = true;
    }
    queue_.push_back(std::move(value));
    return dropped;
  }

  // -------------------------------------------------------------------------
  // try_pop()
  // -------------------------------------------------------------------------
  // What: Removes and returns the front entry, or std::nullopt if empty.
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

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  // Total number of entries evicted since construction.
  std::size_t dropped() const {
    std::lock_guard lock(mutex_);
    return dropped_;
  }

  std::size_t capacity() const { return capacity_; }

 private:
  mutable std::mutex mutex_;
  const std::size_t capacity_;
  std::size_t dropped_{0};
  std::deque<T> queue_;
};

}  // namespace tether
