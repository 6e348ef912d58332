#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace tether {

// -----------------------------------------------------------------------------
// ShutdownSignal
// -----------------------------------------------------------------------------
// Responsibility: A one-shot "stop now" flag that sleeping threads can wait
// on. Every suspension point in this library (interval between heartbeats,
// backoff between reconnect attempts, token-bucket deficit waits) sleeps
// through waitFor() instead of std::this_thread::sleep_for(), so a single
// request() wakes all of them at once.
//
// Thread model: request(), isRequested() and waitFor() are safe to call from
// any thread. Once requested, the signal stays requested (no reset). Owners
// that need to run again create a new owner object.
// -----------------------------------------------------------------------------
class ShutdownSignal {
 public:
  ShutdownSignal() = default;

  ShutdownSignal(const ShutdownSignal&) = delete;
  ShutdownSignal& operator=(const ShutdownSignal&) = delete;
  ShutdownSignal(ShutdownSignal&&) = delete;
  ShutdownSignal& operator=(ShutdownSignal&&) = delete;

  // -------------------------------------------------------------------------
  // request()
  // -------------------------------------------------------------------------
  // What: Sets the flag and wakes every thread blocked in waitFor().
  // Thread-safety: Safe from any thread. Idempotent.
  // -------------------------------------------------------------------------
  void request() {
    {
      // The store happens under the mutex so a waiter cannot check the
      // predicate, see false, and then miss the notify.
      std::lock_guard lock(mutex_);
      requested_.store(true);
    }
    cv_.notify_all();
  }

  bool isRequested() const { return requested_.load(); }

  // -------------------------------------------------------------------------
  // waitFor(duration)
  // -------------------------------------------------------------------------
  // What: Sleeps for `duration` unless the signal is (or becomes) requested.
  // Output: true if the full duration elapsed, false if interrupted by
  // request(). A zero or negative duration returns immediately with
  // !isRequested().
  // -------------------------------------------------------------------------
  template <typename Rep, typename Period>
  bool waitFor(std::chrono::duration<Rep, Period> duration) const {
    std::unique_lock lock(mutex_);
    return !cv_.wait_for(lock, duration,
                         [this] { return requested_.load(); });
  }

 private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::atomic<bool> requested_{false};
};

}  // namespace tether
