#pragma once

#include "tether/time/i_time_provider.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

namespace tether {

// -----------------------------------------------------------------------------
// SlidingWindowCounter
// -----------------------------------------------------------------------------
// Counts events within the trailing `window`. Timestamps older than
// now − window are evicted on every access, before anything is counted, so
// a reported count never includes stale entries.
//
// Thread model: all methods lock the counter's own mutex.
// -----------------------------------------------------------------------------
class SlidingWindowCounter {
 public:
  SlidingWindowCounter(std::chrono::milliseconds window,
                       const ITimeProvider& clock);

  SlidingWindowCounter(const SlidingWindowCounter&) = delete;
  SlidingWindowCounter& operator=(const SlidingWindowCounter&) = delete;

  // Evicts, records "now", returns the count including it.
  std::size_t addRequest();

  // Evicts, returns the count.
  std::size_t getCount();

  // -------------------------------------------------------------------------
  // addRequestIfBelow(limit)
  // -------------------------------------------------------------------------
  // Evicts, then records "now" only if fewer than `limit` entries remain.
  // Check and insert happen under one lock, so concurrent callers cannot
  // both slip under the ceiling.
  // Output: true if recorded.
  // -------------------------------------------------------------------------
  bool addRequestIfBelow(std::size_t limit);

  std::chrono::milliseconds window() const { return window_; }

 private:
  // Caller holds mutex_.
  void evict(std::int64_t now);

  const std::chrono::milliseconds window_;
  const ITimeProvider& clock_;

  std::mutex mutex_;
  std::deque<std::int64_t> timestamps_;
};

}  // namespace tether
