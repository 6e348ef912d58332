#include "tether/ratelimit/sliding_window_counter.hpp"

namespace tether {

SlidingWindowCounter::SlidingWindowCounter(std::chrono::milliseconds window,
                                           const ITimeProvider& clock)
    : window_(window), clock_(clock) {}

void SlidingWindowCounter::evict(std::int64_t now) {
  const std::int64_t cutoff = now - window_.count();
  while (!timestamps_.empty() && timestamps_.front() < cutoff) {
    timestamps_.pop_front();
  }
}

std::size_t SlidingWindowCounter::addRequest() {
  std::lock_guard lock(mutex_);
  const std::int64_t now = clock_.now_ms();
  evict(now);
  timestamps_.push_back(now);
  return timestamps_.size();
}

std::size_t SlidingWindowCounter::getCount() {
  std::lock_guard lock(mutex_);
  evict(clock_.now_ms());
  return timestamps_.size();
}

bool SlidingWindowCounter::addRequestIfBelow(std::size_t limit) {
  std::lock_guard lock(mutex_);
  const std::int64_t now = clock_.now_ms();
  evict(now);
  if (timestamps_.size() >= limit) {
    return false;
  }
  timestamps_.push_back(now);
  return true;
}

}  // namespace tether
