#include "tether/ratelimit/token_bucket.hpp"

#include <algorithm>

namespace tether {

TokenBucket::TokenBucket(double rate, double capacity,
                         const ITimeProvider& clock)
    : rate_(rate),
      capacity_(capacity),
      clock_(clock),
      tokens_(capacity),
      last_refill_ms_(clock.now_ms()) {}

void TokenBucket::refill() {
  const std::int64_t now = clock_.now_ms();
  const std::int64_t elapsed = now - last_refill_ms_;
  if (elapsed <= 0) {
    return;
  }
  tokens_ = std::min(capacity_, tokens_ + ms_to_seconds(elapsed) * rate_);
  last_refill_ms_ = now;
}

// -----------------------------------------------------------------------------
// acquire(): grant now, or reserve and report the wait
// -----------------------------------------------------------------------------
Seconds TokenBucket::acquire(double tokens) {
  std::lock_guard lock(mutex_);
  refill();

  if (tokens_ >= tokens) {
    tokens_ -= tokens;
    return Seconds{0.0};
  }

  const double deficit = tokens - tokens_;
  tokens_ -= tokens;
  return Seconds{deficit / rate_};
}

bool TokenBucket::tryAcquire(double tokens) {
  std::lock_guard lock(mutex_);
  refill();

  if (tokens_ < tokens) {
    return false;
  }
  tokens_ -= tokens;
  return true;
}

double TokenBucket::available() {
  std::lock_guard lock(mutex_);
  refill();
  return tokens_;
}

}  // namespace tether
