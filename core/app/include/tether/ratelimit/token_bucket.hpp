#pragma once

#include "tether/time/i_time_provider.hpp"
#include "tether/time/time_utils.hpp"

#include <cstdint>
#include <mutex>

namespace tether {

// -----------------------------------------------------------------------------
// TokenBucket
// -----------------------------------------------------------------------------
//
// @brief  Classic token bucket: refills at `rate` tokens per second up to
//         `capacity`, and is drained by requests.
//
// @details
// Refill is lazy. There is no timer; every access first computes
//   tokens = min(capacity, tokens + elapsed_seconds × rate)
// from the time since the previous access.
//
// acquire(n) never refuses. If fewer than n tokens are available it returns
// the time the caller must wait, (n − tokens) / rate, and commits the
// deficit immediately: tokens goes negative. The negative balance is a
// reservation. A second caller arriving before the refill sees the deeper
// deficit and is told to wait longer, so waiting callers never oversubscribe
// the rate. tryAcquire(n) only takes tokens that are already there.
//
// The bucket starts full.
//
// Thread model:
//   Every method locks the bucket's own mutex. No ordering or fairness
//   between concurrent callers.
// -----------------------------------------------------------------------------
class TokenBucket {
 public:
  // @param  rate      Tokens added per second. Must be > 0.
  // @param  capacity  Maximum balance (burst size).
  // @param  clock     Monotonic clock; must outlive the bucket.
  TokenBucket(double rate, double capacity, const ITimeProvider& clock);

  TokenBucket(const TokenBucket&) = delete;
  TokenBucket& operator=(const TokenBucket&) = delete;

  // @return Zero if granted outright, otherwise the wait the caller must
  //         honor before proceeding. The tokens are taken either way.
  Seconds acquire(double tokens = 1.0);

  // @return true and takes the tokens only if enough are available now.
  bool tryAcquire(double tokens = 1.0);

  // Current balance after a refill. Negative while reservations are pending.
  double available();

  double rate() const { return rate_; }
  double capacity() const { return capacity_; }

 private:
  // Caller holds mutex_.
  void refill();

  const double rate_;
  const double capacity_;
  const ITimeProvider& clock_;

  std::mutex mutex_;
  double tokens_;
  std::int64_t last_refill_ms_;
};

}  // namespace tether
