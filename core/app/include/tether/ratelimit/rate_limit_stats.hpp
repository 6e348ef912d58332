#pragma once

#include <cstddef>
#include <cstdint>

namespace tether {

// -----------------------------------------------------------------------------
// RateLimitStats — read-only snapshot returned by RateLimiter::stats()
// -----------------------------------------------------------------------------
//
// @details
// Counters cover the period since construction or the last resetStats():
//   total     every acquire() call
//   accepted  calls that returned (possibly after a wait)
//   rejected  calls that threw (backoff, ceilings, cancellation)
//   delayed   accepted or cancelled calls that had a nonzero wait
//
// Derived fields:
//   average_delay_ms = total_delay_ms / max(delayed, 1)
//   acceptance_rate  = accepted / max(total, 1)
// -----------------------------------------------------------------------------
struct RateLimitStats {
  std::uint64_t total_requests{0};
  std::uint64_t accepted_requests{0};
  std::uint64_t rejected_requests{0};
  std::uint64_t delayed_requests{0};
  double total_delay_ms{0.0};
  double average_delay_ms{0.0};
  double acceptance_rate{0.0};
  double period_seconds{0.0};

  std::size_t active_subscriptions{0};
  bool in_backoff{false};
  std::uint64_t consecutive_errors{0};
};

}  // namespace tether
