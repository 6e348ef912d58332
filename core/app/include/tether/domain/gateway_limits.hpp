#pragma once

#include <chrono>
#include <cstddef>

namespace tether {
namespace domain {

// -----------------------------------------------------------------------------
// MonitorConfig — knobs of the ConnectionMonitor
// -----------------------------------------------------------------------------
//
// @brief  Plain data copied into the monitor at construction. Loaded from the
//         settings file by loadSettings(); the defaults here are the
//         documented ones.
//
// @details
// Reconnect backoff: attempt k (counted from 1) sleeps
//   reconnect_base_delay × 2^(k-1)
// before calling the factory. Liveness fails when no heartbeat was seen for
// 3 × heartbeat_interval.
// -----------------------------------------------------------------------------
struct MonitorConfig {
  /// Period of both the heartbeat probe and the liveness check.
  std::chrono::milliseconds heartbeat_interval{10'000};

  /// Attempts per reconnection sequence before giving up (state → error).
  int max_reconnect_attempts{5};

  /// Base of the exponential backoff between reconnect attempts.
  std::chrono::milliseconds reconnect_base_delay{5'000};

  /// When false, start() connects but launches no background checks.
  bool enable_background_checks{true};
};

// -----------------------------------------------------------------------------
// RetryPolicy — knobs of withConnectionRetry()
// -----------------------------------------------------------------------------
// Retry k (counted from 0) waits base_delay × 2^k before the next attempt.
// -----------------------------------------------------------------------------
struct RetryPolicy {
  int max_attempts{3};
  std::chrono::milliseconds base_delay{1'000};
};

// -----------------------------------------------------------------------------
// RateLimitConfig — outbound-call quotas
// -----------------------------------------------------------------------------
//
// @brief  Conservative defaults for a desktop trading gateway that tolerates
//         about 50 messages per second.
//
// @details
// Derived limits:
//   - general bucket:  rate = max_requests_per_second, capacity = burst_size
//   - order bucket:    rate = max_orders_per_second,
//                      capacity = 2 × max_orders_per_second
//   - backoff after the n-th consecutive gateway rate error:
//                      min(max_backoff, initial_backoff × multiplier^n)
// -----------------------------------------------------------------------------
struct RateLimitConfig {
  double max_requests_per_second{50.0};
  std::size_t max_market_data_lines{100};
  double max_orders_per_second{5.0};

  /// Historical-data requests allowed per historical_data_window.
  std::size_t max_historical_data_requests{60};
  std::chrono::milliseconds historical_data_window{600'000};

  /// Capacity of the general bucket (short bursts above the steady rate).
  double burst_size{10.0};

  std::chrono::milliseconds initial_backoff{100};
  std::chrono::milliseconds max_backoff{30'000};
  double backoff_multiplier{2.0};

  /// Suggested retry-after carried by a historical-window rejection.
  std::chrono::milliseconds historical_retry_after{60'000};
};

}  // namespace domain
}  // namespace tether
