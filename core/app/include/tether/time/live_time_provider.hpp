#pragma once

#include "tether/time/i_time_provider.hpp"

namespace tether {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock time implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns real wall-clock time via std::chrono::system_clock.
//
// @details
// Used for everything that is reported to a human or another process:
// connection-established time, last heartbeat, the start of a statistics
// period. It is NOT used for rate-limit arithmetic, because wall time can
// jump (NTP adjustments) and a backwards jump would make a token bucket
// refuse to refill. Use SteadyTimeProvider there.
//
// Thread model:
//   std::chrono::system_clock::now() is safe to call from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  // @brief  Milliseconds since 1970-01-01 00:00:00 UTC.
  std::int64_t now_ms() const override;
};

// -----------------------------------------------------------------------------
// SteadyTimeProvider — monotonic time implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns std::chrono::steady_clock time in milliseconds.
//
// @details
// The origin is unspecified (typically boot time). Values never decrease,
// which is the property TokenBucket and SlidingWindowCounter rely on when
// they compute elapsed time between two accesses.
// -----------------------------------------------------------------------------
class SteadyTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace tether
