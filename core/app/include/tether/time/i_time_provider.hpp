#pragma once

#include <cstdint>

namespace tether {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that hides where "now" comes from.
//
// @details
// Token buckets, sliding windows, backoff windows and health timestamps all
// need a clock. If they called std::chrono directly, every test of a
// one-second refill or a ten-minute window would have to sleep for real.
// Components receive `const ITimeProvider&` instead, and the owner decides
// which implementation to inject:
//   - LiveTimeProvider       → wall clock (reported timestamps).
//   - SteadyTimeProvider     → monotonic clock (rate-limit arithmetic).
//   - SimulationTimeProvider → manually advanced clock (tests).
//
// Values are int64_t milliseconds. Wall-clock providers count from the Unix
// epoch; the steady provider counts from an unspecified origin, so its
// values are only meaningful as differences.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads.
//
// Ownership:
//   Components hold a const reference; they do NOT own the provider. The
//   provider's lifetime must exceed that of all components that reference it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time in milliseconds.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace tether
