#pragma once

#include "tether/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace tether {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — manually driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider implementation whose "current time" is set
//         explicitly instead of read from a system clock.
//
// @details
// The rate-limit primitives are pure functions of elapsed time. With this
// provider a test can say "one second passes" with advance_by(1000) and
// then check that a token bucket refilled, without sleeping. The same holds
// for the ten-minute historical-data window and the gateway backoff window.
//
// Internal storage:
//   std::atomic<int64_t> current_time_ms_: a test thread may advance the
//   clock while a component under test reads it from another thread.
//
// Ownership:
//   Owned by the test (or replay harness). Passed by reference to the
//   components under test.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  // @brief  Starts the clock at start_ms (0 by default).
  explicit SimulationTimeProvider(std::int64_t start_ms = 0)
      : current_time_ms_(start_ms) {}

  // @brief  Returns the last value set by advance_time()/advance_by().
  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to an absolute value.
  //
  // @details
  // Monotonicity is not enforced; tests occasionally need to place the clock
  // at an arbitrary point.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // @brief  Moves the clock forward by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_;
};

}  // namespace tether
