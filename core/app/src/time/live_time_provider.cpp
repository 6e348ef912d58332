#include "tether/time/live_time_provider.hpp"

#include <chrono>

namespace tether {

// -----------------------------------------------------------------------------
// LiveTimeProvider::now_ms(): delegate to system_clock, epoch milliseconds
// -----------------------------------------------------------------------------
std::int64_t LiveTimeProvider::now_ms() const {
  auto duration = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::milliseconds>(duration)
      .count();
}

// -----------------------------------------------------------------------------
// SteadyTimeProvider::now_ms(): delegate to steady_clock
// -----------------------------------------------------------------------------
std::int64_t SteadyTimeProvider::now_ms() const {
  auto duration = std::chrono::steady_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::milliseconds>(duration)
      .count();
}

}  // namespace tether
