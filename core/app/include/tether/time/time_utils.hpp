#pragma once

#include <chrono>
#include <cstdint>

namespace tether {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Conversions between the int64_t milliseconds returned by
//         ITimeProvider and the std::chrono types used for waits.
//
// Thread-safety: stateless, safe to call from any thread.
// -----------------------------------------------------------------------------

// Seconds (double) as used in configuration and wait computations.
using Seconds = std::chrono::duration<double>;

// @brief  Converts a millisecond count to fractional seconds.
inline double ms_to_seconds(std::int64_t ms) {
  return static_cast<double>(ms) / 1000.0;
}

// -------------------------------------------------------------------------
// to_milliseconds
// -------------------------------------------------------------------------
// @brief  Rounds a fractional-second wait UP to whole milliseconds.
//
// @details
// Rounding up matters for token buckets: waiting 19 ms for a deficit that
// needs 19.6 ms would leave the bucket still negative when the caller
// proceeds.
// -------------------------------------------------------------------------
inline std::chrono::milliseconds to_milliseconds(Seconds s) {
  return std::chrono::ceil<std::chrono::milliseconds>(s);
}

}  // namespace tether
