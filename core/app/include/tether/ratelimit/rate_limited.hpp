#pragma once

#include "tether/ratelimit/operation_class.hpp"
#include "tether/ratelimit/rate_limiter.hpp"

#include <exception>
#include <string_view>
#include <utility>

namespace tether {

// @brief  true if an error text looks like a gateway-side rate violation:
//         contains both "rate" and "limit", case-insensitive.
bool isRateLimitMessage(std::string_view text);

// -----------------------------------------------------------------------------
// rateLimited(limiter, op, fn, weight)
// -----------------------------------------------------------------------------
//
// @brief  Guarded call: charges `op` on the limiter, then runs fn().
//
// @details
// If fn() throws and the message reads like a gateway rate violation, the
// limiter's backoff window is opened before the exception is rethrown
// unchanged. Rejections from acquire() itself propagate without running fn.
//
// Usage:
//   auto bars = rateLimited(limiter, OperationClass::HistoricalData,
//                           [&] { return session.requestBars(request); });
// -----------------------------------------------------------------------------
template <typename Fn>
decltype(auto) rateLimited(RateLimiter& limiter, OperationClass op, Fn&& fn,
                           int weight = 1) {
  limiter.acquire(op, weight);
  try {
    return std::forward<Fn>(fn)();
  } catch (const std::exception& e) {
    if (isRateLimitMessage(e.what())) {
      limiter.handleRateLimitError(e.what());
    }
    throw;
  }
}

}  // namespace tether
