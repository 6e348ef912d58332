#pragma once

#include "tether/concurrent/shutdown_signal.hpp"
#include "tether/domain/gateway_limits.hpp"
#include "tether/events/link_events.hpp"
#include "tether/ratelimit/operation_class.hpp"
#include "tether/ratelimit/rate_limit_stats.hpp"
#include "tether/ratelimit/sliding_window_counter.hpp"
#include "tether/ratelimit/token_bucket.hpp"
#include "tether/time/i_time_provider.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>

namespace tether {

// -----------------------------------------------------------------------------
// RateLimiter — multi-dimensional outbound flow control
// -----------------------------------------------------------------------------
//
// @brief  Gates every outbound gateway call by OperationClass so the gateway
//         never receives more traffic than it tolerates. Close to a limit
//         the caller waits; only hard ceilings fail.
//
// @details
// State (all exclusively owned; nothing is exposed for mutation):
//   - general bucket:   rate max_requests_per_second, capacity burst_size
//   - order bucket:     rate max_orders_per_second, capacity 2× that
//   - historical window: max_historical_data_requests per
//                        historical_data_window
//   - subscription set:  symbols with live market-data lines
//   - backoff window:    opened by handleRateLimitError()
//   - statistics
//
// acquire() policy:
//
//   1. Backoff window active  → RateLimitError("backoff", remaining s).
//   2. Per class:
//        General        wait = general.acquire(weight)
//        Order          wait = max(general.acquire(weight), order.acquire(1))
//        HistoricalData window full → RateLimitError("historical_data", 60 s)
//                       else record, wait = general.acquire(weight)
//        MarketData     set full → MarketDataLimitError (retry-after 0)
//                       else wait = general.acquire(weight)
//   3. wait > 0 → sleep it (interruptible by close()).
//   4. Success resets the consecutive-error counter.
//
// The historical-data ceiling is inclusive: exactly
// max_historical_data_requests calls are admitted per window, the next one
// is rejected, and rejected calls are not recorded in the window.
//
// Thread model:
//   Every method is safe from any thread. Each piece of state has its own
//   lock (bucket mutexes, window mutex, subscriptions_mutex_, mutex_ for
//   backoff and statistics); no lock is held while sleeping. Token
//   consumption is not fair across callers.
//
// Ownership:
//   Owned by GatewayLink (or a test). Holds a reference to a monotonic
//   ITimeProvider that must outlive it.
// -----------------------------------------------------------------------------
class RateLimiter {
 public:
  using BackoffListener = std::function<void(const BackoffEvent&)>;

  RateLimiter(domain::RateLimitConfig config, const ITimeProvider& clock);

  RateLimiter(const RateLimiter&) = delete;
  RateLimiter& operator=(const RateLimiter&) = delete;
  RateLimiter(RateLimiter&&) = delete;
  RateLimiter& operator=(RateLimiter&&) = delete;

  // -------------------------------------------------------------------------
  // acquire(op, weight)
  // -------------------------------------------------------------------------
  // @brief  Returns once the call may proceed, sleeping if needed.
  //
  // @param  op      Quota dimension.
  // @param  weight  Tokens charged to the general bucket (order bucket is
  //                 always charged 1).
  //
  // @throws std::invalid_argument  weight < 1 (not counted in statistics).
  // @throws RateLimitError        backoff window or historical window full.
  // @throws MarketDataLimitError  subscription ceiling reached.
  // @throws OperationCancelledError  close() was called before or during
  //                                  the wait.
  // -------------------------------------------------------------------------
  void acquire(OperationClass op = OperationClass::General, int weight = 1);

  // @brief  Non-blocking variant. General bucket, plus the order bucket for
  //         orders. Never reserves; does not touch statistics.
  bool tryAcquire(OperationClass op = OperationClass::General);

  // -------------------------------------------------------------------------
  // handleRateLimitError(message)
  // -------------------------------------------------------------------------
  // @brief  Records a rate violation reported by the gateway itself and
  //         opens the backoff window.
  //
  // @details
  //   consecutive_errors += 1
  //   backoff = min(max_backoff, initial_backoff × multiplier^consecutive)
  //   backoff_until = now + backoff
  //
  // Notifies the backoff listener, if any.
  //
  // @return The backoff duration applied.
  // -------------------------------------------------------------------------
  std::chrono::milliseconds handleRateLimitError(const std::string& message);

  // Clears the backoff window and the consecutive-error counter.
  void resetBackoff();

  // -------------------------------------------------------------------------
  // Market-data subscription tracking
  // -------------------------------------------------------------------------
  // addSubscription throws MarketDataLimitError when the set is full, even
  // for a symbol already in it. Adding a present symbol below the ceiling
  // is a no-op, as is removing an absent one.
  // -------------------------------------------------------------------------
  void addSubscription(const std::string& symbol);
  void removeSubscription(const std::string& symbol);
  void clearSubscriptions();
  std::size_t activeSubscriptions() const;
  bool isSubscribed(const std::string& symbol) const;

  RateLimitStats stats() const;
  void resetStats();

  // -------------------------------------------------------------------------
  // close()
  // -------------------------------------------------------------------------
  // @brief  Wakes every caller sleeping in acquire() with
  //         OperationCancelledError; later acquire() calls fail the same
  //         way. Irreversible.
  // -------------------------------------------------------------------------
  void close();
  bool closed() const { return closed_.isRequested(); }

  // Single slot; last registration wins. Invoked on the thread that called
  // handleRateLimitError(). Exceptions are logged and swallowed.
  void setBackoffListener(BackoffListener listener);

  const domain::RateLimitConfig& config() const { return config_; }

 private:
  // Remaining backoff in ms, or std::nullopt if no window is active.
  std::optional<std::int64_t> backoffRemainingMs() const;

  // Charges the class-specific dimension and the buckets; returns the wait.
  Seconds reserve(OperationClass op, int weight);

  void recordRejected();
  void recordDelay(Seconds wait);
  void recordAccepted();

  const domain::RateLimitConfig config_;
  const ITimeProvider& clock_;

  TokenBucket general_bucket_;
  TokenBucket order_bucket_;
  SlidingWindowCounter historical_window_;

  mutable std::mutex subscriptions_mutex_;
  std::unordered_set<std::string> subscriptions_;

  // Guards everything below.
  mutable std::mutex mutex_;
  std::optional<std::int64_t> backoff_until_ms_;
  std::uint64_t consecutive_errors_{0};
  RateLimitStats counters_;
  std::int64_t period_start_ms_;
  BackoffListener backoff_listener_;

  ShutdownSignal closed_;
};

}  // namespace tether
