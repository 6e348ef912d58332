#include "tether/ratelimit/rate_limiter.hpp"
#include "tether/errors/gateway_error.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace tether {

// -----------------------------------------------------------------------------
// Constructor: derive the buckets and the window from the config
// -----------------------------------------------------------------------------
RateLimiter::RateLimiter(domain::RateLimitConfig config,
                         const ITimeProvider& clock)
    : config_(std::move(config)),
      clock_(clock),
      general_bucket_(config_.max_requests_per_second, config_.burst_size,
                      clock),
      order_bucket_(config_.max_orders_per_second,
                    config_.max_orders_per_second * 2.0, clock),
      historical_window_(config_.historical_data_window, clock),
      period_start_ms_(clock.now_ms()) {}

// -----------------------------------------------------------------------------
// acquire(): backoff gate, per-class charge, interruptible wait
// -----------------------------------------------------------------------------
void RateLimiter::acquire(OperationClass op, int weight) {
  // A non-positive charge would credit the bucket past its capacity.
  if (weight < 1) {
    throw std::invalid_argument(
        "RateLimiter::acquire: weight must be >= 1, got " +
        std::to_string(weight));
  }

  {
    std::lock_guard lock(mutex_);
    ++counters_.total_requests;
  }

  if (closed_.isRequested()) {
    recordRejected();
    throw OperationCancelledError("rate limiter is closed");
  }

  if (auto remaining = backoffRemainingMs()) {
    recordRejected();
    throw RateLimitError("backoff", ms_to_seconds(*remaining));
  }

  Seconds wait{0.0};
  try {
    wait = reserve(op, weight);
  } catch (const RateLimitError&) {
    recordRejected();
    throw;
  }

  if (wait.count() > 0.0) {
    recordDelay(wait);
    if (!closed_.waitFor(to_milliseconds(wait))) {
      recordRejected();
      throw OperationCancelledError(std::string("rate limit wait (") +
                                    toString(op) + ")");
    }
  }

  recordAccepted();
}

Seconds RateLimiter::reserve(OperationClass op, int weight) {
  const double tokens = static_cast<double>(weight);

  switch (op) {
    case OperationClass::General:
      return general_bucket_.acquire(tokens);

    case OperationClass::Order: {
      // Both reservations are committed; the caller waits for the slower.
      const Seconds general_wait = general_bucket_.acquire(tokens);
      const Seconds order_wait = order_bucket_.acquire(1.0);
      return std::max(general_wait, order_wait);
    }

    case OperationClass::HistoricalData:
      if (!historical_window_.addRequestIfBelow(
              config_.max_historical_data_requests)) {
        std::cerr << "[RateLimiter] historical data limit reached ("
                  << config_.max_historical_data_requests << " per "
                  << config_.historical_data_window.count() << " ms)\n";
        throw RateLimitError(
            "historical_data",
            std::chrono::duration<double>(config_.historical_retry_after)
                .count());
      }
      return general_bucket_.acquire(tokens);

    case OperationClass::MarketData: {
      const std::size_t active = activeSubscriptions();
      if (active >= config_.max_market_data_lines) {
        throw MarketDataLimitError(active, config_.max_market_data_lines);
      }
      return general_bucket_.acquire(tokens);
    }
  }

  return general_bucket_.acquire(tokens);
}

bool RateLimiter::tryAcquire(OperationClass op) {
  if (op == OperationClass::Order) {
    return general_bucket_.tryAcquire() && order_bucket_.tryAcquire();
  }
  return general_bucket_.tryAcquire();
}

// -----------------------------------------------------------------------------
// Backoff
// -----------------------------------------------------------------------------
std::chrono::milliseconds RateLimiter::handleRateLimitError(
    const std::string& message) {
  BackoffEvent event;
  BackoffListener listener;
  {
    std::lock_guard lock(mutex_);
    ++consecutive_errors_;

    const double scaled =
        static_cast<double>(config_.initial_backoff.count()) *
        std::pow(config_.backoff_multiplier,
                 static_cast<double>(consecutive_errors_));
    const auto cap = static_cast<double>(config_.max_backoff.count());
    const auto backoff_ms = static_cast<std::int64_t>(std::min(cap, scaled));

    backoff_until_ms_ = clock_.now_ms() + backoff_ms;

    event.backoff_ms = backoff_ms;
    event.consecutive_errors = consecutive_errors_;
    event.message = message;
    listener = backoff_listener_;
  }

  std::cerr << "[RateLimiter] gateway rate limit error (" << message
            << "), backing off for " << event.backoff_ms << " ms\n";

  if (listener) {
    try {
      listener(event);
    } catch (const std::exception& e) {
      std::cerr << "[RateLimiter] backoff listener failed: " << e.what()
                << "\n";
    }
  }

  return std::chrono::milliseconds(event.backoff_ms);
}

void RateLimiter::resetBackoff() {
  std::lock_guard lock(mutex_);
  backoff_until_ms_.reset();
  consecutive_errors_ = 0;
}

std::optional<std::int64_t> RateLimiter::backoffRemainingMs() const {
  std::lock_guard lock(mutex_);
  if (!backoff_until_ms_) {
    return std::nullopt;
  }
  const std::int64_t remaining = *backoff_until_ms_ - clock_.now_ms();
  if (remaining <= 0) {
    return std::nullopt;
  }
  return remaining;
}

// -----------------------------------------------------------------------------
// Subscriptions
// -----------------------------------------------------------------------------
void RateLimiter::addSubscription(const std::string& symbol) {
  std::lock_guard lock(subscriptions_mutex_);
  if (subscriptions_.size() >= config_.max_market_data_lines) {
    throw MarketDataLimitError(subscriptions_.size(),
                               config_.max_market_data_lines);
  }
  subscriptions_.insert(symbol);
}

void RateLimiter::removeSubscription(const std::string& symbol) {
  std::lock_guard lock(subscriptions_mutex_);
  subscriptions_.erase(symbol);
}

void RateLimiter::clearSubscriptions() {
  std::size_t count = 0;
  {
    std::lock_guard lock(subscriptions_mutex_);
    count = subscriptions_.size();
    subscriptions_.clear();
  }
  std::cout << "[RateLimiter] cleared " << count
            << " market data subscriptions\n";
}

std::size_t RateLimiter::activeSubscriptions() const {
  std::lock_guard lock(subscriptions_mutex_);
  return subscriptions_.size();
}

bool RateLimiter::isSubscribed(const std::string& symbol) const {
  std::lock_guard lock(subscriptions_mutex_);
  return subscriptions_.count(symbol) > 0;
}

// -----------------------------------------------------------------------------
// Statistics
// -----------------------------------------------------------------------------
RateLimitStats RateLimiter::stats() const {
  const std::size_t active = activeSubscriptions();
  const bool in_backoff = backoffRemainingMs().has_value();

  std::lock_guard lock(mutex_);
  RateLimitStats s = counters_;
  s.average_delay_ms =
      s.total_delay_ms /
      static_cast<double>(std::max<std::uint64_t>(s.delayed_requests, 1));
  s.acceptance_rate =
      static_cast<double>(s.accepted_requests) /
      static_cast<double>(std::max<std::uint64_t>(s.total_requests, 1));
  s.period_seconds = ms_to_seconds(clock_.now_ms() - period_start_ms_);
  s.active_subscriptions = active;
  s.in_backoff = in_backoff;
  s.consecutive_errors = consecutive_errors_;
  return s;
}

void RateLimiter::resetStats() {
  std::lock_guard lock(mutex_);
  counters_ = RateLimitStats{};
  period_start_ms_ = clock_.now_ms();
}

void RateLimiter::recordRejected() {
  std::lock_guard lock(mutex_);
  ++counters_.rejected_requests;
}

void RateLimiter::recordDelay(Seconds wait) {
  std::lock_guard lock(mutex_);
  ++counters_.delayed_requests;
  counters_.total_delay_ms += wait.count() * 1000.0;
}

void RateLimiter::recordAccepted() {
  std::lock_guard lock(mutex_);
  ++counters_.accepted_requests;
  consecutive_errors_ = 0;
}

// -----------------------------------------------------------------------------
// close() / listener
// -----------------------------------------------------------------------------
void RateLimiter::close() {
  if (!closed_.isRequested()) {
    std::cout << "[RateLimiter] closed; pending waits cancelled\n";
  }
  closed_.request();
}

void RateLimiter::setBackoffListener(BackoffListener listener) {
  std::lock_guard lock(mutex_);
  backoff_listener_ = std::move(listener);
}

}  // namespace tether
