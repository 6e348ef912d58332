#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace tether {

// -----------------------------------------------------------------------------
// ErrorSeverity
// -----------------------------------------------------------------------------
// Drives logging level and the default recovery decision in
// recoveryStrategyFor(): Low/Medium may be retried, High stops the current
// operation, Critical requires the connection to be re-established (or the
// process to stop).
// -----------------------------------------------------------------------------
enum class ErrorSeverity { Low, Medium, High, Critical };

const char* toString(ErrorSeverity severity);

// -----------------------------------------------------------------------------
// GatewayError — root of the error hierarchy
// -----------------------------------------------------------------------------
//
// @brief  std::runtime_error carrying a severity, structured details and an
//         optional operator-facing recovery hint.
//
// @details
// Every failure this library raises is a GatewayError. Call sites catch the
// narrowest class they can act on:
//
//   GatewayError
//    ├── ConnectionError                (retried by withConnectionRetry)
//    │    ├── ConnectionEstablishmentError
//    │    ├── ConnectionTimeoutError
//    │    └── ConnectionLostError
//    │         └── ReconnectExhaustedError
//    ├── RateLimitError                 (carries limit type + retry-after)
//    │    └── MarketDataLimitError
//    ├── OperationCancelledError        (wait interrupted by shutdown)
//    └── ConfigurationError
//         └── InvalidConfigError
//
// toJson() renders the error for the status server and for logs.
// -----------------------------------------------------------------------------
class GatewayError : public std::runtime_error {
 public:
  GatewayError(const std::string& message, ErrorSeverity severity,
               nlohmann::json details = nlohmann::json::object(),
               std::string recovery_action = {});

  ErrorSeverity severity() const { return severity_; }
  const nlohmann::json& details() const { return details_; }
  const std::string& recoveryAction() const { return recovery_action_; }

  // Class name as reported in toJson()["error"].
  virtual const char* name() const { return "GatewayError"; }

  // {error, message, severity, details, recovery_action}
  nlohmann::json toJson() const;

 private:
  ErrorSeverity severity_;
  nlohmann::json details_;
  std::string recovery_action_;
};

// --- Connection errors -------------------------------------------------------

class ConnectionError : public GatewayError {
 public:
  explicit ConnectionError(const std::string& message,
                           ErrorSeverity severity = ErrorSeverity::High,
                           nlohmann::json details = nlohmann::json::object(),
                           std::string recovery_action = {});
  const char* name() const override { return "ConnectionError"; }
};

// Raised by ConnectionMonitor::start() when the factory or connect() fails.
class ConnectionEstablishmentError : public ConnectionError {
 public:
  explicit ConnectionEstablishmentError(const std::string& cause);
  const char* name() const override { return "ConnectionEstablishmentError"; }
};

class ConnectionTimeoutError : public ConnectionError {
 public:
  explicit ConnectionTimeoutError(int timeout_seconds = 30);
  const char* name() const override { return "ConnectionTimeoutError"; }
};

class ConnectionLostError : public ConnectionError {
 public:
  explicit ConnectionLostError(
      const std::string& message = "Lost connection to gateway");
  const char* name() const override { return "ConnectionLostError"; }

 protected:
  ConnectionLostError(const std::string& message, std::string recovery_action);
};

// The monitor gave up after its configured number of reconnect attempts. The
// state is `error` until an external actor calls start() again.
class ReconnectExhaustedError : public ConnectionLostError {
 public:
  explicit ReconnectExhaustedError(int attempts);
  const char* name() const override { return "ReconnectExhaustedError"; }
  int attempts() const { return attempts_; }

 private:
  int attempts_;
};

// --- Rate limiting -----------------------------------------------------------

// -----------------------------------------------------------------------------
// RateLimitError
// -----------------------------------------------------------------------------
// A hard rejection: active backoff window, exhausted historical-data window
// or subscription ceiling. retryAfterSeconds() is the suggested delay before
// trying again; 0 means "no automatic retry makes sense" (subscription
// ceilings). std::nullopt means the limiter had no suggestion.
// -----------------------------------------------------------------------------
class RateLimitError : public GatewayError {
 public:
  explicit RateLimitError(std::string limit_type = "requests",
                          std::optional<double> retry_after_seconds = {});
  const char* name() const override { return "RateLimitError"; }

  const std::string& limitType() const { return limit_type_; }
  std::optional<double> retryAfterSeconds() const { return retry_after_; }

 protected:
  RateLimitError(const std::string& message, std::string limit_type,
                 std::optional<double> retry_after_seconds,
                 nlohmann::json details, std::string recovery_action,
                 ErrorSeverity severity);

 private:
  std::string limit_type_;
  std::optional<double> retry_after_;
};

class MarketDataLimitError : public RateLimitError {
 public:
  MarketDataLimitError(std::size_t current, std::size_t limit);
  const char* name() const override { return "MarketDataLimitError"; }
};

// --- Cancellation ------------------------------------------------------------

class OperationCancelledError : public GatewayError {
 public:
  explicit OperationCancelledError(const std::string& what_was_waiting);
  const char* name() const override { return "OperationCancelledError"; }
};

// --- Configuration -----------------------------------------------------------

class ConfigurationError : public GatewayError {
 public:
  explicit ConfigurationError(const std::string& message,
                              nlohmann::json details = nlohmann::json::object());
  const char* name() const override { return "ConfigurationError"; }
};

class InvalidConfigError : public ConfigurationError {
 public:
  InvalidConfigError(const std::string& key, const std::string& value,
                     const std::string& expected);
  const char* name() const override { return "InvalidConfigError"; }
};

// -----------------------------------------------------------------------------
// RecoveryStrategy / recoveryStrategyFor()
// -----------------------------------------------------------------------------
//
// @brief  Suggested reaction to an error, for callers that surface errors to
//         an operator or an automated client.
//
// @details
//   ConnectionLostError     → retry after 5 s, up to 3 times, "reconnect"
//   ConnectionTimeoutError  → retry after 10 s, up to 2 times, "reconnect"
//   MarketDataLimitError    → no retry, "reduce_subscriptions"
//   RateLimitError          → retry once after its retry-after (60 s if
//                             none), "wait"
//   any other Critical      → no retry, "abort"
//   anything else           → retry once after 5 s if Low/Medium, "retry"
// -----------------------------------------------------------------------------
struct RecoveryStrategy {
  bool should_retry{false};
  double retry_delay_seconds{0.0};
  int max_retries{0};
  std::string action;
};

RecoveryStrategy recoveryStrategyFor(const GatewayError& error);

}  // namespace tether
