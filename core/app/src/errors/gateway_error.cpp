#include "tether/errors/gateway_error.hpp"

#include <utility>

namespace tether {

const char* toString(ErrorSeverity severity) {
  switch (severity) {
    case ErrorSeverity::Low:      return "low";
    case ErrorSeverity::Medium:   return "medium";
    case ErrorSeverity::High:     return "high";
    case ErrorSeverity::Critical: return "critical";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// GatewayError
// -----------------------------------------------------------------------------
GatewayError::GatewayError(const std::string& message, ErrorSeverity severity,
                           nlohmann::json details, std::string recovery_action)
    : std::runtime_error(message),
      severity_(severity),
      details_(std::move(details)),
      recovery_action_(std::move(recovery_action)) {}

nlohmann::json GatewayError::toJson() const {
  nlohmann::json j;
  j["error"] = name();
  j["message"] = what();
  j["severity"] = toString(severity_);
  j["details"] = details_;
  if (recovery_action_.empty()) {
    j["recovery_action"] = nullptr;
  } else {
    j["recovery_action"] = recovery_action_;
  }
  return j;
}

// -----------------------------------------------------------------------------
// Connection errors
// -----------------------------------------------------------------------------
ConnectionError::ConnectionError(const std::string& message,
                                 ErrorSeverity severity,
                                 nlohmann::json details,
                                 std::string recovery_action)
    : GatewayError(message, severity, std::move(details),
                   std::move(recovery_action)) {}

ConnectionEstablishmentError::ConnectionEstablishmentError(
    const std::string& cause)
    : ConnectionError("Failed to connect: " + cause, ErrorSeverity::High,
                      nlohmann::json{{"cause", cause}},
                      "Check the gateway is running and its API is enabled") {}

ConnectionTimeoutError::ConnectionTimeoutError(int timeout_seconds)
    : ConnectionError(
          "Connection timeout after " + std::to_string(timeout_seconds) +
              " seconds",
          ErrorSeverity::High, nlohmann::json{{"timeout", timeout_seconds}},
          "Check the gateway is running and its API port is reachable") {}

ConnectionLostError::ConnectionLostError(const std::string& message)
    : ConnectionLostError(message, "Attempting automatic reconnection...") {}

ConnectionLostError::ConnectionLostError(const std::string& message,
                                         std::string recovery_action)
    : ConnectionError(message, ErrorSeverity::Critical,
                      nlohmann::json::object(), std::move(recovery_action)) {}

ReconnectExhaustedError::ReconnectExhaustedError(int attempts)
    : ConnectionLostError("Reconnection failed after " +
                              std::to_string(attempts) + " attempts",
                          "Restart the connection monitor"),
      attempts_(attempts) {}

// -----------------------------------------------------------------------------
// Rate limiting
// -----------------------------------------------------------------------------
namespace {

std::string retryHint(std::optional<double> retry_after) {
  if (retry_after && *retry_after > 0.0) {
    return "Wait " + std::to_string(static_cast<long long>(*retry_after + 0.5)) +
           " seconds before retrying";
  }
  return "Reduce request frequency";
}

nlohmann::json rateLimitDetails(const std::string& limit_type,
                                std::optional<double> retry_after) {
  nlohmann::json d;
  d["limit_type"] = limit_type;
  if (retry_after) {
    d["retry_after"] = *retry_after;
  } else {
    d["retry_after"] = nullptr;
  }
  return d;
}

}  // namespace

RateLimitError::RateLimitError(std::string limit_type,
                               std::optional<double> retry_after_seconds)
    : RateLimitError("Rate limit exceeded for " + limit_type, limit_type,
                     retry_after_seconds,
                     rateLimitDetails(limit_type, retry_after_seconds),
                     retryHint(retry_after_seconds), ErrorSeverity::Medium) {}

RateLimitError::RateLimitError(const std::string& message,
                               std::string limit_type,
                               std::optional<double> retry_after_seconds,
                               nlohmann::json details,
                               std::string recovery_action,
                               ErrorSeverity severity)
    : GatewayError(message, severity, std::move(details),
                   std::move(recovery_action)),
      limit_type_(std::move(limit_type)),
      retry_after_(retry_after_seconds) {}

MarketDataLimitError::MarketDataLimitError(std::size_t current,
                                           std::size_t limit)
    : RateLimitError("Market data limit exceeded: " + std::to_string(current) +
                         "/" + std::to_string(limit),
                     "market_data_subscriptions", 0.0,
                     nlohmann::json{{"limit_type", "market_data_subscriptions"},
                                    {"retry_after", 0.0},
                                    {"current", current},
                                    {"limit", limit}},
                     "Reduce number of simultaneous subscriptions",
                     ErrorSeverity::High) {}

// -----------------------------------------------------------------------------
// Cancellation / configuration
// -----------------------------------------------------------------------------
OperationCancelledError::OperationCancelledError(
    const std::string& what_was_waiting)
    : GatewayError("Cancelled by shutdown while waiting: " + what_was_waiting,
                   ErrorSeverity::Low) {}

ConfigurationError::ConfigurationError(const std::string& message,
                                       nlohmann::json details)
    : GatewayError(message, ErrorSeverity::Critical, std::move(details),
                   "Fix the settings file and restart") {}

InvalidConfigError::InvalidConfigError(const std::string& key,
                                       const std::string& value,
                                       const std::string& expected)
    : ConfigurationError(
          "Invalid " + key + ": " + value + " (expected: " + expected + ")",
          nlohmann::json{{"key", key}, {"value", value},
                         {"expected", expected}}) {}

// -----------------------------------------------------------------------------
// recoveryStrategyFor(): most specific class first
// -----------------------------------------------------------------------------
RecoveryStrategy recoveryStrategyFor(const GatewayError& error) {
  if (dynamic_cast<const ConnectionLostError*>(&error) != nullptr) {
    return {true, 5.0, 3, "reconnect"};
  }
  if (dynamic_cast<const ConnectionTimeoutError*>(&error) != nullptr) {
    return {true, 10.0, 2, "reconnect"};
  }
  if (dynamic_cast<const MarketDataLimitError*>(&error) != nullptr) {
    return {false, 0.0, 0, "reduce_subscriptions"};
  }
  if (const auto* rate = dynamic_cast<const RateLimitError*>(&error)) {
    return {true, rate->retryAfterSeconds().value_or(60.0), 1, "wait"};
  }
  if (error.severity() == ErrorSeverity::Critical) {
    return {false, 0.0, 0, "abort"};
  }
  bool retry = error.severity() == ErrorSeverity::Low ||
               error.severity() == ErrorSeverity::Medium;
  return {retry, 5.0, 1, "retry"};
}

}  // namespace tether
