#pragma once

#include "tether/config/settings.hpp"
#include "tether/connection/connection_monitor.hpp"
#include "tether/connection/connection_retry.hpp"
#include "tether/gateway/i_gateway_session.hpp"
#include "tether/network/status_server.hpp"
#include "tether/ratelimit/operation_class.hpp"
#include "tether/ratelimit/rate_limited.hpp"
#include "tether/ratelimit/rate_limiter.hpp"
#include "tether/time/live_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace tether {

// -----------------------------------------------------------------------------
// GatewayLink
// -----------------------------------------------------------------------------
//
// @brief  One resilient, flow-controlled session to the gateway: the object
//         application code talks to.
//
// @details
// Owns, by value:
//   - the clocks (wall clock for health, steady clock for rate limits),
//   - one ConnectionMonitor,
//   - one RateLimiter,
//   - optionally one StatusServer (when both endpoints are non-empty).
// Nothing is global; two GatewayLinks in one process are independent.
//
// Every gateway call goes through call():
//
//   rateLimited(limiter, op)                 ← charged once per call
//     └─ withConnectionRetry(monitor, retry) ← retried on connection errors
//          └─ fn(session)
//
// Telemetry wiring (set up in the constructor):
//   monitor state listener  → StatusServer::pushTelemetry(ConnectionStateEvent)
//   limiter backoff listener → StatusServer::pushTelemetry(BackoffEvent)
//
// Lifecycle:
//   start(): status server, then monitor.start() (may throw
//            ConnectionEstablishmentError; the link then stays usable for
//            RECONNECT, and calling start() again retries the connect).
//   stop():  status server, then limiter.close() (cancels waits), then
//            monitor.stop(). Final: a stopped link cannot be restarted.
//
// Thread model:
//   start()/stop() from the owning thread; call() and executeCommand() from
//   any thread.
// -----------------------------------------------------------------------------
class GatewayLink {
 public:
  GatewayLink(Settings settings, ConnectionFactory factory);

  // RAII: stop().
  ~GatewayLink();

  GatewayLink(const GatewayLink&) = delete;
  GatewayLink& operator=(const GatewayLink&) = delete;
  GatewayLink(GatewayLink&&) = delete;
  GatewayLink& operator=(GatewayLink&&) = delete;

  void start();
  void stop();

  // -------------------------------------------------------------------------
  // call(op, fn, weight)
  // -------------------------------------------------------------------------
  // @brief  Runs fn(IGatewaySession&) under the rate limit for `op` (skipped
  //         when rate limiting is disabled) and the connection retry policy.
  //
  // @return Whatever fn returns.
  // @throws RateLimitError / MarketDataLimitError, ConnectionError family,
  //         OperationCancelledError, or anything fn throws.
  // -------------------------------------------------------------------------
  template <typename Fn>
  decltype(auto) call(OperationClass op, Fn&& fn, int weight = 1) {
    auto guarded = [this, &fn]() -> decltype(auto) {
      return withConnectionRetry(monitor_, fn, settings_.retry);
    };
    if (!settings_.enable_rate_limiting) {
      return guarded();
    }
    return rateLimited(limiter_, op, guarded, weight);
  }

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  // @brief  Operator commands, as served by the StatusServer.
  //
  //   PING          → {"status":"ok","response":"PONG"}
  //   HEALTH        → {"status":"ok","health":{...}}
  //   STATS         → {"status":"ok","stats":{...}}
  //   RESET_STATS   → clears limiter statistics
  //   RESET_BACKOFF → clears the limiter backoff window
  //   RECONNECT     → runs monitor.reconnect(); {"connected":bool}
  //   anything else → {"status":"error", ...}
  //
  // @return JSON text.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  ConnectionMonitor& monitor() { return monitor_; }
  RateLimiter& limiter() { return limiter_; }
  const Settings& settings() const { return settings_; }

  // Non-null only when the status server is configured.
  StatusServer* statusServer() { return status_server_.get(); }

 private:
  nlohmann::json healthJson() const;
  nlohmann::json statsJson() const;

  static domain::MonitorConfig effectiveMonitorConfig(const Settings& s);

  Settings settings_;
  LiveTimeProvider wall_clock_;
  SteadyTimeProvider steady_clock_;

  // Declared before the monitor and limiter so it outlives their listeners.
  std::unique_ptr<StatusServer> status_server_;

  ConnectionMonitor monitor_;
  RateLimiter limiter_;

  bool running_{false};
  bool stopped_{false};
};

}  // namespace tether
