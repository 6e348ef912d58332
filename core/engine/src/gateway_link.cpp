#include "tether/engine/gateway_link.hpp"

#include "tether/time/time_utils.hpp"

#include <iostream>
#include <utility>

namespace tether {

// -----------------------------------------------------------------------------
// Constructor: build components, wire telemetry
// -----------------------------------------------------------------------------
GatewayLink::GatewayLink(Settings settings, ConnectionFactory factory)
    : settings_(std::move(settings)),
      monitor_(std::move(factory), effectiveMonitorConfig(settings_),
               wall_clock_),
      limiter_(settings_.rate_limit, steady_clock_) {
  const StatusServerConfig& st = settings_.status_server;
  if (!st.command_endpoint.empty() && !st.publish_endpoint.empty()) {
    status_server_ = std::make_unique<StatusServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        st.command_endpoint, st.publish_endpoint, st.telemetry_capacity);

    monitor_.setStateListener([this](const ConnectionStateEvent& e) {
      status_server_->pushTelemetry(e);
    });
    limiter_.setBackoffListener(
        [this](const BackoffEvent& e) { status_server_->pushTelemetry(e); });
  }
}

GatewayLink::~GatewayLink() { stop(); }

domain::MonitorConfig GatewayLink::effectiveMonitorConfig(const Settings& s) {
  domain::MonitorConfig config = s.monitor;
  config.enable_background_checks =
      config.enable_background_checks && s.enable_connection_monitor;
  return config;
}

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void GatewayLink::start() {
  if (running_) {
    return;
  }
  if (stopped_) {
    throw ConnectionError("GatewayLink has been stopped",
                          ErrorSeverity::Critical);
  }

  // ---  1) Reporting surface first, so the connect itself is observable ----
  //         (idempotent; it stays up after a failed connect so RECONNECT
  //         can still be served)
  if (status_server_) {
    status_server_->start();
  }

  // ---  2) Connect (throws ConnectionEstablishmentError on failure; a later
  //         start() retries from the monitor's Error state) ---------------
  monitor_.start();
  running_ = true;

  std::cout << "[GatewayLink] started. Gateway " << settings_.gateway.host
            << ":" << settings_.gateway.port << " (client "
            << settings_.gateway.client_id << "), rate limiting "
            << (settings_.enable_rate_limiting ? "on" : "off") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void GatewayLink::stop() {
  if (stopped_) {
    return;
  }
  stopped_ = true;

  // ---  1) No more commands (executeCommand touches the components) --------
  if (status_server_) {
    status_server_->stop();
  }

  // ---  2) Wake callers sleeping on a token deficit ------------------------
  limiter_.close();

  // ---  3) Stop checks, join workers, release the session ------------------
  monitor_.stop();

  running_ = false;
  std::cout << "[GatewayLink] stopped.\n";
}

// -----------------------------------------------------------------------------
// executeCommand()
// -----------------------------------------------------------------------------
std::string GatewayLink::executeCommand(const std::string& cmd) {
  nlohmann::json response;

  if (cmd == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (cmd == "HEALTH") {
    response["status"] = "ok";
    response["health"] = healthJson();
  } else if (cmd == "STATS") {
    response["status"] = "ok";
    response["stats"] = statsJson();
  } else if (cmd == "RESET_STATS") {
    limiter_.resetStats();
    response["status"] = "ok";
    response["response"] = "Statistics reset";
  } else if (cmd == "RESET_BACKOFF") {
    limiter_.resetBackoff();
    response["status"] = "ok";
    response["response"] = "Backoff cleared";
  } else if (cmd == "RECONNECT") {
    const bool connected = monitor_.reconnect();
    response["status"] = connected ? "ok" : "error";
    response["connected"] = connected;
    response["state"] = domain::toString(monitor_.state());
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

nlohmann::json GatewayLink::healthJson() const {
  const domain::HealthReport h = monitor_.healthReport();
  nlohmann::json j;
  j["state"] = domain::toString(h.state);
  j["healthy"] = h.healthy;
  j["uptime_seconds"] =
      h.uptime_ms ? nlohmann::json(ms_to_seconds(*h.uptime_ms))
                  : nlohmann::json(nullptr);
  j["reconnect_count"] = h.reconnect_count;
  j["error_count"] = h.error_count;
  j["latency_ms"] = h.latency_ms;
  j["last_error"] = h.last_error;
  j["messages_sent"] = h.messages_sent;
  j["messages_received"] = h.messages_received;
  return j;
}

nlohmann::json GatewayLink::statsJson() const {
  const RateLimitStats s = limiter_.stats();
  nlohmann::json j;
  j["total_requests"] = s.total_requests;
  j["accepted_requests"] = s.accepted_requests;
  j["rejected_requests"] = s.rejected_requests;
  j["delayed_requests"] = s.delayed_requests;
  j["avg_delay_ms"] = s.average_delay_ms;
  j["acceptance_rate"] = s.acceptance_rate;
  j["period_seconds"] = s.period_seconds;
  j["active_market_data"] = s.active_subscriptions;
  j["in_backoff"] = s.in_backoff;
  j["consecutive_errors"] = s.consecutive_errors;
  return j;
}

}  // namespace tether
