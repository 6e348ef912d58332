#include "tether/domain/connection_health.hpp"

namespace tether {
namespace domain {

bool ConnectionHealth::isHealthy(std::int64_t now_ms) const {
  if (state != ConnectionState::Connected || !last_heartbeat_ms) {
    return false;
  }
  return now_ms - *last_heartbeat_ms < kHealthyHeartbeatAgeMs;
}

std::optional<std::int64_t> ConnectionHealth::uptimeMs(
    std::int64_t now_ms) const {
  if (!connected_since_ms) {
    return std::nullopt;
  }
  return now_ms - *connected_since_ms;
}

HealthReport makeHealthReport(const ConnectionHealth& health,
                              std::int64_t now_ms) {
  HealthReport report;
  report.state = health.state;
  report.healthy = health.isHealthy(now_ms);
  report.uptime_ms = health.uptimeMs(now_ms);
  report.reconnect_count = health.reconnect_count;
  report.error_count = health.error_count;
  report.latency_ms = health.latency_ms;
  report.last_error = health.last_error;
  report.messages_sent = health.messages_sent;
  report.messages_received = health.messages_received;
  return report;
}

}  // namespace domain
}  // namespace tether
