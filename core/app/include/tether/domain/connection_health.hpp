#pragma once

#include "tether/domain/connection_state.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace tether {
namespace domain {

// A connection is unhealthy if no heartbeat was seen for this long, whatever
// the configured heartbeat interval.
constexpr std::int64_t kHealthyHeartbeatAgeMs = 30'000;

// -----------------------------------------------------------------------------
// ConnectionHealth — raw health record of the monitored connection
// -----------------------------------------------------------------------------
//
// @brief  Plain data owned and mutated only by ConnectionMonitor. Callers get
//         copies (ConnectionMonitor::health()) and never see it change under
//         them.
//
// @details
// Timestamps are wall-clock epoch milliseconds (LiveTimeProvider); an empty
// optional means "never happened". Counters only ever increase for the life
// of the monitor.
// -----------------------------------------------------------------------------
struct ConnectionHealth {
  ConnectionState state{ConnectionState::Disconnected};
  std::optional<std::int64_t> last_heartbeat_ms;
  std::optional<std::int64_t> connected_since_ms;
  std::uint64_t reconnect_count{0};
  std::uint64_t error_count{0};
  std::string last_error;
  double latency_ms{0.0};
  std::uint64_t messages_sent{0};
  std::uint64_t messages_received{0};

  // @brief  Connected AND a heartbeat was seen less than 30 s before now_ms.
  bool isHealthy(std::int64_t now_ms) const;

  // @brief  now_ms − connected_since_ms, or std::nullopt if never connected.
  std::optional<std::int64_t> uptimeMs(std::int64_t now_ms) const;
};

// -----------------------------------------------------------------------------
// HealthReport — reporting snapshot with derived properties resolved
// -----------------------------------------------------------------------------
struct HealthReport {
  ConnectionState state{ConnectionState::Disconnected};
  bool healthy{false};
  std::optional<std::int64_t> uptime_ms;
  std::uint64_t reconnect_count{0};
  std::uint64_t error_count{0};
  double latency_ms{0.0};
  std::string last_error;
  std::uint64_t messages_sent{0};
  std::uint64_t messages_received{0};
};

HealthReport makeHealthReport(const ConnectionHealth& health,
                              std::int64_t now_ms);

}  // namespace domain
}  // namespace tether
