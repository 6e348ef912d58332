#pragma once

#include "tether/domain/gateway_limits.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace tether {

// Where the brokerage gateway listens. Passed to the session factory.
struct GatewayEndpoint {
  std::string host{"127.0.0.1"};
  int port{7497};
  int client_id{1};
};

// ZeroMQ endpoints of the StatusServer. Either one empty disables it.
struct StatusServerConfig {
  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::string publish_endpoint{"tcp://127.0.0.1:5557"};
  std::size_t telemetry_capacity{1024};
};

// -----------------------------------------------------------------------------
// Settings — everything a GatewayLink is built from
// -----------------------------------------------------------------------------
//
// @details
// JSON layout accepted by loadSettings() (every key optional):
//
//   {
//     "gateway":   { "host": "127.0.0.1", "port": 7497, "client_id": 1 },
//     "monitor":   { "enabled": true,
//                    "heartbeat_interval_seconds": 10,
//                    "max_reconnect_attempts": 5,
//                    "reconnect_delay_seconds": 5 },
//     "retry":     { "max_attempts": 3, "base_delay_ms": 1000 },
//     "rate_limit":{ "enabled": true,
//                    "max_requests_per_second": 50,
//                    "max_orders_per_second": 5,
//                    "max_market_data_lines": 100,
//                    "max_historical_data_requests": 60,
//                    "historical_data_window_seconds": 600,
//                    "burst_size": 10,
//                    "initial_backoff_ms": 100,
//                    "max_backoff_ms": 30000,
//                    "backoff_multiplier": 2.0 },
//     "status_server": { "command_endpoint": "tcp://127.0.0.1:5556",
//                        "publish_endpoint": "tcp://127.0.0.1:5557",
//                        "telemetry_capacity": 1024 }
//   }
// -----------------------------------------------------------------------------
struct Settings {
  GatewayEndpoint gateway;
  domain::MonitorConfig monitor;
  domain::RetryPolicy retry;
  domain::RateLimitConfig rate_limit;
  StatusServerConfig status_server;

  bool enable_rate_limiting{true};
  bool enable_connection_monitor{true};
};

// -----------------------------------------------------------------------------
// loadSettings(path) / parseSettings(json)
// -----------------------------------------------------------------------------
// Missing keys keep their defaults. Every present value is type- and
// range-checked.
//
// @throws ConfigurationError  unreadable file or malformed JSON.
// @throws InvalidConfigError  a value of the wrong type or out of range;
//                             names the dotted key ("monitor.heartbeat_...").
// -----------------------------------------------------------------------------
Settings loadSettings(const std::string& path);
Settings parseSettings(const nlohmann::json& j);

// Inverse of parseSettings() for reporting.
nlohmann::json settingsToJson(const Settings& settings);

// Human-readable warnings about settings that are legal but risky for live
// trading. Empty when nothing stands out.
std::vector<std::string> validateForTrading(const Settings& settings);

}  // namespace tether
