#include "tether/config/settings.hpp"
#include "tether/errors/gateway_error.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <sstream>

namespace tether {

namespace {

using nlohmann::json;

// -----------------------------------------------------------------------------
// Field readers: leave `out` alone when the key is absent
// -----------------------------------------------------------------------------
template <typename T>
bool readField(const json& section, const std::string& prefix,
               const char* key, T& out, const char* expected) {
  if (!section.is_object() || !section.contains(key)) {
    return false;
  }
  const json& value = section.at(key);
  try {
    out = value.get<T>();
  } catch (const json::exception&) {
    throw InvalidConfigError(prefix + "." + key, value.dump(), expected);
  }
  return true;
}

void requireRange(const std::string& key, double value, double lo, double hi) {
  if (!std::isfinite(value) || value < lo || value > hi) {
    std::ostringstream expected;
    expected << "a number in [" << lo << ", " << hi << "]";
    throw InvalidConfigError(key, json(value).dump(), expected.str());
  }
}

std::chrono::milliseconds secondsToMs(double seconds) {
  return std::chrono::milliseconds(
      static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
}

double msToSeconds(std::chrono::milliseconds ms) {
  return static_cast<double>(ms.count()) / 1000.0;
}

const json& section(const json& root, const char* name) {
  static const json kEmpty = json::object();
  if (!root.contains(name)) {
    return kEmpty;
  }
  const json& s = root.at(name);
  if (!s.is_object()) {
    throw InvalidConfigError(name, s.dump(), "an object");
  }
  return s;
}

void parseGateway(const json& root, GatewayEndpoint& g) {
  const json& s = section(root, "gateway");
  readField(s, "gateway", "host", g.host, "a string");
  if (readField(s, "gateway", "port", g.port, "an integer")) {
    requireRange("gateway.port", g.port, 1, 65535);
  }
  if (readField(s, "gateway", "client_id", g.client_id, "an integer")) {
    requireRange("gateway.client_id", g.client_id, 0, 999);
  }
}

void parseMonitor(const json& root, Settings& out) {
  const json& s = section(root, "monitor");
  domain::MonitorConfig& m = out.monitor;

  readField(s, "monitor", "enabled", out.enable_connection_monitor,
            "a boolean");

  double heartbeat = msToSeconds(m.heartbeat_interval);
  if (readField(s, "monitor", "heartbeat_interval_seconds", heartbeat,
                "a number")) {
    requireRange("monitor.heartbeat_interval_seconds", heartbeat, 1, 60);
    m.heartbeat_interval = secondsToMs(heartbeat);
  }

  if (readField(s, "monitor", "max_reconnect_attempts",
                m.max_reconnect_attempts, "an integer")) {
    requireRange("monitor.max_reconnect_attempts", m.max_reconnect_attempts,
                 1, 20);
  }

  double delay = msToSeconds(m.reconnect_base_delay);
  if (readField(s, "monitor", "reconnect_delay_seconds", delay, "a number")) {
    requireRange("monitor.reconnect_delay_seconds", delay, 0, 60);
    m.reconnect_base_delay = secondsToMs(delay);
  }
}

void parseRetry(const json& root, domain::RetryPolicy& r) {
  const json& s = section(root, "retry");
  if (readField(s, "retry", "max_attempts", r.max_attempts, "an integer")) {
    requireRange("retry.max_attempts", r.max_attempts, 1, 20);
  }
  std::int64_t base_ms = r.base_delay.count();
  if (readField(s, "retry", "base_delay_ms", base_ms, "an integer")) {
    requireRange("retry.base_delay_ms", static_cast<double>(base_ms), 0,
                 60'000);
    r.base_delay = std::chrono::milliseconds(base_ms);
  }
}

void parseRateLimit(const json& root, Settings& out) {
  const json& s = section(root, "rate_limit");
  domain::RateLimitConfig& c = out.rate_limit;
  const std::string p = "rate_limit";

  readField(s, p, "enabled", out.enable_rate_limiting, "a boolean");

  if (readField(s, p, "max_requests_per_second", c.max_requests_per_second,
                "a number")) {
    requireRange(p + ".max_requests_per_second", c.max_requests_per_second, 1,
                 100);
  }
  if (readField(s, p, "max_orders_per_second", c.max_orders_per_second,
                "a number")) {
    requireRange(p + ".max_orders_per_second", c.max_orders_per_second, 1, 20);
  }
  if (readField(s, p, "max_market_data_lines", c.max_market_data_lines,
                "an integer")) {
    requireRange(p + ".max_market_data_lines",
                 static_cast<double>(c.max_market_data_lines), 1, 100);
  }
  if (readField(s, p, "max_historical_data_requests",
                c.max_historical_data_requests, "an integer")) {
    requireRange(p + ".max_historical_data_requests",
                 static_cast<double>(c.max_historical_data_requests), 1, 1e6);
  }

  double window = msToSeconds(c.historical_data_window);
  if (readField(s, p, "historical_data_window_seconds", window, "a number")) {
    requireRange(p + ".historical_data_window_seconds", window, 1, 86'400);
    c.historical_data_window = secondsToMs(window);
  }

  if (readField(s, p, "burst_size", c.burst_size, "a number")) {
    requireRange(p + ".burst_size", c.burst_size, 1, 1'000);
  }

  std::int64_t initial = c.initial_backoff.count();
  if (readField(s, p, "initial_backoff_ms", initial, "an integer")) {
    requireRange(p + ".initial_backoff_ms", static_cast<double>(initial), 1,
                 3'600'000);
    c.initial_backoff = std::chrono::milliseconds(initial);
  }
  std::int64_t max = c.max_backoff.count();
  if (readField(s, p, "max_backoff_ms", max, "an integer")) {
    requireRange(p + ".max_backoff_ms", static_cast<double>(max), 1,
                 3'600'000);
    c.max_backoff = std::chrono::milliseconds(max);
  }
  if (c.initial_backoff > c.max_backoff) {
    throw InvalidConfigError(p + ".initial_backoff_ms",
                             std::to_string(c.initial_backoff.count()),
                             "a value not above max_backoff_ms (" +
                                 std::to_string(c.max_backoff.count()) + ")");
  }

  if (readField(s, p, "backoff_multiplier", c.backoff_multiplier,
                "a number")) {
    requireRange(p + ".backoff_multiplier", c.backoff_multiplier, 1, 10);
  }
}

void parseStatusServer(const json& root, StatusServerConfig& st) {
  const json& s = section(root, "status_server");
  readField(s, "status_server", "command_endpoint", st.command_endpoint,
            "a string");
  readField(s, "status_server", "publish_endpoint", st.publish_endpoint,
            "a string");
  if (readField(s, "status_server", "telemetry_capacity",
                st.telemetry_capacity, "an integer")) {
    requireRange("status_server.telemetry_capacity",
                 static_cast<double>(st.telemetry_capacity), 1, 1e6);
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// loadSettings(): file → JSON → Settings
// -----------------------------------------------------------------------------
Settings loadSettings(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigurationError("Cannot open settings file: " + path,
                             {{"path", path}});
  }

  json root;
  try {
    in >> root;
  } catch (const json::parse_error& e) {
    throw ConfigurationError(
        "Malformed settings file " + path + ": " + e.what(),
        {{"path", path}, {"byte", e.byte}});
  }
  return parseSettings(root);
}

Settings parseSettings(const json& root) {
  if (!root.is_object()) {
    throw ConfigurationError("Settings root must be a JSON object",
                             {{"found", root.type_name()}});
  }

  Settings out;
  parseGateway(root, out.gateway);
  parseMonitor(root, out);
  parseRetry(root, out.retry);
  parseRateLimit(root, out);
  parseStatusServer(root, out.status_server);
  return out;
}

// -----------------------------------------------------------------------------
// settingsToJson()
// -----------------------------------------------------------------------------
nlohmann::json settingsToJson(const Settings& s) {
  json j;
  j["gateway"] = {{"host", s.gateway.host},
                  {"port", s.gateway.port},
                  {"client_id", s.gateway.client_id}};
  j["monitor"] = {
      {"enabled", s.enable_connection_monitor},
      {"heartbeat_interval_seconds", msToSeconds(s.monitor.heartbeat_interval)},
      {"max_reconnect_attempts", s.monitor.max_reconnect_attempts},
      {"reconnect_delay_seconds", msToSeconds(s.monitor.reconnect_base_delay)}};
  j["retry"] = {{"max_attempts", s.retry.max_attempts},
                {"base_delay_ms", s.retry.base_delay.count()}};

  const domain::RateLimitConfig& c = s.rate_limit;
  j["rate_limit"] = {
      {"enabled", s.enable_rate_limiting},
      {"max_requests_per_second", c.max_requests_per_second},
      {"max_orders_per_second", c.max_orders_per_second},
      {"max_market_data_lines", c.max_market_data_lines},
      {"max_historical_data_requests", c.max_historical_data_requests},
      {"historical_data_window_seconds",
       msToSeconds(c.historical_data_window)},
      {"burst_size", c.burst_size},
      {"initial_backoff_ms", c.initial_backoff.count()},
      {"max_backoff_ms", c.max_backoff.count()},
      {"backoff_multiplier", c.backoff_multiplier}};

  j["status_server"] = {
      {"command_endpoint", s.status_server.command_endpoint},
      {"publish_endpoint", s.status_server.publish_endpoint},
      {"telemetry_capacity", s.status_server.telemetry_capacity}};
  return j;
}

// -----------------------------------------------------------------------------
// validateForTrading()
// -----------------------------------------------------------------------------
std::vector<std::string> validateForTrading(const Settings& s) {
  std::vector<std::string> warnings;

  if (!s.enable_rate_limiting) {
    warnings.push_back(
        "Rate limiting is disabled; the gateway may disconnect on bursts");
  }
  if (!s.enable_connection_monitor) {
    warnings.push_back(
        "Connection monitoring is disabled; silent disconnects will not be "
        "detected");
  }
  if (s.monitor.reconnect_base_delay > std::chrono::seconds(30)) {
    warnings.push_back("Reconnect delay above 30 s; recovery will be slow");
  }
  if (s.rate_limit.burst_size > s.rate_limit.max_requests_per_second) {
    warnings.push_back(
        "Burst size exceeds the per-second request rate");
  }
  return warnings;
}

}  // namespace tether
