// =============================================================================
// settings_test.cpp
// =============================================================================
// Unit tests for settings loading and validation.
//
// Validates:
//   - defaults when keys are absent
//   - seconds → milliseconds conversion for the monitor and window keys
//   - wrong types and out-of-range values name the offending key
//   - unreadable and malformed files raise ConfigurationError
//   - settingsToJson() is accepted back by parseSettings()
//   - validateForTrading() warnings
// =============================================================================

#include "tether/config/settings.hpp"
#include "tether/errors/gateway_error.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>

using namespace std::chrono_literals;
using nlohmann::json;

namespace {

// Writes `content` to a file under the test's temp dir and returns its path.
std::string writeTempFile(const std::string& name, const std::string& content) {
  const std::string path = ::testing::TempDir() + name;
  std::ofstream out(path, std::ios::trunc);
  out << content;
  return path;
}

// Expects parseSettings(j) to throw InvalidConfigError naming `key`.
void expectInvalid(const json& j, const std::string& key) {
  try {
    tether::parseSettings(j);
    FAIL() << "expected InvalidConfigError for " << key;
  } catch (const tether::InvalidConfigError& e) {
    EXPECT_EQ(e.details().at("key").get<std::string>(), key);
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. An empty object yields the documented defaults.
// -----------------------------------------------------------------------------
TEST(SettingsTest, EmptyObjectGivesDefaults) {
  const tether::Settings s = tether::parseSettings(json::object());

  EXPECT_EQ(s.gateway.host, "127.0.0.1");
  EXPECT_EQ(s.gateway.port, 7497);
  EXPECT_EQ(s.monitor.heartbeat_interval, 10'000ms);
  EXPECT_EQ(s.monitor.max_reconnect_attempts, 5);
  EXPECT_EQ(s.monitor.reconnect_base_delay, 5'000ms);
  EXPECT_EQ(s.retry.max_attempts, 3);
  EXPECT_DOUBLE_EQ(s.rate_limit.max_requests_per_second, 50.0);
  EXPECT_EQ(s.rate_limit.max_market_data_lines, 100u);
  EXPECT_EQ(s.rate_limit.historical_data_window, 600'000ms);
  EXPECT_TRUE(s.enable_rate_limiting);
  EXPECT_TRUE(s.enable_connection_monitor);
}

// -----------------------------------------------------------------------------
// 2. A full file round-trips through the loader with unit conversion.
// -----------------------------------------------------------------------------
TEST(SettingsTest, LoadsFileWithConversions) {
  const std::string path = writeTempFile("tether_settings_ok.json", R"({
    "gateway":    { "host": "10.0.0.5", "port": 4002, "client_id": 7 },
    "monitor":    { "enabled": false, "heartbeat_interval_seconds": 2.5,
                    "max_reconnect_attempts": 8,
                    "reconnect_delay_seconds": 0.25 },
    "retry":      { "max_attempts": 4, "base_delay_ms": 250 },
    "rate_limit": { "max_requests_per_second": 40, "max_orders_per_second": 3,
                    "max_market_data_lines": 20,
                    "max_historical_data_requests": 30,
                    "historical_data_window_seconds": 300,
                    "burst_size": 5, "initial_backoff_ms": 50,
                    "max_backoff_ms": 5000, "backoff_multiplier": 1.5 },
    "status_server": { "command_endpoint": "", "telemetry_capacity": 16 }
  })");

  const tether::Settings s = tether::loadSettings(path);
  std::remove(path.c_str());

  EXPECT_EQ(s.gateway.host, "10.0.0.5");
  EXPECT_EQ(s.gateway.port, 4002);
  EXPECT_EQ(s.gateway.client_id, 7);
  EXPECT_FALSE(s.enable_connection_monitor);
  EXPECT_EQ(s.monitor.heartbeat_interval, 2'500ms);
  EXPECT_EQ(s.monitor.max_reconnect_attempts, 8);
  EXPECT_EQ(s.monitor.reconnect_base_delay, 250ms);
  EXPECT_EQ(s.retry.max_attempts, 4);
  EXPECT_EQ(s.retry.base_delay, 250ms);
  EXPECT_DOUBLE_EQ(s.rate_limit.max_orders_per_second, 3.0);
  EXPECT_EQ(s.rate_limit.max_historical_data_requests, 30u);
  EXPECT_EQ(s.rate_limit.historical_data_window, 300'000ms);
  EXPECT_EQ(s.rate_limit.initial_backoff, 50ms);
  EXPECT_EQ(s.rate_limit.max_backoff, 5'000ms);
  EXPECT_DOUBLE_EQ(s.rate_limit.backoff_multiplier, 1.5);
  EXPECT_TRUE(s.status_server.command_endpoint.empty());
  EXPECT_EQ(s.status_server.publish_endpoint, "tcp://127.0.0.1:5557");
  EXPECT_EQ(s.status_server.telemetry_capacity, 16u);
}

// -----------------------------------------------------------------------------
// 3. Out-of-range and mistyped values name their dotted key.
// -----------------------------------------------------------------------------
TEST(SettingsTest, RejectsInvalidValues) {
  expectInvalid({{"gateway", {{"port", 0}}}}, "gateway.port");
  expectInvalid({{"gateway", {{"host", 12}}}}, "gateway.host");
  expectInvalid({{"monitor", {{"heartbeat_interval_seconds", 0.5}}}},
                "monitor.heartbeat_interval_seconds");
  expectInvalid({{"monitor", {{"max_reconnect_attempts", 0}}}},
                "monitor.max_reconnect_attempts");
  expectInvalid({{"monitor", {{"reconnect_delay_seconds", "soon"}}}},
                "monitor.reconnect_delay_seconds");
  expectInvalid({{"retry", {{"max_attempts", 50}}}}, "retry.max_attempts");
  expectInvalid({{"rate_limit", {{"max_requests_per_second", 500}}}},
                "rate_limit.max_requests_per_second");
  expectInvalid({{"rate_limit", {{"backoff_multiplier", 0.5}}}},
                "rate_limit.backoff_multiplier");
  expectInvalid({{"rate_limit", {{"enabled", "yes"}}}}, "rate_limit.enabled");
  expectInvalid({{"monitor", json::array()}}, "monitor");
}

TEST(SettingsTest, RejectsInitialBackoffAboveMax) {
  expectInvalid(
      {{"rate_limit", {{"initial_backoff_ms", 2000}, {"max_backoff_ms", 1000}}}},
      "rate_limit.initial_backoff_ms");
}

// -----------------------------------------------------------------------------
// 4. File-level failures.
// -----------------------------------------------------------------------------
TEST(SettingsTest, MalformedFile) {
  const std::string path =
      writeTempFile("tether_settings_bad.json", "{ \"monitor\": { ");
  EXPECT_THROW(tether::loadSettings(path), tether::ConfigurationError);
  std::remove(path.c_str());
}

TEST(SettingsTest, MissingFile) {
  EXPECT_THROW(tether::loadSettings(::testing::TempDir() +
                                    "tether_settings_missing.json"),
               tether::ConfigurationError);
}

TEST(SettingsTest, NonObjectRoot) {
  EXPECT_THROW(tether::parseSettings(json::array({1, 2})),
               tether::ConfigurationError);
}

// -----------------------------------------------------------------------------
// 5. settingsToJson() output parses back to the same values.
// -----------------------------------------------------------------------------
TEST(SettingsTest, ToJsonParsesBack) {
  tether::Settings s;
  s.gateway.port = 4001;
  s.monitor.heartbeat_interval = 3'000ms;
  s.rate_limit.burst_size = 7.0;
  s.enable_rate_limiting = false;

  const tether::Settings back =
      tether::parseSettings(tether::settingsToJson(s));
  EXPECT_EQ(back.gateway.port, 4001);
  EXPECT_EQ(back.monitor.heartbeat_interval, 3'000ms);
  EXPECT_DOUBLE_EQ(back.rate_limit.burst_size, 7.0);
  EXPECT_FALSE(back.enable_rate_limiting);
}

// -----------------------------------------------------------------------------
// 6. Trading warnings.
// -----------------------------------------------------------------------------
TEST(SettingsTest, TradingWarnings) {
  tether::Settings s;
  EXPECT_TRUE(tether::validateForTrading(s).empty());

  s.enable_rate_limiting = false;
  s.enable_connection_monitor = false;
  s.monitor.reconnect_base_delay = 45'000ms;
  s.rate_limit.burst_size = 80.0;
  EXPECT_EQ(tether::validateForTrading(s).size(), 4u);
}
