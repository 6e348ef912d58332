// =============================================================================
// connection_retry_test.cpp
// =============================================================================
// Unit tests for withConnectionRetry().
//
// Validates:
//   - values and void results pass through, traffic is counted
//   - connection-class failures are retried with doubling delays
//   - other failures propagate on the first attempt
//   - a disconnected monitor is reconnected before the call
//   - Error / Shutdown fail fast; stop() cancels a retry delay
// =============================================================================

#include "tether/connection/connection_retry.hpp"
#include "tether/gateway/simulated_gateway_session.hpp"
#include "tether/time/live_time_provider.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

using namespace std::chrono_literals;
using tether::ConnectionMonitor;
using tether::IGatewaySession;
using tether::domain::ConnectionState;
using tether::domain::RetryPolicy;

class ConnectionRetryTest : public ::testing::Test {
 protected:
  static tether::domain::MonitorConfig monitorConfig() {
    tether::domain::MonitorConfig c;
    c.max_reconnect_attempts = 2;
    c.reconnect_base_delay = 5ms;
    c.enable_background_checks = false;
    return c;
  }

  static RetryPolicy fastPolicy() {
    RetryPolicy p;
    p.max_attempts = 3;
    p.base_delay = 5ms;
    return p;
  }

  std::shared_ptr<tether::SimulationScript> script =
      std::make_shared<tether::SimulationScript>();
  tether::LiveTimeProvider clock;
  ConnectionMonitor monitor{tether::makeSimulatedFactory(script),
                            monitorConfig(), clock};
};

// -----------------------------------------------------------------------------
// 1. Happy path: one call, one message each way.
// -----------------------------------------------------------------------------
TEST_F(ConnectionRetryTest, ReturnsValueAndCountsTraffic) {
  monitor.start();

  const std::string id = tether::withConnectionRetry(
      monitor, [](IGatewaySession& session) {
        return dynamic_cast<tether::SimulatedGatewaySession&>(session).id();
      });
  EXPECT_EQ(id, "sim-1");

  int calls = 0;
  tether::withConnectionRetry(monitor,
                              [&](IGatewaySession&) { ++calls; });
  EXPECT_EQ(calls, 1);

  const tether::domain::ConnectionHealth health = monitor.health();
  EXPECT_EQ(health.messages_sent, 2u);
  EXPECT_EQ(health.messages_received, 2u);
}

// -----------------------------------------------------------------------------
// 2. Two connection failures, then success on the third attempt.
// -----------------------------------------------------------------------------
TEST_F(ConnectionRetryTest, RetriesConnectionFailures) {
  monitor.start();

  int calls = 0;
  const int v = tether::withConnectionRetry(
      monitor,
      [&](IGatewaySession&) {
        if (++calls < 3) {
          throw tether::ConnectionLostError("socket reset");
        }
        return 7;
      },
      fastPolicy());

  EXPECT_EQ(v, 7);
  EXPECT_EQ(calls, 3);
}

// -----------------------------------------------------------------------------
// 3. Attempts run out: the last failure is rethrown after delays of
//    5 and 10 ms.
// -----------------------------------------------------------------------------
TEST_F(ConnectionRetryTest, RethrowsAfterLastAttempt) {
  monitor.start();

  int calls = 0;
  const auto t0 = std::chrono::steady_clock::now();
  EXPECT_THROW(tether::withConnectionRetry(
                   monitor,
                   [&](IGatewaySession&) {
                     ++calls;
                     throw tether::ConnectionTimeoutError(1);
                   },
                   fastPolicy()),
               tether::ConnectionTimeoutError);

  EXPECT_EQ(calls, 3);
  EXPECT_GE(std::chrono::steady_clock::now() - t0, 15ms);
}

// -----------------------------------------------------------------------------
// 4. Non-connection failures are not retried.
// -----------------------------------------------------------------------------
TEST_F(ConnectionRetryTest, OtherFailuresPropagateImmediately) {
  monitor.start();

  int calls = 0;
  EXPECT_THROW(tether::withConnectionRetry(
                   monitor,
                   [&](IGatewaySession&) {
                     ++calls;
                     throw std::invalid_argument("bad contract");
                   },
                   fastPolicy()),
               std::invalid_argument);
  EXPECT_EQ(calls, 1);
}

// -----------------------------------------------------------------------------
// 5. A monitor that was never started is reconnected first.
// -----------------------------------------------------------------------------
TEST_F(ConnectionRetryTest, ReconnectsBeforeCall) {
  const bool ran = tether::withConnectionRetry(
      monitor, [](IGatewaySession&) { return true; }, fastPolicy());

  EXPECT_TRUE(ran);
  EXPECT_TRUE(monitor.isConnected());
  EXPECT_EQ(monitor.health().reconnect_count, 1u);
}

// -----------------------------------------------------------------------------
// 6. Error state fails fast with ReconnectExhaustedError.
// Why: reconnection already gave up; retrying would only add latency.
// -----------------------------------------------------------------------------
TEST_F(ConnectionRetryTest, ErrorStateFailsFast) {
  script->failing_connects = 100;
  EXPECT_FALSE(monitor.reconnect());
  ASSERT_EQ(monitor.state(), ConnectionState::Error);

  int calls = 0;
  EXPECT_THROW(tether::withConnectionRetry(
                   monitor, [&](IGatewaySession&) { ++calls; },
                   fastPolicy()),
               tether::ReconnectExhaustedError);
  EXPECT_EQ(calls, 0);
}

TEST_F(ConnectionRetryTest, ShutdownFailsFast) {
  monitor.start();
  monitor.stop();

  EXPECT_THROW(tether::withConnectionRetry(
                   monitor, [](IGatewaySession&) {}, fastPolicy()),
               tether::ConnectionLostError);
}

// -----------------------------------------------------------------------------
// 7. stop() during a retry delay cancels the call.
// -----------------------------------------------------------------------------
TEST_F(ConnectionRetryTest, StopCancelsRetryDelay) {
  monitor.start();

  RetryPolicy slow;
  slow.max_attempts = 3;
  slow.base_delay = 10'000ms;

  auto pending = std::async(std::launch::async, [&] {
    tether::withConnectionRetry(
        monitor,
        [](IGatewaySession&) {
          throw tether::ConnectionLostError("socket reset");
        },
        slow);
  });

  std::this_thread::sleep_for(50ms);
  monitor.stop();

  EXPECT_THROW(pending.get(), tether::OperationCancelledError);
}
