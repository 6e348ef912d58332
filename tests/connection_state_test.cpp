// =============================================================================
// connection_state_test.cpp
// =============================================================================
// Unit tests for tether::domain::ConnectionStateMachine and the health
// record derived properties.
//
// Validates:
//   - Initial state and every legal transition of the lifecycle
//   - Illegal transitions are rejected and leave the state unchanged
//   - Shutdown is terminal
//   - "healthy" and "uptime" derivations
// =============================================================================

#include "tether/domain/connection_health.hpp"
#include "tether/domain/connection_state.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using tether::domain::ConnectionHealth;
using tether::domain::ConnectionState;
using tether::domain::ConnectionStateMachine;

namespace {

const std::vector<ConnectionState> kAllStates = {
    ConnectionState::Disconnected, ConnectionState::Connecting,
    ConnectionState::Connected,    ConnectionState::Reconnecting,
    ConnectionState::Error,        ConnectionState::Shutdown,
};

// Drives a fresh machine along `path`; every step must succeed.
ConnectionStateMachine walk(const std::vector<ConnectionState>& path) {
  ConnectionStateMachine m;
  for (ConnectionState s : path) {
    EXPECT_TRUE(m.transition(s)) << "step to " << tether::domain::toString(s);
  }
  return m;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. A new machine starts Disconnected.
// -----------------------------------------------------------------------------
TEST(ConnectionStateMachineTest, StartsDisconnected) {
  ConnectionStateMachine m;
  EXPECT_EQ(m.current(), ConnectionState::Disconnected);
}

// -----------------------------------------------------------------------------
// 2. The happy path: start, connect, lose, recover, stop.
// -----------------------------------------------------------------------------
TEST(ConnectionStateMachineTest, FullLifecycle) {
  ConnectionStateMachine m = walk({
      ConnectionState::Connecting,
      ConnectionState::Connected,
      ConnectionState::Disconnected,
      ConnectionState::Reconnecting,
      ConnectionState::Connected,
      ConnectionState::Shutdown,
  });
  EXPECT_EQ(m.current(), ConnectionState::Shutdown);
}

// -----------------------------------------------------------------------------
// 3. Failure paths: connect failure and exhausted recovery both land in
//    Error, from which recovery or an external restart is allowed.
// -----------------------------------------------------------------------------
TEST(ConnectionStateMachineTest, ErrorPaths) {
  ConnectionStateMachine failed_start =
      walk({ConnectionState::Connecting, ConnectionState::Error});
  EXPECT_TRUE(failed_start.transition(ConnectionState::Connecting));

  ConnectionStateMachine exhausted =
      walk({ConnectionState::Connecting, ConnectionState::Connected,
            ConnectionState::Reconnecting, ConnectionState::Error});
  EXPECT_TRUE(exhausted.transition(ConnectionState::Reconnecting));
}

// -----------------------------------------------------------------------------
// 4. Connected may go straight to Shutdown or Reconnecting.
// -----------------------------------------------------------------------------
TEST(ConnectionStateMachineTest, ConnectedShortcuts) {
  EXPECT_TRUE(ConnectionStateMachine::isLegalTransition(
      ConnectionState::Connected, ConnectionState::Shutdown));
  EXPECT_TRUE(ConnectionStateMachine::isLegalTransition(
      ConnectionState::Connected, ConnectionState::Reconnecting));
}

// -----------------------------------------------------------------------------
// 5. Illegal transitions are rejected and the state stays put.
// Why: A late callback must never move the monitor into a state the
//      lifecycle does not allow.
// -----------------------------------------------------------------------------
TEST(ConnectionStateMachineTest, IllegalTransitionLeavesStateUnchanged) {
  ConnectionStateMachine m;
  EXPECT_FALSE(m.transition(ConnectionState::Connected));
  EXPECT_EQ(m.current(), ConnectionState::Disconnected);

  EXPECT_FALSE(m.transition(ConnectionState::Error));
  EXPECT_EQ(m.current(), ConnectionState::Disconnected);

  ASSERT_TRUE(m.transition(ConnectionState::Connecting));
  EXPECT_FALSE(m.transition(ConnectionState::Reconnecting));
  EXPECT_EQ(m.current(), ConnectionState::Connecting);
}

// -----------------------------------------------------------------------------
// 6. Shutdown is terminal: nothing leaves it, not even shutdown → connecting.
// -----------------------------------------------------------------------------
TEST(ConnectionStateMachineTest, ShutdownIsTerminal) {
  ConnectionStateMachine m = walk({ConnectionState::Shutdown});
  for (ConnectionState next : kAllStates) {
    EXPECT_FALSE(m.transition(next)) << tether::domain::toString(next);
    EXPECT_EQ(m.current(), ConnectionState::Shutdown);
  }
  EXPECT_TRUE(ConnectionStateMachine::isTerminal(ConnectionState::Shutdown));
}

// -----------------------------------------------------------------------------
// 7. Self-transitions are not transitions.
// -----------------------------------------------------------------------------
TEST(ConnectionStateMachineTest, SelfTransitionsRejected) {
  for (ConnectionState s : kAllStates) {
    EXPECT_FALSE(ConnectionStateMachine::isLegalTransition(s, s))
        << tether::domain::toString(s);
  }
}

// -----------------------------------------------------------------------------
// 8. Every non-terminal state can be shut down.
// -----------------------------------------------------------------------------
TEST(ConnectionStateMachineTest, AnyNonTerminalStateCanShutDown) {
  for (ConnectionState s : kAllStates) {
    if (s == ConnectionState::Shutdown) {
      continue;
    }
    EXPECT_TRUE(ConnectionStateMachine::isLegalTransition(
        s, ConnectionState::Shutdown))
        << tether::domain::toString(s);
  }
}

TEST(ConnectionStateMachineTest, NamesAreLowerCase) {
  EXPECT_STREQ(tether::domain::toString(ConnectionState::Reconnecting),
               "reconnecting");
  EXPECT_STREQ(tether::domain::toString(ConnectionState::Shutdown),
               "shutdown");
}

// =============================================================================
// ConnectionHealth derived properties
// =============================================================================

// -----------------------------------------------------------------------------
// 9. Healthy requires Connected AND a heartbeat younger than 30 s.
// -----------------------------------------------------------------------------
TEST(ConnectionHealthTest, HealthyNeedsRecentHeartbeat) {
  ConnectionHealth h;
  h.state = ConnectionState::Connected;
  h.last_heartbeat_ms = 1'000;

  EXPECT_TRUE(h.isHealthy(1'000));
  EXPECT_TRUE(h.isHealthy(30'999));
  EXPECT_FALSE(h.isHealthy(31'000));

  h.state = ConnectionState::Reconnecting;
  EXPECT_FALSE(h.isHealthy(1'000));
}

TEST(ConnectionHealthTest, NeverConnectedHasNoUptime) {
  ConnectionHealth h;
  EXPECT_FALSE(h.uptimeMs(5'000).has_value());
  EXPECT_FALSE(h.isHealthy(5'000));

  h.connected_since_ms = 2'000;
  ASSERT_TRUE(h.uptimeMs(5'000).has_value());
  EXPECT_EQ(*h.uptimeMs(5'000), 3'000);
}

TEST(ConnectionHealthTest, ReportCopiesCounters) {
  ConnectionHealth h;
  h.state = ConnectionState::Connected;
  h.last_heartbeat_ms = 100;
  h.connected_since_ms = 0;
  h.reconnect_count = 2;
  h.error_count = 3;
  h.last_error = "boom";
  h.latency_ms = 4.5;

  const auto report = tether::domain::makeHealthReport(h, 1'100);
  EXPECT_TRUE(report.healthy);
  EXPECT_EQ(report.uptime_ms.value_or(-1), 1'100);
  EXPECT_EQ(report.reconnect_count, 2u);
  EXPECT_EQ(report.error_count, 3u);
  EXPECT_EQ(report.last_error, "boom");
  EXPECT_DOUBLE_EQ(report.latency_ms, 4.5);
}
