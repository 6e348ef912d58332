#pragma once

#include <string>

namespace tether {
namespace domain {

// -----------------------------------------------------------------------------
// ConnectionState — lifecycle of the single logical gateway connection
// -----------------------------------------------------------------------------
//
// @brief  Exactly one of these holds at any time. It is the single source of
//         truth for whether calls may be attempted.
//
// @details
// Legal transitions (enforced by ConnectionStateMachine):
//
//   Disconnected ──start──> Connecting ──ok──> Connected
//        │                      │                 │  ▲
//        │                      └──fail──> Error  │  │
//        │                                  │     │  │
//        └──────recovery──> Reconnecting <──┘<────┘  │
//                               │    └─────ok────────┘
//                               └──exhausted──> Error
//
//   Connected ──loss detected──> Disconnected
//   Error ──external restart──> Connecting
//   any non-terminal ──stop──> Shutdown   (terminal)
// -----------------------------------------------------------------------------
enum class ConnectionState {
  Disconnected,  // No handle. Initial state.
  Connecting,    // start() is running the connection factory
  Connected,     // Handle is live; calls may be attempted
  Reconnecting,  // A reconnection sequence is in flight
  Error,         // Start failed or reconnection exhausted; needs restart
  Shutdown,      // stop() was called — terminal state
};

// Lower-case name, as reported in health snapshots ("connected", ...).
const char* toString(ConnectionState state);

// -----------------------------------------------------------------------------
// ConnectionStateMachine
// -----------------------------------------------------------------------------
//
// @brief  Holds the current ConnectionState and rejects illegal transitions.
//
// @details
// Same shape as an order-lifecycle tracker: every change goes through
// transition(), which consults isLegalTransition(). An illegal request
// returns false and leaves the state untouched, so a late heartbeat callback
// can never drag a shut-down monitor back to Disconnected.
//
// Self-transitions are not transitions and are rejected (the caller decides
// whether "already there" is fine).
//
// Thread model:
//   Not synchronized. ConnectionMonitor guards it with its state mutex.
// -----------------------------------------------------------------------------
class ConnectionStateMachine {
 public:
  ConnectionStateMachine() = default;

  ConnectionState current() const { return current_; }

  // @return true and moves to `next` if legal, false otherwise.
  bool transition(ConnectionState next);

  static bool isLegalTransition(ConnectionState from, ConnectionState to);
  static bool isTerminal(ConnectionState state);

 private:
  ConnectionState current_{ConnectionState::Disconnected};
};

}  // namespace domain
}  // namespace tether
