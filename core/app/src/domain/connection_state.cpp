#include "tether/domain/connection_state.hpp"

namespace tether {
namespace domain {

const char* toString(ConnectionState state) {
  using S = ConnectionState;
  switch (state) {
    case S::Disconnected: return "disconnected";
    case S::Connecting:   return "connecting";
    case S::Connected:    return "connected";
    case S::Reconnecting: return "reconnecting";
    case S::Error:        return "error";
    case S::Shutdown:     return "shutdown";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// isLegalTransition: the transition graph
// -----------------------------------------------------------------------------
bool ConnectionStateMachine::isLegalTransition(ConnectionState from,
                                               ConnectionState to) {
  using S = ConnectionState;

  switch (from) {
    case S::Disconnected:
      return to == S::Connecting ||
             to == S::Reconnecting ||
             to == S::Shutdown;

    case S::Connecting:
      return to == S::Connected ||
             to == S::Error ||
             to == S::Shutdown;

    case S::Connected:
      return to == S::Disconnected ||
             to == S::Reconnecting ||
             to == S::Shutdown;

    case S::Reconnecting:
      return to == S::Connected ||
             to == S::Error ||
             to == S::Shutdown;

    case S::Error:
      return to == S::Reconnecting ||
             to == S::Connecting ||
             to == S::Shutdown;

    case S::Shutdown:
      return false;
  }

  return false;
}

bool ConnectionStateMachine::isTerminal(ConnectionState state) {
  return state == ConnectionState::Shutdown;
}

bool ConnectionStateMachine::transition(ConnectionState next) {
  if (!isLegalTransition(current_, next)) {
    return false;
  }
  current_ = next;
  return true;
}

}  // namespace domain
}  // namespace tether
