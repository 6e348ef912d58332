#pragma once

#include "tether/domain/connection_state.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace tether {

// -----------------------------------------------------------------------------
// ConnectionStateEvent
// -----------------------------------------------------------------------------
// Emitted by ConnectionMonitor after every accepted state transition.
// timestamp_ms is wall-clock epoch milliseconds.
// -----------------------------------------------------------------------------
struct ConnectionStateEvent {
  domain::ConnectionState previous{domain::ConnectionState::Disconnected};
  domain::ConnectionState current{domain::ConnectionState::Disconnected};
  std::string reason;
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// BackoffEvent
// -----------------------------------------------------------------------------
// Emitted by RateLimiter when a gateway-side rate violation opens (or
// extends) the backoff window.
// -----------------------------------------------------------------------------
struct BackoffEvent {
  std::int64_t backoff_ms{0};
  std::uint64_t consecutive_errors{0};
  std::string message;
};

// -----------------------------------------------------------------------------
// LinkEvent
// -----------------------------------------------------------------------------
// Envelope for everything the status server publishes. A variant keeps the
// telemetry queue a plain value queue; consumers dispatch with
// std::get_if / std::visit.
// -----------------------------------------------------------------------------
using LinkEvent = std::variant<ConnectionStateEvent, BackoffEvent>;

}  // namespace tether
