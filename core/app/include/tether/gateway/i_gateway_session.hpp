#pragma once

#include <functional>
#include <memory>

namespace tether {

// -----------------------------------------------------------------------------
// IGatewaySession — abstract connection handle to the remote gateway
// -----------------------------------------------------------------------------
//
// @brief  The handle ConnectionMonitor keeps alive. Concrete sessions wrap
//         whatever brokerage API client the application uses.
//
// @details
// connect()/disconnect() are optional: the defaults do nothing, for sessions
// that are already connected when the factory returns them. Failures are
// reported by throwing (any std::exception; a ConnectionError if the
// session knows it is a connection failure).
//
// Two further capabilities are optional and expressed as separate
// interfaces, so the monitor does not need to guess what a handle can do:
//
//   IPingable      — round-trip probe; the heartbeat measures its latency.
//   ILivenessProbe — cheap "are you still connected?" predicate; the primary
//                    liveness signal when present.
//
// A session implements whichever of them it supports. resolveCapabilities()
// inspects a handle once, right after the factory produced it.
//
// Ownership:
//   ConnectionMonitor holds the handle via std::shared_ptr. Callers borrow
//   it through ConnectionMonitor::connection() only while connected.
// -----------------------------------------------------------------------------
class IGatewaySession {
 public:
  virtual ~IGatewaySession() = default;

  virtual void connect() {}
  virtual void disconnect() {}
};

class IPingable {
 public:
  virtual ~IPingable() = default;

  // Blocks for one round trip. Throws on failure.
  virtual void ping() = 0;
};

class ILivenessProbe {
 public:
  virtual ~ILivenessProbe() = default;

  virtual bool isConnected() const = 0;
};

// -----------------------------------------------------------------------------
// SessionCapabilities
// -----------------------------------------------------------------------------
// Non-owning views of the optional capabilities of one session. Null means
// "not supported". Valid as long as the session it was resolved from.
// -----------------------------------------------------------------------------
struct SessionCapabilities {
  IPingable* pingable{nullptr};
  ILivenessProbe* probe{nullptr};
};

inline SessionCapabilities resolveCapabilities(IGatewaySession& session) {
  SessionCapabilities caps;
  caps.pingable = dynamic_cast<IPingable*>(&session);
  caps.probe = dynamic_cast<ILivenessProbe*>(&session);
  return caps;
}

// Produces a fresh session for each (re)connection attempt.
using ConnectionFactory = std::function<std::shared_ptr<IGatewaySession>()>;

}  // namespace tether
