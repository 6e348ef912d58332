#pragma once

#include "tether/gateway/i_gateway_session.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace tether {

// -----------------------------------------------------------------------------
// SimulatedGatewaySession — in-process stand-in for a brokerage session
// -----------------------------------------------------------------------------
//
// @brief  A session whose failures are scripted, used by the demo executable
//         and by tests that need the monitor to see real failures.
//
// @details
// Behaviour is driven by a SimulationScript shared by every session the
// factory creates, so "fail the first two connects" spans reconnect
// attempts:
//
//   failing_connects  — the next N connect() calls throw ConnectionError.
//   pings_before_loss — after this many successful pings the link drops:
//                       the next ping() throws ConnectionLostError and
//                       isConnected() reports false. 0 = never drops.
//   ping_delay        — simulated round-trip time inside ping().
//
// Counters (connects, disconnects, pings) are readable by tests.
//
// Thread model:
//   All members are atomics; ping() runs on the heartbeat thread while
//   isConnected() may be called from the liveness thread.
// -----------------------------------------------------------------------------
struct SimulationScript {
  std::atomic<int> failing_connects{0};
  std::atomic<int> pings_before_loss{0};
  std::chrono::milliseconds ping_delay{0};

  std::atomic<int> connect_calls{0};
  std::atomic<int> disconnect_calls{0};
  std::atomic<int> ping_calls{0};
};

class SimulatedGatewaySession final : public IGatewaySession,
                                      public IPingable,
                                      public ILivenessProbe {
 public:
  // @param  script  Shared failure script; must outlive the session.
  // @param  id      Label used in log lines.
  SimulatedGatewaySession(std::shared_ptr<SimulationScript> script,
                          std::string id);

  void connect() override;
  void disconnect() override;
  void ping() override;
  bool isConnected() const override;

  // Drops the link immediately, as if the gateway went away.
  void sever();

  const std::string& id() const { return id_; }

 private:
  std::shared_ptr<SimulationScript> script_;
  std::string id_;
  std::atomic<bool> connected_{false};
  std::atomic<int> pings_{0};
};

// @brief  Factory producing SimulatedGatewaySession instances ("sim-1",
//         "sim-2", ...) that share `script`.
ConnectionFactory makeSimulatedFactory(std::shared_ptr<SimulationScript> script);

}  // namespace tether
