#include "tether/gateway/simulated_gateway_session.hpp"
#include "tether/errors/gateway_error.hpp"

#include <iostream>
#include <thread>
#include <utility>

namespace tether {

SimulatedGatewaySession::SimulatedGatewaySession(
    std::shared_ptr<SimulationScript> script, std::string id)
    : script_(std::move(script)), id_(std::move(id)) {}

// -----------------------------------------------------------------------------
// connect(): consume one scripted failure if any are left
// -----------------------------------------------------------------------------
void SimulatedGatewaySession::connect() {
  script_->connect_calls.fetch_add(1);

  int remaining = script_->failing_connects.load();
  while (remaining > 0 &&
         !script_->failing_connects.compare_exchange_weak(remaining,
                                                          remaining - 1)) {
  }
  if (remaining > 0) {
    throw ConnectionError("Simulated gateway refused connection (" + id_ +
                          ")");
  }

  connected_.store(true);
  pings_.store(0);
  std::cout << "[SimulatedGateway] " << id_ << " connected\n";
}

void SimulatedGatewaySession::disconnect() {
  script_->disconnect_calls.fetch_add(1);
  if (connected_.exchange(false)) {
    std::cout << "[SimulatedGateway] " << id_ << " disconnected\n";
  }
}

// -----------------------------------------------------------------------------
// ping(): one simulated round trip
// -----------------------------------------------------------------------------
void SimulatedGatewaySession::ping() {
  script_->ping_calls.fetch_add(1);

  if (!connected_.load()) {
    throw ConnectionLostError("Simulated gateway " + id_ + " is not connected");
  }

  if (script_->ping_delay.count() > 0) {
    std::this_thread::sleep_for(script_->ping_delay);
  }

  const int limit = script_->pings_before_loss.load();
  if (limit > 0 && pings_.fetch_add(1) >= limit) {
    connected_.store(false);
    throw ConnectionLostError("Simulated gateway " + id_ + " dropped the link");
  }
}

bool SimulatedGatewaySession::isConnected() const { return connected_.load(); }

void SimulatedGatewaySession::sever() { connected_.store(false); }

ConnectionFactory makeSimulatedFactory(
    std::shared_ptr<SimulationScript> script) {
  auto counter = std::make_shared<std::atomic<int>>(0);
  return [script = std::move(script), counter]() {
    const int n = counter->fetch_add(1) + 1;
    return std::make_shared<SimulatedGatewaySession>(script,
                                                     "sim-" + std::to_string(n));
  };
}

}  // namespace tether
