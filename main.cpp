// -----------------------------------------------------------------------------
// tether_gateway — demo executable.
//
//   1) Load settings (JSON file from argv[1], or built-in demo defaults with
//      a short heartbeat so recovery is visible within seconds).
//   2) Print validation warnings.
//   3) Build a GatewayLink over a SimulatedGatewaySession whose script
//      refuses the first connect and drops the link every few pings.
//   4) Issue a mix of general/order/historical/market-data calls until
//      Ctrl-C or the round budget runs out, logging rejections.
//   5) Print HEALTH and STATS, then shut down cleanly.
//
// Thread layout:
//   main thread       → calls through GatewayLink::call()
//   liveness thread   → ConnectionMonitor::checkLiveness()
//   heartbeat thread  → ConnectionMonitor::sendHeartbeat()
//   status thread     → StatusServer (only when endpoints are configured)
// -----------------------------------------------------------------------------

#include "tether/config/settings.hpp"
#include "tether/engine/gateway_link.hpp"
#include "tether/errors/gateway_error.hpp"
#include "tether/gateway/simulated_gateway_session.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

// -----------------------------------------------------------------------------
// The only global: a lock-free flag the SIGINT handler sets. The main loop
// polls it between calls.
// -----------------------------------------------------------------------------
static std::atomic<bool> g_stop_requested{false};

static void sigint_handler(int /*signum*/) { g_stop_requested.store(true); }

namespace {

constexpr int kRounds = 60;
constexpr auto kRoundPause = std::chrono::milliseconds(250);

tether::Settings demoSettings() {
  tether::Settings s;
  s.monitor.heartbeat_interval = std::chrono::milliseconds(1'000);
  s.monitor.reconnect_base_delay = std::chrono::milliseconds(200);
  s.monitor.max_reconnect_attempts = 5;
  s.retry.base_delay = std::chrono::milliseconds(100);
  s.rate_limit.max_requests_per_second = 5.0;
  s.rate_limit.burst_size = 3.0;
  s.rate_limit.max_orders_per_second = 1.0;
  s.rate_limit.max_historical_data_requests = 4;
  s.rate_limit.max_market_data_lines = 3;
  s.status_server.command_endpoint.clear();
  s.status_server.publish_endpoint.clear();
  return s;
}

tether::OperationClass classForRound(int round) {
  switch (round % 4) {
    case 0:  return tether::OperationClass::General;
    case 1:  return tether::OperationClass::Order;
    case 2:  return tether::OperationClass::HistoricalData;
    default: return tether::OperationClass::MarketData;
  }
}

}  // namespace

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Settings
  // -------------------------------------------------------------------------
  tether::Settings settings;
  try {
    settings = argc > 1 ? tether::loadSettings(argv[1]) : demoSettings();
  } catch (const tether::ConfigurationError& e) {
    std::cerr << "[main] " << e.toJson().dump() << "\n";
    return 1;
  }

  for (const auto& warning : tether::validateForTrading(settings)) {
    std::cerr << "[main] WARNING: " << warning << "\n";
  }
  std::cout << "[main] settings: " << tether::settingsToJson(settings).dump()
            << "\n";

  // -------------------------------------------------------------------------
  // 2) Simulated gateway: refuse the first connect, drop every 5 pings
  // -------------------------------------------------------------------------
  auto script = std::make_shared<tether::SimulationScript>();
  script->failing_connects.store(1);
  script->pings_before_loss.store(5);
  script->ping_delay = std::chrono::milliseconds(3);

  tether::GatewayLink link(settings, tether::makeSimulatedFactory(script));

  link.monitor().onError([](const tether::GatewayError& e) {
    std::cerr << "[main] monitor error: " << e.toJson().dump() << "\n";
  });

  std::signal(SIGINT, sigint_handler);

  // -------------------------------------------------------------------------
  // 3) Start. The first connect is scripted to fail; recover via RECONNECT.
  // -------------------------------------------------------------------------
  try {
    link.start();
  } catch (const tether::ConnectionEstablishmentError& e) {
    std::cerr << "[main] start failed: " << e.what() << "\n";
    std::cout << "[main] RECONNECT -> " << link.executeCommand("RECONNECT")
              << "\n";
  }

  // -------------------------------------------------------------------------
  // 4) Traffic
  // -------------------------------------------------------------------------
  std::cout << "[main] Press Ctrl-C to shut down.\n";

  for (int round = 0; round < kRounds && !g_stop_requested.load(); ++round) {
    const tether::OperationClass op = classForRound(round);

    try {
      if (op == tether::OperationClass::MarketData) {
        const std::string symbol = "SYM" + std::to_string(round % 7);
        link.limiter().addSubscription(symbol);
      }

      const std::string who = link.call(
          op, [](tether::IGatewaySession& session) -> std::string {
            return static_cast<tether::SimulatedGatewaySession&>(session).id();
          });
      std::cout << "[main] round " << round << " " << tether::toString(op)
                << " served by " << who << "\n";
    } catch (const tether::MarketDataLimitError& e) {
      std::cerr << "[main] round " << round << " rejected: " << e.what()
                << "; releasing all lines\n";
      link.limiter().clearSubscriptions();
    } catch (const tether::RateLimitError& e) {
      std::cerr << "[main] round " << round << " rejected: " << e.what()
                << " (retry after "
                << e.retryAfterSeconds().value_or(0.0) << " s)\n";
    } catch (const tether::GatewayError& e) {
      std::cerr << "[main] round " << round << " failed: " << e.what()
                << "\n";
    }

    std::this_thread::sleep_for(kRoundPause);
  }

  // -------------------------------------------------------------------------
  // 5) Report and shut down
  // -------------------------------------------------------------------------
  std::cout << "[main] HEALTH " << link.executeCommand("HEALTH") << "\n";
  std::cout << "[main] STATS  " << link.executeCommand("STATS") << "\n";

  link.stop();
  return 0;
}
