#pragma once

#include "tether/connection/connection_monitor.hpp"
#include "tether/domain/gateway_limits.hpp"
#include "tether/errors/gateway_error.hpp"

#include <iostream>
#include <memory>
#include <type_traits>
#include <utility>

namespace tether {

// -----------------------------------------------------------------------------
// withConnectionRetry(monitor, fn, policy)
// -----------------------------------------------------------------------------
//
// @brief  Runs fn(session) on the monitor's live handle, recovering from
//         connection-class failures.
//
// @details
// For attempt = 0 .. policy.max_attempts-1:
//   1. If the monitor is in Error (reconnection exhausted) or Shutdown,
//      fail immediately: nothing can succeed until it is restarted.
//   2. If not connected, trigger one reconnect() and carry on whatever it
//      returns.
//   3. Borrow the handle and call fn(*session). No handle counts as a
//      ConnectionLostError.
//   4. On a ConnectionError, wait policy.base_delay × 2^attempt (through
//      the monitor, so stop() interrupts it) and go again. The last
//      failure is rethrown once attempts run out.
//      Any other exception propagates at once.
//
// Each attempt counts one message sent, and one received on success.
//
// @throws ReconnectExhaustedError  monitor is in Error.
// @throws ConnectionLostError      monitor is shut down, or the last attempt
//                                  failed for lack of a handle.
// @throws OperationCancelledError  stop() interrupted a retry delay.
// -----------------------------------------------------------------------------
template <typename Fn>
decltype(auto) withConnectionRetry(ConnectionMonitor& monitor, Fn&& fn,
                                   const domain::RetryPolicy& policy = {}) {
  using Result = std::invoke_result_t<Fn&, IGatewaySession&>;
  const int max_attempts = policy.max_attempts > 0 ? policy.max_attempts : 1;

  for (int attempt = 0;; ++attempt) {
    const domain::ConnectionState state = monitor.state();
    if (state == domain::ConnectionState::Error) {
      throw ReconnectExhaustedError(monitor.config().max_reconnect_attempts);
    }
    if (state == domain::ConnectionState::Shutdown) {
      throw ConnectionLostError("Connection monitor is shut down");
    }

    if (!monitor.isConnected()) {
      std::cerr << "[ConnectionRetry] connection not available, attempting "
                   "reconnect\n";
      monitor.reconnect();
    }

    try {
      std::shared_ptr<IGatewaySession> session = monitor.connection();
      if (!session) {
        throw ConnectionLostError("No live connection to gateway");
      }

      monitor.noteMessageSent();
      if constexpr (std::is_void_v<Result>) {
        fn(*session);
        monitor.noteMessageReceived();
        return;
      } else {
        Result result = fn(*session);
        monitor.noteMessageReceived();
        return result;
      }
    } catch (const ConnectionError& e) {
      std::cerr << "[ConnectionRetry] attempt " << (attempt + 1) << "/"
                << max_attempts << " failed: " << e.what() << "\n";
      if (attempt + 1 >= max_attempts) {
        throw;
      }
      if (!monitor.waitFor(policy.base_delay * (1LL << attempt))) {
        throw OperationCancelledError("connection retry delay");
      }
    }
  }
}

}  // namespace tether
