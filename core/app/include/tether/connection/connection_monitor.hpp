#pragma once

#include "tether/concurrent/periodic_worker.hpp"
#include "tether/concurrent/shutdown_signal.hpp"
#include "tether/domain/connection_health.hpp"
#include "tether/domain/connection_state.hpp"
#include "tether/domain/gateway_limits.hpp"
#include "tether/errors/gateway_error.hpp"
#include "tether/events/link_events.hpp"
#include "tether/gateway/i_gateway_session.hpp"
#include "tether/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace tether {

// -----------------------------------------------------------------------------
// ConnectionMonitor — keeps one gateway session alive
// -----------------------------------------------------------------------------
//
// @brief  Owns the single connection handle, detects silent loss with a
//         heartbeat and a liveness check, and restores the connection with
//         bounded exponential backoff.
//
// @details
// Lifecycle:
//
//   start()      Disconnected/Error → Connecting → Connected
//                (or → Error, throwing ConnectionEstablishmentError)
//                then launches two PeriodicWorkers:
//                  "liveness"  — checkLiveness() every heartbeat_interval
//                  "heartbeat" — sendHeartbeat() every heartbeat_interval
//   reconnect()  → Reconnecting → Connected, or → Error when exhausted
//   stop()       → Shutdown (terminal), joins the workers, then releases
//                  the handle
//
// Reconnection is serialized by reconnect_mutex_, held for the whole
// multi-attempt sequence. Callers that queued behind a running sequence do
// not start another one; they return that sequence's outcome.
//
// Every sleep (interval, backoff, retry delays of withConnectionRetry)
// goes through the shared ShutdownSignal, so stop() interrupts all of them.
//
// Callbacks:
//   onConnected, onDisconnected, onError and the state listener are single
//   slots; the last registration wins. They are invoked without any monitor
//   lock held, on whichever thread caused the event. An exception thrown by
//   a callback is logged and dropped; it never reaches monitor internals.
//   Callbacks must not call stop() (it would join the calling worker).
//
// Thread model:
//   All public methods are safe from any thread. state_mutex_ guards the
//   state machine, the health record and the handle; callbacks_mutex_
//   guards the callback slots.
//
// Ownership:
//   Owned by GatewayLink (or a test). Owns the session through
//   std::shared_ptr; connection() lends it out only while connected.
//   Holds a reference to the wall-clock ITimeProvider, which must outlive
//   it.
// -----------------------------------------------------------------------------
class ConnectionMonitor {
 public:
  using Callback = std::function<void()>;
  using ErrorCallback = std::function<void(const GatewayError&)>;
  using StateListener = std::function<void(const ConnectionStateEvent&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  factory  Produces a fresh session per (re)connection attempt.
  // @param  config   Heartbeat interval, reconnect attempts and delay.
  // @param  clock    Wall clock for health timestamps.
  //
  // No connection is made and no thread is started.
  // -------------------------------------------------------------------------
  ConnectionMonitor(ConnectionFactory factory, domain::MonitorConfig config,
                    const ITimeProvider& clock);

  // RAII: stop().
  ~ConnectionMonitor();

  ConnectionMonitor(const ConnectionMonitor&) = delete;
  ConnectionMonitor& operator=(const ConnectionMonitor&) = delete;
  ConnectionMonitor(ConnectionMonitor&&) = delete;
  ConnectionMonitor& operator=(ConnectionMonitor&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Connects and launches the background checks.
  //
  // @details
  // No-op when already Connecting, Connected or Reconnecting. From Error it
  // acts as the external restart. Workers are launched once, the first time
  // the monitor reaches Connected after start() was called (directly, or
  // through a later reconnect() if this connect fails), and only if
  // enable_background_checks is set.
  //
  // @throws ConnectionEstablishmentError  factory or connect() failed; the
  //                                       state is Error.
  // @throws ConnectionError               the monitor was stopped.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // @brief  Shuts the monitor down for good.
  //
  // @details
  //   1. State → Shutdown.
  //   2. Request the shutdown signal (wakes every sleeper).
  //   3. Join both workers.
  //   4. disconnect() the handle, then fire onDisconnected.
  // Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  // -------------------------------------------------------------------------
  // reconnect()
  // -------------------------------------------------------------------------
  // @brief  Runs one reconnection sequence, or joins the one in flight.
  //
  // @details
  // Returns true immediately if Connected. Otherwise, for attempt
  // k = 1..max_reconnect_attempts:
  //   - disconnect any stale handle (fires onDisconnected),
  //   - sleep reconnect_base_delay × 2^(k-1),
  //   - call the factory and connect().
  // First success: reconnect_count += 1, onConnected, return true.
  // Exhaustion: state → Error, onError(ReconnectExhaustedError), false.
  // Returns false without touching the state if stop() interrupts it.
  // -------------------------------------------------------------------------
  bool reconnect();

  bool isConnected() const;
  domain::ConnectionState state() const;

  // Copy of the raw health record.
  domain::ConnectionHealth health() const;

  // Snapshot with "healthy" and "uptime" resolved against the clock.
  domain::HealthReport healthReport() const;

  // The live handle while Connected, otherwise null.
  std::shared_ptr<IGatewaySession> connection() const;

  void onConnected(Callback cb);
  void onDisconnected(Callback cb);
  void onError(ErrorCallback cb);
  void setStateListener(StateListener listener);

  // -------------------------------------------------------------------------
  // waitFor(duration)
  // -------------------------------------------------------------------------
  // Sleeps unless stop() is (or gets) called.
  // Output: true if the full duration elapsed, false if interrupted.
  // -------------------------------------------------------------------------
  bool waitFor(std::chrono::milliseconds duration) const;
  bool stopping() const { return signal_.isRequested(); }

  // Traffic counters for calls made on the borrowed handle.
  void noteMessageSent();
  void noteMessageReceived();

  const domain::MonitorConfig& config() const { return config_; }

 private:
  // Caller holds state_mutex_. On success updates health_.state and returns
  // the event to publish once the lock is released.
  std::optional<ConnectionStateEvent> transitionLocked(
      domain::ConnectionState next, const std::string& reason);

  // Acquires state_mutex_, transitions, publishes. Returns success.
  bool transitionTo(domain::ConnectionState next, const std::string& reason);

  // Factory + connect(). Throws whatever they throw.
  std::shared_ptr<IGatewaySession> openSession();

  // Moves the state to Connected and installs the session, unless the state
  // moved on (stop()). Returns false in that case; the session is then
  // disconnected and discarded.
  bool installSession(std::shared_ptr<IGatewaySession> session,
                      const std::string& reason);

  // Disconnects and drops the current handle, if any; fires onDisconnected
  // when there was one.
  void teardownSession();

  bool runReconnectSequence();

  // Connected → Disconnected with `reason`; no-op in any other state.
  void markLost(const std::string& reason);

  void recordError(const std::string& message);

  // Background tasks.
  void checkLiveness();
  void sendHeartbeat();
  void launchWorkers();

  void notify(const Callback& cb, const char* which);
  void notifyError(const GatewayError& error);
  void publish(const ConnectionStateEvent& event);

  ConnectionFactory factory_;
  const domain::MonitorConfig config_;
  const ITimeProvider& clock_;

  mutable std::mutex state_mutex_;
  domain::ConnectionStateMachine machine_;
  domain::ConnectionHealth health_;
  std::shared_ptr<IGatewaySession> session_;
  SessionCapabilities caps_;

  std::mutex reconnect_mutex_;
  std::atomic<std::uint64_t> reconnect_generation_{0};

  std::mutex callbacks_mutex_;
  Callback on_connected_;
  Callback on_disconnected_;
  ErrorCallback on_error_;
  StateListener state_listener_;

  ShutdownSignal signal_;
  // Set by the first start(); reconnect() launches the workers only then.
  std::atomic<bool> start_requested_{false};
  // Checked before workers_mutex_: a worker that reconnects must not block on
  // the mutex stop() holds while joining it.
  std::atomic<bool> workers_launched_{false};
  std::mutex workers_mutex_;
  std::unique_ptr<PeriodicWorker> liveness_worker_;
  std::unique_ptr<PeriodicWorker> heartbeat_worker_;
};

}  // namespace tether
