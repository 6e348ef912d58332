#include "tether/connection/connection_monitor.hpp"

#include <iostream>
#include <utility>

namespace tether {

using domain::ConnectionState;

ConnectionMonitor::ConnectionMonitor(ConnectionFactory factory,
                                     domain::MonitorConfig config,
                                     const ITimeProvider& clock)
    : factory_(std::move(factory)),
      config_(std::move(config)),
      clock_(clock) {}

ConnectionMonitor::~ConnectionMonitor() { stop(); }

// -----------------------------------------------------------------------------
// start(): connect, then launch the background checks
// -----------------------------------------------------------------------------
void ConnectionMonitor::start() {
  std::optional<ConnectionStateEvent> event;
  {
    std::lock_guard lock(state_mutex_);
    const ConnectionState current = machine_.current();

    if (current == ConnectionState::Shutdown) {
      throw ConnectionError("Connection monitor has been stopped",
                            ErrorSeverity::Critical);
    }
    if (current == ConnectionState::Connected ||
        current == ConnectionState::Connecting ||
        current == ConnectionState::Reconnecting) {
      return;
    }
    event = transitionLocked(ConnectionState::Connecting, "start requested");
  }
  start_requested_.store(true);
  if (event) {
    publish(*event);
  }

  // After a detected loss the stale handle is still held.
  teardownSession();

  std::shared_ptr<IGatewaySession> session;
  try {
    session = openSession();
  } catch (const std::exception& e) {
    recordError(e.what());
    transitionTo(ConnectionState::Error, e.what());
    std::cerr << "[ConnectionMonitor] failed to connect: " << e.what()
              << "\n";
    throw ConnectionEstablishmentError(e.what());
  }

  if (!installSession(std::move(session), "connection established")) {
    std::cout << "[ConnectionMonitor] stopped while connecting\n";
    return;
  }

  std::cout << "[ConnectionMonitor] connection established\n";
  notify(on_connected_, "onConnected");

  if (config_.enable_background_checks) {
    launchWorkers();
  }
}

void ConnectionMonitor::launchWorkers() {
  if (workers_launched_.load()) {
    return;
  }
  std::lock_guard lock(workers_mutex_);
  if (liveness_worker_ || signal_.isRequested()) {
    return;
  }

  liveness_worker_ = std::make_unique<PeriodicWorker>(
      "liveness", config_.heartbeat_interval, signal_,
      [this] { checkLiveness(); });
  heartbeat_worker_ = std::make_unique<PeriodicWorker>(
      "heartbeat", config_.heartbeat_interval, signal_,
      [this] { sendHeartbeat(); });

  liveness_worker_->start();
  heartbeat_worker_->start();
  workers_launched_.store(true);

  std::cout << "[ConnectionMonitor] started (heartbeat every "
            << config_.heartbeat_interval.count() << " ms)\n";
}

// -----------------------------------------------------------------------------
// stop(): shutdown state, wake and join workers, then release the handle
// -----------------------------------------------------------------------------
void ConnectionMonitor::stop() {
  std::optional<ConnectionStateEvent> event;
  {
    std::lock_guard lock(state_mutex_);
    if (machine_.current() == ConnectionState::Shutdown) {
      return;
    }
    event = transitionLocked(ConnectionState::Shutdown, "stop requested");
  }
  if (event) {
    publish(*event);
  }

  signal_.request();

  {
    std::lock_guard lock(workers_mutex_);
    if (liveness_worker_) {
      liveness_worker_->stop();
    }
    if (heartbeat_worker_) {
      heartbeat_worker_->stop();
    }
    liveness_worker_.reset();
    heartbeat_worker_.reset();
  }

  // Background loops have exited; nothing else touches the handle now
  // except a reconnect() caller, whose transitions all fail in Shutdown.
  teardownSession();

  std::cout << "[ConnectionMonitor] stopped\n";
}

// -----------------------------------------------------------------------------
// reconnect(): one serialized sequence, shared by concurrent callers
// -----------------------------------------------------------------------------
bool ConnectionMonitor::reconnect() {
  const std::uint64_t observed = reconnect_generation_.load();

  std::lock_guard sequence_lock(reconnect_mutex_);

  if (reconnect_generation_.load() != observed) {
    // A sequence finished while this caller was queued; share its result.
    return isConnected();
  }

  std::optional<ConnectionStateEvent> event;
  {
    std::lock_guard lock(state_mutex_);
    const ConnectionState current = machine_.current();
    if (current == ConnectionState::Connected) {
      return true;
    }
    event = transitionLocked(ConnectionState::Reconnecting,
                             "reconnection triggered");
    if (!event) {
      // Shutdown, or a start() still Connecting.
      return false;
    }
  }
  publish(*event);

  const bool ok = runReconnectSequence();
  reconnect_generation_.fetch_add(1);
  return ok;
}

bool ConnectionMonitor::runReconnectSequence() {
  const int max_attempts = config_.max_reconnect_attempts;

  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    if (signal_.isRequested()) {
      return false;
    }

    teardownSession();

    const auto delay = config_.reconnect_base_delay * (1LL << (attempt - 1));
    std::cout << "[ConnectionMonitor] reconnect attempt " << attempt << "/"
              << max_attempts << " (delay: " << delay.count() << " ms)\n";

    if (!signal_.waitFor(delay)) {
      std::cout << "[ConnectionMonitor] reconnect interrupted by stop\n";
      return false;
    }

    std::shared_ptr<IGatewaySession> session;
    try {
      session = openSession();
    } catch (const std::exception& e) {
      recordError(e.what());
      std::cerr << "[ConnectionMonitor] reconnect attempt " << attempt
                << " failed: " << e.what() << "\n";
      continue;
    }

    if (!installSession(std::move(session), "reconnected")) {
      return false;
    }

    {
      std::lock_guard lock(state_mutex_);
      ++health_.reconnect_count;
    }
    std::cout << "[ConnectionMonitor] reconnected after " << attempt
              << " attempt(s)\n";
    notify(on_connected_, "onConnected");

    // Covers a start() whose own connect failed.
    if (start_requested_.load() && config_.enable_background_checks) {
      launchWorkers();
    }
    return true;
  }

  ReconnectExhaustedError exhausted(max_attempts);
  recordError(exhausted.what());
  if (!transitionTo(ConnectionState::Error, exhausted.what())) {
    return false;
  }
  std::cerr << "[ConnectionMonitor] " << exhausted.what() << "\n";
  notifyError(exhausted);
  return false;
}

// -----------------------------------------------------------------------------
// Session handling
// -----------------------------------------------------------------------------
std::shared_ptr<IGatewaySession> ConnectionMonitor::openSession() {
  std::shared_ptr<IGatewaySession> session = factory_();
  if (!session) {
    throw ConnectionError("Connection factory returned no session");
  }
  session->connect();
  return session;
}

bool ConnectionMonitor::installSession(
    std::shared_ptr<IGatewaySession> session, const std::string& reason) {
  std::optional<ConnectionStateEvent> event;
  {
    std::lock_guard lock(state_mutex_);
    event = transitionLocked(ConnectionState::Connected, reason);
    if (event) {
      const std::int64_t now = clock_.now_ms();
      caps_ = resolveCapabilities(*session);
      session_ = session;
      health_.connected_since_ms = now;
      health_.last_heartbeat_ms = now;
    }
  }

  if (!event) {
    try {
      session->disconnect();
    } catch (const std::exception& e) {
      std::cerr << "[ConnectionMonitor] disconnect of discarded session "
                   "failed: "
                << e.what() << "\n";
    }
    return false;
  }

  publish(*event);
  return true;
}

void ConnectionMonitor::teardownSession() {
  std::shared_ptr<IGatewaySession> session;
  {
    std::lock_guard lock(state_mutex_);
    session = std::move(session_);
    caps_ = SessionCapabilities{};
  }
  if (!session) {
    return;
  }

  try {
    session->disconnect();
  } catch (const std::exception& e) {
    recordError(e.what());
    std::cerr << "[ConnectionMonitor] disconnect failed: " << e.what() << "\n";
  }
  notify(on_disconnected_, "onDisconnected");
}

void ConnectionMonitor::markLost(const std::string& reason) {
  std::optional<ConnectionStateEvent> event;
  {
    std::lock_guard lock(state_mutex_);
    if (machine_.current() != ConnectionState::Connected) {
      return;
    }
    event = transitionLocked(ConnectionState::Disconnected, reason);
  }
  if (event) {
    std::cerr << "[ConnectionMonitor] connection lost: " << reason << "\n";
    publish(*event);
  }
}

void ConnectionMonitor::recordError(const std::string& message) {
  std::lock_guard lock(state_mutex_);
  ++health_.error_count;
  health_.last_error = message;
}

// -----------------------------------------------------------------------------
// checkLiveness(): liveness worker task
// -----------------------------------------------------------------------------
void ConnectionMonitor::checkLiveness() {
  std::shared_ptr<IGatewaySession> session;
  SessionCapabilities caps;
  ConnectionState current;
  std::optional<std::int64_t> last_heartbeat;
  {
    std::lock_guard lock(state_mutex_);
    current = machine_.current();
    session = session_;
    caps = caps_;
    last_heartbeat = health_.last_heartbeat_ms;
  }

  // Error waits for an external restart; the others are transient and
  // owned by whoever is driving them.
  if (current == ConnectionState::Error ||
      current == ConnectionState::Shutdown ||
      current == ConnectionState::Connecting ||
      current == ConnectionState::Reconnecting) {
    return;
  }

  const std::int64_t max_age = 3 * config_.heartbeat_interval.count();
  std::string failure;

  if (!session) {
    failure = "no connection handle";
  } else if (current != ConnectionState::Connected) {
    failure = std::string("state is ") + domain::toString(current);
  } else if (caps.probe && !caps.probe->isConnected()) {
    failure = "gateway reports disconnected";
  } else if (!last_heartbeat || clock_.now_ms() - *last_heartbeat > max_age) {
    failure = "no heartbeat within " + std::to_string(max_age) + " ms";
  }

  if (failure.empty()) {
    return;
  }

  std::cerr << "[ConnectionMonitor] liveness check failed: " << failure
            << "\n";
  markLost(failure);

  try {
    reconnect();
  } catch (const std::exception& e) {
    std::cerr << "[ConnectionMonitor] reconnect from liveness check threw: "
              << e.what() << "\n";
  }
}

// -----------------------------------------------------------------------------
// sendHeartbeat(): heartbeat worker task
// -----------------------------------------------------------------------------
void ConnectionMonitor::sendHeartbeat() {
  std::shared_ptr<IGatewaySession> session;
  SessionCapabilities caps;
  {
    std::lock_guard lock(state_mutex_);
    if (machine_.current() != ConnectionState::Connected) {
      return;
    }
    session = session_;
    caps = caps_;
  }
  if (!session) {
    return;
  }

  noteMessageSent();
  const auto t0 = std::chrono::steady_clock::now();

  try {
    if (caps.pingable) {
      caps.pingable->ping();
    } else if (caps.probe && !caps.probe->isConnected()) {
      throw ConnectionLostError("Gateway reports disconnected");
    }
  } catch (const ConnectionLostError& e) {
    recordError(e.what());
    markLost(e.what());
    return;
  } catch (const std::exception& e) {
    recordError(e.what());
    std::cerr << "[ConnectionMonitor] heartbeat failed: " << e.what() << "\n";
    return;
  }

  const std::chrono::duration<double, std::milli> latency =
      std::chrono::steady_clock::now() - t0;

  std::lock_guard lock(state_mutex_);
  // The link may have been torn down or replaced while ping() ran.
  if (machine_.current() != ConnectionState::Connected ||
      session_ != session) {
    return;
  }
  health_.last_heartbeat_ms = clock_.now_ms();
  health_.latency_ms = latency.count();
  ++health_.messages_received;
}

// -----------------------------------------------------------------------------
// State machine plumbing
// -----------------------------------------------------------------------------
std::optional<ConnectionStateEvent> ConnectionMonitor::transitionLocked(
    ConnectionState next, const std::string& reason) {
  const ConnectionState previous = machine_.current();
  if (!machine_.transition(next)) {
    return std::nullopt;
  }
  health_.state = next;

  ConnectionStateEvent event;
  event.previous = previous;
  event.current = next;
  event.reason = reason;
  event.timestamp_ms = clock_.now_ms();
  return event;
}

bool ConnectionMonitor::transitionTo(ConnectionState next,
                                     const std::string& reason) {
  std::optional<ConnectionStateEvent> event;
  {
    std::lock_guard lock(state_mutex_);
    event = transitionLocked(next, reason);
  }
  if (!event) {
    return false;
  }
  publish(*event);
  return true;
}

// -----------------------------------------------------------------------------
// Accessors
// -----------------------------------------------------------------------------
bool ConnectionMonitor::isConnected() const {
  std::lock_guard lock(state_mutex_);
  return machine_.current() == ConnectionState::Connected;
}

ConnectionState ConnectionMonitor::state() const {
  std::lock_guard lock(state_mutex_);
  return machine_.current();
}

domain::ConnectionHealth ConnectionMonitor::health() const {
  std::lock_guard lock(state_mutex_);
  return health_;
}

domain::HealthReport ConnectionMonitor::healthReport() const {
  std::lock_guard lock(state_mutex_);
  return domain::makeHealthReport(health_, clock_.now_ms());
}

std::shared_ptr<IGatewaySession> ConnectionMonitor::connection() const {
  std::lock_guard lock(state_mutex_);
  if (machine_.current() != ConnectionState::Connected) {
    return nullptr;
  }
  return session_;
}

bool ConnectionMonitor::waitFor(std::chrono::milliseconds duration) const {
  return signal_.waitFor(duration);
}

void ConnectionMonitor::noteMessageSent() {
  std::lock_guard lock(state_mutex_);
  ++health_.messages_sent;
}

void ConnectionMonitor::noteMessageReceived() {
  std::lock_guard lock(state_mutex_);
  ++health_.messages_received;
}

// -----------------------------------------------------------------------------
// Callbacks
// -----------------------------------------------------------------------------
void ConnectionMonitor::onConnected(Callback cb) {
  std::lock_guard lock(callbacks_mutex_);
  on_connected_ = std::move(cb);
}

void ConnectionMonitor::onDisconnected(Callback cb) {
  std::lock_guard lock(callbacks_mutex_);
  on_disconnected_ = std::move(cb);
}

void ConnectionMonitor::onError(ErrorCallback cb) {
  std::lock_guard lock(callbacks_mutex_);
  on_error_ = std::move(cb);
}

void ConnectionMonitor::setStateListener(StateListener listener) {
  std::lock_guard lock(callbacks_mutex_);
  state_listener_ = std::move(listener);
}

void ConnectionMonitor::notify(const Callback& slot, const char* which) {
  Callback cb;
  {
    std::lock_guard lock(callbacks_mutex_);
    cb = slot;
  }
  if (!cb) {
    return;
  }
  try {
    cb();
  } catch (const std::exception& e) {
    std::cerr << "[ConnectionMonitor] " << which
              << " callback failed: " << e.what() << "\n";
  }
}

void ConnectionMonitor::notifyError(const GatewayError& error) {
  ErrorCallback cb;
  {
    std::lock_guard lock(callbacks_mutex_);
    cb = on_error_;
  }
  if (!cb) {
    return;
  }
  try {
    cb(error);
  } catch (const std::exception& e) {
    std::cerr << "[ConnectionMonitor] onError callback failed: " << e.what()
              << "\n";
  }
}

void ConnectionMonitor::publish(const ConnectionStateEvent& event) {
  StateListener listener;
  {
    std::lock_guard lock(callbacks_mutex_);
    listener = state_listener_;
  }
  if (!listener) {
    return;
  }
  try {
    listener(event);
  } catch (const std::exception& e) {
    std::cerr << "[ConnectionMonitor] state listener failed: " << e.what()
              << "\n";
  }
}

}  // namespace tether
