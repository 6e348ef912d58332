#pragma once

#include "tether/concurrent/bounded_queue.hpp"
#include "tether/events/link_events.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace tether {

// -----------------------------------------------------------------------------
// StatusServer — ZeroMQ reporting surface of a GatewayLink
// -----------------------------------------------------------------------------
//
// @brief  Runs one thread that answers operator commands (REP socket) and
//         broadcasts link telemetry (PUB socket).
//
// @details
//   1. REP socket: receives a command string (PING, HEALTH, STATS,
//      RESET_STATS, RESET_BACKOFF, RECONNECT), forwards it to the command
//      handler (GatewayLink::executeCommand()) and sends back the JSON reply.
//      ZMQ_RCVTIMEO keeps the loop from blocking on an idle socket.
//
//   2. PUB socket: publishes one JSON document per LinkEvent:
//        {"type":"connection_state","previous":..,"current":..,
//         "reason":..,"timestamp_ms":..}
//        {"type":"rate_limit_backoff","backoff_ms":..,
//         "consecutive_errors":..,"message":..}
//      Events are buffered in a BoundedQueue. When nobody drains it fast
//      enough the oldest event is dropped, never the producer blocked.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any thread
//   (monitor workers, callers hitting a backoff). The command handler runs
//   on the server thread.
//
// Ownership:
//   Owned by GatewayLink via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the telemetry queue and the thread.
// -----------------------------------------------------------------------------
class StatusServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  command_handler     Turns a command into a JSON reply.
  // @param  cmd_endpoint        Endpoint the REP socket binds.
  // @param  pub_endpoint        Endpoint the PUB socket binds.
  // @param  telemetry_capacity  Events buffered before the oldest is dropped.
  //
  // No socket is opened and no thread started until start().
  // -------------------------------------------------------------------------
  StatusServer(CommandHandler command_handler, std::string cmd_endpoint,
               std::string pub_endpoint, std::size_t telemetry_capacity = 1024);

  ~StatusServer();

  StatusServer(const StatusServer&) = delete;
  StatusServer& operator=(const StatusServer&) = delete;
  StatusServer(StatusServer&&) = delete;
  StatusServer& operator=(StatusServer&&) = delete;

  // Binds both sockets and spawns the thread. Idempotent.
  // Throws zmq::error_t if an endpoint cannot be bound.
  void start();

  // Clears the running flag, joins (within kPollTimeoutMs), closes sockets.
  // Idempotent.
  void stop();

  bool running() const { return running_.load(); }

  // Enqueues an event for publishing. Safe from any thread.
  void pushTelemetry(LinkEvent event);

  // Events dropped because the queue was full.
  std::size_t droppedTelemetry() const { return telemetry_queue_.dropped(); }

  // JSON text published for `event`.
  static std::string formatTelemetry(const LinkEvent& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  BoundedQueue<LinkEvent> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace tether
