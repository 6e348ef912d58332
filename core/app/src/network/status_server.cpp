#include "tether/network/status_server.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <utility>

namespace tether {

StatusServer::StatusServer(CommandHandler command_handler,
                           std::string cmd_endpoint, std::string pub_endpoint,
                           std::size_t telemetry_capacity)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)),
      telemetry_queue_(telemetry_capacity) {}

StatusServer::~StatusServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind sockets, spawn the server thread
// -----------------------------------------------------------------------------
void StatusServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[StatusServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

void StatusServer::stop() {
  const bool was_running = running_.exchange(false);

  if (thread_.joinable()) {
    thread_.join();
  }
  if (!was_running) {
    return;
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[StatusServer] stopped. Dropped telemetry: "
            << telemetry_queue_.dropped() << "\n";
}

void StatusServer::pushTelemetry(LinkEvent event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): alternate between draining telemetry and polling commands
// -----------------------------------------------------------------------------
void StatusServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  processTelemetry();
}

void StatusServer::processTelemetry() {
  while (auto event = telemetry_queue_.try_pop()) {
    const std::string text = formatTelemetry(*event);
    zmq::message_t msg(text.data(), text.size());
    pub_socket_->send(msg, zmq::send_flags::dontwait);
  }
}

void StatusServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  const std::string cmd(static_cast<const char*>(request.data()),
                        request.size());

  std::string response;
  try {
    response = command_handler_(cmd);
  } catch (const std::exception& e) {
    // REP must answer every request or the socket stays stuck.
    nlohmann::json j;
    j["status"] = "error";
    j["response"] = e.what();
    response = j.dump();
  }

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): LinkEvent → JSON text
// -----------------------------------------------------------------------------
std::string StatusServer::formatTelemetry(const LinkEvent& event) {
  nlohmann::json j;
  if (const auto* e = std::get_if<ConnectionStateEvent>(&event)) {
    j["type"] = "connection_state";
    j["previous"] = domain::toString(e->previous);
    j["current"] = domain::toString(e->current);
    j["reason"] = e->reason;
    j["timestamp_ms"] = e->timestamp_ms;
  } else if (const auto* e = std::get_if<BackoffEvent>(&event)) {
    j["type"] = "rate_limit_backoff";
    j["backoff_ms"] = e->backoff_ms;
    j["consecutive_errors"] = e->consecutive_errors;
    j["message"] = e->message;
  }
  return j.dump();
}

}  // namespace tether
