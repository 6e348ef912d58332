// =============================================================================
// status_server_test.cpp
// =============================================================================
// Tests for tether::StatusServer.
//
// Validates:
//   - telemetry JSON for both event kinds
//   - the drop-oldest telemetry queue counts drops
//   - a REQ client gets the handler's reply, and an error document when
//     the handler throws
//
// The socket test binds loopback ports 57561/57562.
// =============================================================================

#include "tether/network/status_server.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

using nlohmann::json;
using tether::StatusServer;
using tether::domain::ConnectionState;

// -----------------------------------------------------------------------------
// 1. Connection state events carry both states by name.
// -----------------------------------------------------------------------------
TEST(StatusServerTest, FormatsConnectionStateEvent) {
  tether::ConnectionStateEvent e;
  e.previous = ConnectionState::Connected;
  e.current = ConnectionState::Reconnecting;
  e.reason = "no heartbeat within 30000 ms";
  e.timestamp_ms = 1'700'000'000'000;

  const json j = json::parse(StatusServer::formatTelemetry(e));
  EXPECT_EQ(j.at("type"), "connection_state");
  EXPECT_EQ(j.at("previous"), "connected");
  EXPECT_EQ(j.at("current"), "reconnecting");
  EXPECT_EQ(j.at("reason"), e.reason);
  EXPECT_EQ(j.at("timestamp_ms").get<std::int64_t>(), e.timestamp_ms);
}

TEST(StatusServerTest, FormatsBackoffEvent) {
  tether::BackoffEvent e;
  e.backoff_ms = 400;
  e.consecutive_errors = 2;
  e.message = "rate limit exceeded";

  const json j = json::parse(StatusServer::formatTelemetry(e));
  EXPECT_EQ(j.at("type"), "rate_limit_backoff");
  EXPECT_EQ(j.at("backoff_ms"), 400);
  EXPECT_EQ(j.at("consecutive_errors"), 2);
  EXPECT_EQ(j.at("message"), "rate limit exceeded");
}

// -----------------------------------------------------------------------------
// 2. Telemetry pushed while nobody drains the queue drops the oldest.
// -----------------------------------------------------------------------------
TEST(StatusServerTest, CountsDroppedTelemetry) {
  StatusServer server([](const std::string&) { return std::string("{}"); },
                      "tcp://127.0.0.1:57563", "tcp://127.0.0.1:57564", 2);

  for (int i = 0; i < 5; ++i) {
    tether::BackoffEvent e;
    e.backoff_ms = i;
    server.pushTelemetry(e);
  }
  EXPECT_EQ(server.droppedTelemetry(), 3u);
  EXPECT_FALSE(server.running());
}

// -----------------------------------------------------------------------------
// 3. Round trip over a real REQ socket.
// Why: REP must answer every request, including when the handler throws,
//      or the client socket is stuck for good.
// -----------------------------------------------------------------------------
TEST(StatusServerTest, AnswersCommandsOverZmq) {
  StatusServer server(
      [](const std::string& cmd) -> std::string {
        if (cmd == "BOOM") {
          throw std::runtime_error("handler failed");
        }
        return json{{"status", "ok"}, {"echo", cmd}}.dump();
      },
      "tcp://127.0.0.1:57561", "tcp://127.0.0.1:57562");
  server.start();
  ASSERT_TRUE(server.running());

  zmq::context_t ctx(1);
  zmq::socket_t req(ctx, zmq::socket_type::req);
  req.set(zmq::sockopt::rcvtimeo, 2000);
  req.set(zmq::sockopt::linger, 0);
  req.connect("tcp://127.0.0.1:57561");

  auto ask = [&](const std::string& cmd) {
    req.send(zmq::buffer(cmd), zmq::send_flags::none);
    zmq::message_t reply;
    const auto got = req.recv(reply, zmq::recv_flags::none);
    EXPECT_TRUE(got.has_value());
    return json::parse(reply.to_string());
  };

  const json ok = ask("PING");
  EXPECT_EQ(ok.at("status"), "ok");
  EXPECT_EQ(ok.at("echo"), "PING");

  const json err = ask("BOOM");
  EXPECT_EQ(err.at("status"), "error");
  EXPECT_EQ(err.at("response"), "handler failed");

  req.close();
  server.stop();
  EXPECT_FALSE(server.running());
}
