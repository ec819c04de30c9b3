#include "tradegate/network/telemetry_server.hpp"
#include "tradegate/persistence/jsonl_trade_sink.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace tradegate {

TelemetryServer::TelemetryServer(CommandHandler command_handler,
                                 std::string cmd_endpoint,
                                 std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

TelemetryServer::~TelemetryServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind sockets and spawn worker thread
// -----------------------------------------------------------------------------
void TelemetryServer::start() {
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

  std::cout << "[TelemetryServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void TelemetryServer::stop() {
  if (!running_.exchange(false)) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[TelemetryServer] stopped.\n";
}

// -----------------------------------------------------------------------------
// Sink methods: format and enqueue, never touch the sockets
// -----------------------------------------------------------------------------
void TelemetryServer::incrementCounter(const std::string& name, double delta) {
  nlohmann::json j;
  j["type"] = "counter";
  j["name"] = name;
  j["delta"] = delta;
  pushTelemetry(j.dump());
}

void TelemetryServer::setGauge(const std::string& name, double value) {
  nlohmann::json j;
  j["type"] = "gauge";
  j["name"] = name;
  j["value"] = value;
  pushTelemetry(j.dump());
}

void TelemetryServer::recordTrade(const domain::ClosedTrade& trade) {
  nlohmann::json j = JsonlTradeSink::toJson(trade);
  j["type"] = "trade";
  pushTelemetry(j.dump());
}

void TelemetryServer::pushTelemetry(std::string message) {
  telemetry_queue_.push(std::move(message));
}

// -----------------------------------------------------------------------------
// run(): combined drain/poll loop
// -----------------------------------------------------------------------------
void TelemetryServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  processTelemetry();
}

void TelemetryServer::processTelemetry() {
  while (auto message = telemetry_queue_.try_pop()) {
    zmq::message_t msg(message->data(), message->size());
    auto sent = pub_socket_->send(msg, zmq::send_flags::dontwait);
    if (!sent.has_value()) {
      std::cerr << "[TelemetryServer] PUB send would block, dropped one "
                   "message\n";
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): one request/reply round if a request is waiting
// -----------------------------------------------------------------------------
void TelemetryServer::processCommands() {
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

  std::string response = command_handler_(request.to_string());
  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

}  // namespace tradegate
