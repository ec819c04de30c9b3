#include "tradegate/gateway/signal_gateway.hpp"
#include "tradegate/strategy/snapshot_json.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace tradegate {

// -----------------------------------------------------------------------------
// Constructor: subscribe to everything, bounded recv
// -----------------------------------------------------------------------------
SignalGateway::SignalGateway(Sink sink, const std::string& endpoint,
                             SimulationTimeProvider* sim_clock)
    : sink_(std::move(sink)), sim_clock_(sim_clock) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.set(zmq::sockopt::linger, 0);
  socket_.connect(endpoint);
}

SignalGateway::~SignalGateway() { stop(); }

void SignalGateway::start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread([this] { run(); });
  std::cout << "[SignalGateway] started\n";
}

void SignalGateway::stop() {
  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
    std::cout << "[SignalGateway] stopped after " << received()
              << " signal(s), " << malformed() << " malformed\n";
  }
}

// -----------------------------------------------------------------------------
// run(): receive loop, re-checks running_ after every timeout
// -----------------------------------------------------------------------------
void SignalGateway::run() {
  while (running_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;
    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      throw;
    }
    if (!result.has_value()) {
      continue;
    }
    handleMessage(msg.to_string());
  }
}

// -----------------------------------------------------------------------------
// handleMessage(): parse, advance clock, forward
// -----------------------------------------------------------------------------
bool SignalGateway::handleMessage(const std::string& payload) {
  domain::SignalSnapshot snapshot;
  try {
    snapshot = snapshotFromJson(nlohmann::json::parse(payload));
  } catch (const nlohmann::json::exception& e) {
    ++malformed_;
    std::cerr << "[SignalGateway] JSON parse error: " << e.what()
              << " payload: " << payload << "\n";
    return false;
  }
  if (snapshot.symbol.empty() || !(snapshot.price > 0.0)) {
    ++malformed_;
    std::cerr << "[SignalGateway] snapshot without symbol or price: "
              << payload << "\n";
    return false;
  }

  if (sim_clock_ != nullptr) {
    sim_clock_->advance_time(snapshot.timestamp_ms);
  }
  ++received_;
  sink_(domain::SignalRequest{std::move(snapshot)});
  return true;
}

}  // namespace tradegate
