#pragma once

#include "tradegate/processor/trade_request.hpp"
#include "tradegate/time/simulation_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>

namespace tradegate {

// -----------------------------------------------------------------------------
// SignalGateway — ZeroMQ SUB bridge for indicator snapshots
// -----------------------------------------------------------------------------
//
// @brief  Receives JSON SignalSnapshots on a SUB socket and pushes each one
//         as a SignalRequest through the sink (TradeProcessor::submit).
//
// @details
// The upstream analytics process publishes one message per symbol per
// step in the format documented in snapshot_json.hpp. Malformed messages
// are logged and skipped.
//
// When a SimulationTimeProvider is supplied, the clock is advanced to the
// snapshot's timestamp BEFORE the request is pushed, so replayed signals
// drive the interval and daily rules in their own time.
//
// Thread model:
//   start() spawns the receive thread. stop() is safe from any thread; the
//   loop notices it within kRecvTimeoutMs.
//
// Ownership:
//   Owns the ZMQ context and socket. Holds a non-owning clock pointer and a
//   copy of the sink.
// -----------------------------------------------------------------------------
class SignalGateway {
 public:
  using Sink = std::function<void(TradeRequest)>;

  SignalGateway(Sink sink, const std::string& endpoint,
                SimulationTimeProvider* sim_clock = nullptr);

  ~SignalGateway();

  SignalGateway(const SignalGateway&) = delete;
  SignalGateway& operator=(const SignalGateway&) = delete;
  SignalGateway(SignalGateway&&) = delete;
  SignalGateway& operator=(SignalGateway&&) = delete;

  void start();
  void stop();

  // Messages forwarded / skipped as malformed.
  std::uint64_t received() const { return received_.load(); }
  std::uint64_t malformed() const { return malformed_.load(); }

  // Parses one payload and forwards it. Returns false if it was malformed.
  bool handleMessage(const std::string& payload);

 private:
  static constexpr int kRecvTimeoutMs = 100;

  void run();

  Sink sink_;
  SimulationTimeProvider* sim_clock_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> received_{0};
  std::atomic<std::uint64_t> malformed_{0};
  std::thread thread_;
};

}  // namespace tradegate
