#pragma once

#include "tradegate/concurrent/thread_safe_queue.hpp"
#include "tradegate/metrics/i_metrics_sink.hpp"
#include "tradegate/persistence/i_trade_sink.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace tradegate {

// -----------------------------------------------------------------------------
// TelemetryServer — ZeroMQ operator surface (PUB telemetry + REP commands)
// -----------------------------------------------------------------------------
//
// @brief  Publishes counters, gauges and closed trades as JSON on a PUB
//         socket and answers operator commands on a REP socket.
//
// @details
// Two sockets share one worker thread:
//
//   1. PUB: every incrementCounter(), setGauge() and recordTrade() call is
//      formatted as one JSON message and queued; the worker drains the
//      queue and publishes with dontwait, so producers never touch ZMQ.
//
//        {"type":"counter","name":"orders_filled_total","delta":1}
//        {"type":"gauge","name":"capital","value":1010.0}
//        {"type":"trade", ...ClosedTrade fields...}
//
//   2. REP: each request string is handed to the command handler (bound to
//      TradingEngine::executeCommand) and its JSON reply is sent back.
//      ZMQ_RCVTIMEO keeps the loop responsive to stop().
//
// Thread model:
//   start()/stop() from the owning thread. The sink methods are safe from
//   any thread. The command handler runs on the worker thread.
//
// Ownership:
//   Owned by TradingEngine. Owns the ZMQ context, both sockets, the queue
//   and the worker thread.
// -----------------------------------------------------------------------------
class TelemetryServer final : public IMetricsSink, public ITradeSink {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  TelemetryServer(CommandHandler command_handler, std::string cmd_endpoint,
                  std::string pub_endpoint);

  ~TelemetryServer() override;

  TelemetryServer(const TelemetryServer&) = delete;
  TelemetryServer& operator=(const TelemetryServer&) = delete;
  TelemetryServer(TelemetryServer&&) = delete;
  TelemetryServer& operator=(TelemetryServer&&) = delete;

  // Binds both sockets and spawns the worker. No-op when running.
  void start();

  // Joins the worker after a final drain, then closes the sockets.
  void stop();

  void incrementCounter(const std::string& name, double delta) override;
  void setGauge(const std::string& name, double value) override;
  void recordTrade(const domain::ClosedTrade& trade) override;

  // Queues an already formatted JSON message.
  void pushTelemetry(std::string message);

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

  ThreadSafeQueue<std::string> telemetry_queue_;

  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace tradegate
