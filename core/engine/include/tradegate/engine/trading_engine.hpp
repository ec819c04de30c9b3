#pragma once

#include "tradegate/concurrent/order_id_generator.hpp"
#include "tradegate/config/engine_config.hpp"
#include "tradegate/domain/position.hpp"
#include "tradegate/domain/signal_snapshot.hpp"
#include "tradegate/execution/execution_handler.hpp"
#include "tradegate/execution/fill_watcher.hpp"
#include "tradegate/execution/i_order_transport.hpp"
#include "tradegate/execution/order_executor.hpp"
#include "tradegate/execution/paper_transport.hpp"
#include "tradegate/gateway/signal_gateway.hpp"
#include "tradegate/metrics/in_memory_metrics.hpp"
#include "tradegate/metrics/metrics_fanout.hpp"
#include "tradegate/network/telemetry_server.hpp"
#include "tradegate/persistence/jsonl_trade_sink.hpp"
#include "tradegate/persistence/trade_sink_fanout.hpp"
#include "tradegate/processor/trade_processor.hpp"
#include "tradegate/risk/risk_manager.hpp"
#include "tradegate/risk/risk_metrics.hpp"
#include "tradegate/strategy/decision_engine.hpp"
#include "tradegate/time/live_time_provider.hpp"
#include "tradegate/time/simulation_time_provider.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tradegate {

// -----------------------------------------------------------------------------
// TradingEngine
// -----------------------------------------------------------------------------
//
// @brief  Owns and wires the live pipeline: signals in, risk-gated orders
//         out through a transport, fills back in, telemetry out.
//
// @details
// Every state-changing request travels through one TradeProcessor queue and
// is handled on its consumer thread, so the RiskManager, OrderExecutor and
// DecisionEngine never need locks of their own:
//
//   SignalGateway ─SignalRequest─▶ ┌──────────────┐  "strategy.signal"
//   pushSignal()  ────────────────▶│TradeProcessor│─▶ DecisionEngine
//                                  │  (consumer)  │    └─▶ submit(PlaceOrder)
//   FillWatcher ──FillNotice──────▶│              │─▶ ExecutionHandler
//                                  └──────────────┘    ├─ OrderExecutor
//                                                      └─ IOrderTransport
//                                                           └─▶ FillWatcher
//
// The last registered handler copies RiskMetrics and open positions into a
// mutex-guarded snapshot after every request. Operator commands (STATUS)
// and tests read that snapshot instead of the live RiskManager.
//
// Thread layout:
//   trade_processor thread   → all request handlers
//   fill_watcher thread      → polls fill futures
//   signal_gateway thread    → ZMQ SUB recv (if signal_endpoint set)
//   telemetry thread         → ZMQ PUB + REP (if both endpoints set)
//   caller's thread          → construct, start(), stop()
//
// Ownership:
//   TradingEngine
//    ├── live_clock_ / sim_clock_ (non-owning) → clock_
//    ├── id_gen_, metrics_             (value members)
//    ├── telemetry_, journal_          (optional)
//    ├── metrics_fanout_, trade_fanout_
//    ├── risk_, executor_
//    ├── paper_transport_ or transport_ (non-owning, injected)
//    ├── processor_, fill_watcher_, execution_, decisions_
//    └── gateway_                       (optional)
//
// stop() halts threads in dependency order before any member is destroyed.
// -----------------------------------------------------------------------------
class TradingEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  config     Full engine configuration. Empty endpoints disable
  //                    the SignalGateway / TelemetryServer; an empty journal
  //                    path disables trade persistence.
  // @param  sim_clock  When non-null, used as the engine clock and advanced
  //                    by the SignalGateway to each signal's timestamp.
  //                    Otherwise the wall clock is used. Must outlive the
  //                    engine.
  // @param  transport  When non-null, replaces the built-in PaperTransport.
  //                    Must outlive the engine.
  //
  // @details
  // Builds and wires every component and registers the processor handlers.
  // No threads are spawned and no sockets are bound until start().
  //
  // @throws std::runtime_error  if the trade journal cannot be opened.
  // -------------------------------------------------------------------------
  explicit TradingEngine(EngineConfig config,
                         SimulationTimeProvider* sim_clock = nullptr,
                         IOrderTransport* transport = nullptr);

  ~TradingEngine();

  TradingEngine(const TradingEngine&) = delete;
  TradingEngine& operator=(const TradingEngine&) = delete;
  TradingEngine(TradingEngine&&) = delete;
  TradingEngine& operator=(TradingEngine&&) = delete;

  // Starts telemetry, the fill watcher, the processor, then signal intake.
  void start();

  // Stops signal intake first, then the processor, the fill watcher and
  // telemetry. Idempotent.
  void stop();

  bool isRunning() const { return running_; }

  // Any thread.
  void submit(TradeRequest request);
  void pushSignal(domain::SignalSnapshot snapshot);

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @brief  Operator command handler, bound to the TelemetryServer REP
  //         socket. Case-insensitive, surrounding whitespace ignored.
  //
  //   PING    → {"status":"ok","response":"PONG"}
  //   STATUS  → capital, drawdown, positions, trade stats, processor stats
  //   HALT    → refuse new positions (closes still allowed)
  //   RESUME  → lift HALT
  //   other   → {"status":"error","response":"Unknown command: ..."}
  //
  // Thread-safety: any thread. Reads only the snapshot, atomics and the
  //                halt flag.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // Snapshot refreshed after every processed request.
  RiskMetrics riskSnapshot() const;
  std::vector<domain::Position> positionSnapshot() const;

  const InMemoryMetrics& metrics() const { return metrics_; }
  const TradeProcessor& processor() const { return *processor_; }

 private:
  void onSignal(const domain::SignalRequest& request);
  void refreshSnapshot();

  EngineConfig config_;

  LiveTimeProvider live_clock_;
  SimulationTimeProvider* sim_clock_;
  const ITimeProvider& clock_;

  OrderIdGenerator id_gen_;
  InMemoryMetrics metrics_;

  std::unique_ptr<TelemetryServer> telemetry_;
  std::unique_ptr<JsonlTradeSink> journal_;
  std::unique_ptr<MetricsFanout> metrics_fanout_;
  std::unique_ptr<TradeSinkFanout> trade_fanout_;

  std::unique_ptr<RiskManager> risk_;
  std::unique_ptr<OrderExecutor> executor_;

  std::unique_ptr<PaperTransport> paper_transport_;
  IOrderTransport* transport_;

  std::unique_ptr<TradeProcessor> processor_;
  std::unique_ptr<FillWatcher> fill_watcher_;
  std::unique_ptr<ExecutionHandler> execution_;
  std::unique_ptr<DecisionEngine> decisions_;
  std::unique_ptr<SignalGateway> gateway_;

  mutable std::mutex snapshot_mutex_;  // Guards the two snapshots
  RiskMetrics risk_snapshot_;
  std::vector<domain::Position> position_snapshot_;

  bool running_{false};
};

}  // namespace tradegate
