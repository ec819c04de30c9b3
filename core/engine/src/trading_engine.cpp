#include "tradegate/engine/trading_engine.hpp"
#include "tradegate/domain/order.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <utility>

namespace tradegate {

namespace {

std::string normalizeCommand(const std::string& cmd) {
  auto first = std::find_if_not(cmd.begin(), cmd.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(cmd.rbegin(), cmd.rend(), [](unsigned char c) {
                return std::isspace(c) != 0;
              }).base();
  std::string out = first < last ? std::string(first, last) : std::string();
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return out;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: build and wire, no threads yet
// -----------------------------------------------------------------------------
TradingEngine::TradingEngine(EngineConfig config,
                             SimulationTimeProvider* sim_clock,
                             IOrderTransport* transport)
    : config_(std::move(config)),
      sim_clock_(sim_clock),
      clock_(sim_clock != nullptr
                 ? static_cast<const ITimeProvider&>(*sim_clock)
                 : static_cast<const ITimeProvider&>(live_clock_)),
      transport_(transport) {
  // ---  1) Outbound sinks ----------------------------------------------------
  std::vector<IMetricsSink*> metric_sinks{&metrics_};
  std::vector<ITradeSink*> trade_sinks;

  if (!config_.telemetry_cmd_endpoint.empty() &&
      !config_.telemetry_pub_endpoint.empty()) {
    telemetry_ = std::make_unique<TelemetryServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.telemetry_cmd_endpoint, config_.telemetry_pub_endpoint);
    metric_sinks.push_back(telemetry_.get());
    trade_sinks.push_back(telemetry_.get());
  }
  if (!config_.trade_journal_path.empty()) {
    journal_ = std::make_unique<JsonlTradeSink>(config_.trade_journal_path);
    trade_sinks.push_back(journal_.get());
  }
  metrics_fanout_ = std::make_unique<MetricsFanout>(std::move(metric_sinks));
  trade_fanout_ = std::make_unique<TradeSinkFanout>(std::move(trade_sinks));

  // ---  2) Risk and execution state -------------------------------------------
  risk_ = std::make_unique<RiskManager>(config_.initial_capital, config_.risk,
                                        clock_, trade_fanout_.get(),
                                        metrics_fanout_.get());
  executor_ = std::make_unique<OrderExecutor>(
      *risk_, clock_, id_gen_, config_.executor, metrics_fanout_.get());

  if (transport_ == nullptr) {
    paper_transport_ = std::make_unique<PaperTransport>(clock_);
    transport_ = paper_transport_.get();
  }

  // ---  3) Processor and the components it drives ----------------------------
  processor_ = std::make_unique<TradeProcessor>(config_.processor, clock_,
                                                metrics_fanout_.get());
  fill_watcher_ = std::make_unique<FillWatcher>(
      [this](TradeRequest request) { processor_->submit(std::move(request)); });
  execution_ =
      std::make_unique<ExecutionHandler>(*executor_, *transport_, *fill_watcher_);
  decisions_ = std::make_unique<DecisionEngine>(*risk_, config_.strategy);

  // ---  4) Handlers, in dispatch order ---------------------------------------
  processor_->registerHandler<domain::SignalRequest>(
      "strategy.signal",
      [this](const domain::SignalRequest& r) { onSignal(r); });
  execution_->registerWith(*processor_);
  processor_->registerHandler("engine.snapshot",
                              [this](const TradeRequest&) { refreshSnapshot(); });
  refreshSnapshot();

  // ---  5) Signal intake ------------------------------------------------------
  if (!config_.signal_endpoint.empty()) {
    gateway_ = std::make_unique<SignalGateway>(
        [this](TradeRequest request) { processor_->submit(std::move(request)); },
        config_.signal_endpoint, sim_clock_);
  }
}

TradingEngine::~TradingEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TradingEngine::start() {
  if (running_) {
    return;
  }

  if (telemetry_) {
    telemetry_->start();
  }
  fill_watcher_->start();
  processor_->start();

  // Signals last: every consumer is live before the first one arrives.
  if (gateway_) {
    gateway_->start();
  }

  running_ = true;
  std::cout << "[TradingEngine] started. capital=" << config_.initial_capital
            << (gateway_ ? " signals=" + config_.signal_endpoint : "")
            << (telemetry_ ? " telemetry=on" : "") << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void TradingEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) No new signals ------------------------------------------------------
  if (gateway_) {
    gateway_->stop();
  }

  // ---  2) Consumer thread, then the watcher feeding it -----------------------
  processor_->stop();
  fill_watcher_->stop();

  // ---  3) Telemetry last so the final counters are published ----------------
  if (telemetry_) {
    telemetry_->stop();
  }

  running_ = false;
  std::cout << "[TradingEngine] stopped. All threads joined.\n";
}

void TradingEngine::submit(TradeRequest request) {
  processor_->submit(std::move(request));
}

void TradingEngine::pushSignal(domain::SignalSnapshot snapshot) {
  processor_->submit(domain::SignalRequest{std::move(snapshot)});
}

// -----------------------------------------------------------------------------
// onSignal(): observe, decide, and turn the decision into an order request
// -----------------------------------------------------------------------------
void TradingEngine::onSignal(const domain::SignalRequest& request) {
  const domain::SignalSnapshot& snapshot = request.snapshot;
  decisions_->observe(snapshot);

  auto decision = decisions_->evaluate(snapshot, risk_->capital().current);
  if (!decision) {
    return;
  }

  domain::PlaceOrderRequest order;
  order.symbol = snapshot.symbol;
  order.intent = decision->intent;
  order.position_side = decision->side;
  order.price = decision->price;
  order.quantity = decision->quantity;
  order.stop_loss = decision->stop_loss;
  order.take_profit = decision->take_profit;
  order.reason = decision->reason;

  std::cout << "[TradingEngine] " << domain::toString(order.intent) << " "
            << domain::toString(order.position_side) << " " << order.symbol
            << " @ " << order.price << " (" << order.reason << ")\n";
  processor_->submit(std::move(order));
}

void TradingEngine::refreshSnapshot() {
  RiskMetrics metrics = risk_->riskMetrics();
  std::vector<domain::Position> positions = risk_->positions();
  std::lock_guard lock(snapshot_mutex_);
  risk_snapshot_ = std::move(metrics);
  position_snapshot_ = std::move(positions);
}

RiskMetrics TradingEngine::riskSnapshot() const {
  std::lock_guard lock(snapshot_mutex_);
  return risk_snapshot_;
}

std::vector<domain::Position> TradingEngine::positionSnapshot() const {
  std::lock_guard lock(snapshot_mutex_);
  return position_snapshot_;
}

// -----------------------------------------------------------------------------
// executeCommand(): operator commands
// -----------------------------------------------------------------------------
std::string TradingEngine::executeCommand(const std::string& cmd) {
  nlohmann::json response;
  const std::string command = normalizeCommand(cmd);

  if (command == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (command == "STATUS") {
    RiskMetrics m = riskSnapshot();
    response["status"] = "ok";
    response["running"] = running_;
    response["halted"] = risk_->isHalted();
    response["capital"] = m.capital;
    response["peak_capital"] = m.peak_capital;
    response["drawdown"] = m.drawdown;
    response["total_exposure"] = m.total_exposure;
    response["daily_pnl"] = m.daily_pnl;
    response["unrealized_pnl"] = m.unrealized_pnl;
    response["daily_trades"] = m.daily_trades;
    response["closed_trades"] = m.closed_trades;
    response["win_rate"] = m.win_rate;
    if (m.sharpe_ratio) {
      response["sharpe_ratio"] = *m.sharpe_ratio;
    }

    nlohmann::json positions = nlohmann::json::array();
    for (const auto& pos : positionSnapshot()) {
      nlohmann::json p;
      p["symbol"] = pos.symbol;
      p["side"] = domain::toString(pos.side);
      p["entry_price"] = pos.entry_price;
      p["quantity"] = pos.quantity;
      p["value"] = pos.value();
      auto unrealized = m.unrealized_by_symbol.find(pos.symbol);
      if (unrealized != m.unrealized_by_symbol.end()) {
        p["unrealized_pnl"] = unrealized->second;
      }
      positions.push_back(std::move(p));
    }
    response["positions"] = std::move(positions);

    nlohmann::json proc;
    proc["queue_size"] = processor_->queueSize();
    proc["processed"] = processor_->processedCount();
    proc["failed"] = processor_->failedCount();
    proc["rejected"] = processor_->rejectedCount();
    proc["dropped"] = processor_->droppedCount();
    proc["circuit_open"] = processor_->breakerState().open;
    response["processor"] = std::move(proc);
  } else if (command == "HALT") {
    risk_->halt();
    response["status"] = "ok";
    response["response"] = "Trading halted";
  } else if (command == "RESUME") {
    risk_->resume();
    response["status"] = "ok";
    response["response"] = "Trading resumed";
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump(-1, ' ', false,
                       nlohmann::json::error_handler_t::replace);
}

}  // namespace tradegate
