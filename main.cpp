// -----------------------------------------------------------------------------
// tradegate — single executable entry point.
//
//   tradegate backtest <bars.json> [config.json] [SYMBOL]
//       Replays a bar series through the decision and risk logic and prints
//       the trades, equity curve and metrics as JSON on stdout.
//
//   tradegate paper [config.json]
//       Runs the live pipeline against the PaperTransport. Signals arrive
//       on the configured SUB endpoint; operator commands and telemetry use
//       the TelemetryServer endpoints. Runs until Ctrl-C.
//
// A config that fails validateConfig() is refused before anything starts.
// -----------------------------------------------------------------------------

#include "tradegate/backtest/backtest_engine.hpp"
#include "tradegate/backtest/bar_loader.hpp"
#include "tradegate/config/config_loader.hpp"
#include "tradegate/engine/trading_engine.hpp"
#include "tradegate/persistence/jsonl_trade_sink.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

namespace {

// Set by the SIGINT handler, polled by runPaper(). The only global.
volatile std::sig_atomic_t g_shutdown_requested = 0;

void sigint_handler(int /*signum*/) { g_shutdown_requested = 1; }

void printUsage() {
  std::cerr << "usage:\n"
            << "  tradegate backtest <bars.json> [config.json] [SYMBOL]\n"
            << "  tradegate paper [config.json]\n";
}

// Loads (or defaults) the config and refuses it on validation errors.
bool loadValidConfig(int argc, char** argv, int index,
                     tradegate::EngineConfig& out) {
  if (argc > index) {
    out = tradegate::loadConfigFromFile(argv[index]);
  }
  tradegate::ConfigValidation check = tradegate::validateConfig(out);
  for (const auto& w : check.warnings) {
    std::cerr << "[main] config warning: " << w << "\n";
  }
  for (const auto& e : check.errors) {
    std::cerr << "[main] config error: " << e << "\n";
  }
  return check.ok();
}

nlohmann::json optionalToJson(const std::optional<double>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

int runBacktest(int argc, char** argv) {
  if (argc < 3) {
    printUsage();
    return 2;
  }
  tradegate::EngineConfig config;
  if (!loadValidConfig(argc, argv, 3, config)) {
    return 1;
  }

  auto bars = tradegate::loadBarsFromFile(argv[2]);
  std::string symbol;
  if (argc > 4) {
    symbol = argv[4];
  } else if (!bars.empty() && !bars.front().symbol.empty()) {
    symbol = bars.front().symbol;
  } else {
    symbol = "ASSET";
  }

  tradegate::BacktestEngine engine(config.backtest, config.risk,
                                   config.strategy);
  tradegate::BacktestResult result = engine.run(symbol, bars);
  const auto& m = result.metrics;

  nlohmann::json report;
  report["symbol"] = result.symbol;
  report["metrics"] = {
      {"total_trades", m.total_trades},
      {"winning_trades", m.winning_trades},
      {"losing_trades", m.losing_trades},
      {"total_pnl", m.total_pnl},
      {"realized_return", m.realized_return},
      {"final_capital", m.final_capital},
      {"win_rate", m.win_rate},
      {"avg_win", m.avg_win},
      {"avg_loss", m.avg_loss},
      {"profit_factor", optionalToJson(m.profit_factor)},
      {"sharpe_ratio", optionalToJson(m.sharpe_ratio)},
      {"sortino_ratio", optionalToJson(m.sortino_ratio)},
      {"max_drawdown", m.max_drawdown},
      {"avg_trade_duration_hours", optionalToJson(m.avg_trade_duration_hours)},
  };
  nlohmann::json trades = nlohmann::json::array();
  for (const auto& t : result.trades) {
    trades.push_back(tradegate::JsonlTradeSink::toJson(t));
  }
  report["trades"] = std::move(trades);
  report["equity_curve"] = result.equity_curve;

  std::cout << report.dump(2) << "\n";
  return 0;
}

int runPaper(int argc, char** argv) {
  tradegate::EngineConfig config;
  if (!loadValidConfig(argc, argv, 2, config)) {
    return 1;
  }

  tradegate::TradingEngine engine(config);
  std::signal(SIGINT, sigint_handler);
  engine.start();

  std::cout << "[main] paper trading. Signals on " << config.signal_endpoint
            << ", commands on " << config.telemetry_cmd_endpoint << "\n"
            << "[main] Press Ctrl-C to shut down.\n";

  while (g_shutdown_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] SIGINT received. Stopping engine...\n";
  engine.stop();
  std::cout << engine.executeCommand("STATUS") << "\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    printUsage();
    return 2;
  }

  const std::string mode = argv[1];
  try {
    if (mode == "backtest") {
      return runBacktest(argc, argv);
    }
    if (mode == "paper") {
      return runPaper(argc, argv);
    }
  } catch (const std::exception& e) {
    std::cerr << "[main] fatal: " << e.what() << "\n";
    return 1;
  }

  printUsage();
  return 2;
}
