#pragma once

#include "tradegate/backtest/backtest_config.hpp"
#include "tradegate/domain/risk_limits.hpp"
#include "tradegate/execution/executor_config.hpp"
#include "tradegate/processor/processor_config.hpp"
#include "tradegate/strategy/strategy_config.hpp"

#include <string>

namespace tradegate {

// -----------------------------------------------------------------------------
// EngineConfig — everything a process needs to bootstrap
// -----------------------------------------------------------------------------
//
// @brief  Aggregate of the per-component configs plus process-level
//         settings (starting capital, trade journal, endpoints).
//
// @details
// Built by parseConfig()/loadConfigFromFile() from JSON; every key is
// optional and missing keys keep the defaults below. An empty endpoint
// disables the corresponding ZMQ surface, and an empty journal path
// disables trade persistence.
// -----------------------------------------------------------------------------
struct EngineConfig {
  double initial_capital{100.0};

  domain::RiskLimits risk;
  ExecutorConfig executor;
  ProcessorConfig processor;
  BacktestConfig backtest;
  StrategyConfig strategy;

  /// JSON-lines file of closed trades. Empty = no journal.
  std::string trade_journal_path;

  /// SUB endpoint the SignalGateway connects to.
  std::string signal_endpoint{"tcp://127.0.0.1:5555"};

  /// REP (commands) and PUB (telemetry) endpoints of the TelemetryServer.
  std::string telemetry_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string telemetry_pub_endpoint{"tcp://127.0.0.1:5557"};
};

}  // namespace tradegate
