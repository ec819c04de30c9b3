#pragma once

#include "tradegate/config/engine_config.hpp"

#include <string>
#include <vector>

namespace tradegate {

// -----------------------------------------------------------------------------
// Config loading
// -----------------------------------------------------------------------------
//
// Layout (all sections and keys optional):
//
//   {
//     "initial_capital": 100.0,
//     "trade_journal_path": "trades.jsonl",
//     "risk":      { "max_position_fraction": 0.1, ... RiskLimits fields },
//     "executor":  { "max_slippage": 0.001, "min_order_interval_s": 60,
//                    "fee_rate": 0.0, "pending_timeout_s": 300 },
//     "processor": { "rate_per_second": 10, "burst": 20,
//                    "failure_threshold": 5, "reset_timeout_s": 60,
//                    "retry_backoff_ms": 1000, "rate_limit_wait_ms": 100 },
//     "backtest":  { "initial_capital": ..., "fee_rate": 0.0005,
//                    "periods_per_year": 252, "risk_free_rate": 0.02 },
//     "strategy":  { "fallback_stop_fraction": 0.05 },
//     "network":   { "signal_endpoint": "...",
//                    "telemetry_cmd_endpoint": "...",
//                    "telemetry_pub_endpoint": "..." }
//   }
//
// backtest.initial_capital falls back to the top-level initial_capital.
// Unknown keys are ignored.
//
// @throws ConfigError  unreadable file, malformed JSON, or a key of the
//                      wrong type. Values are NOT range-checked here; run
//                      validateConfig() on the result.
// -----------------------------------------------------------------------------
EngineConfig loadConfigFromFile(const std::string& path);

EngineConfig parseConfig(const std::string& json_text);

// -----------------------------------------------------------------------------
// validateConfig()
// -----------------------------------------------------------------------------
// Errors make a config unusable; warnings are logged and tolerated.
//
//   risk.max_position_fraction   > 0.2 error, > 0.1 warning
//   risk.max_total_exposure      > 0.8 error, > 0.5 warning
//   risk.max_drawdown            > 0.2 error, > 0.1 warning
//   risk.risk_per_trade          > 0.05 error, > 0.02 warning
//   risk.min_trade_interval_s    < 60 error, < 300 warning
//   risk.max_daily_trades        > 50 error, > 20 warning
//
// plus structural errors: non-positive capital, fractions, periods or
// rates; min_volatility above max_volatility; fee or slippage below zero.
// -----------------------------------------------------------------------------
struct ConfigValidation {
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  bool ok() const { return errors.empty(); }
};

ConfigValidation validateConfig(const EngineConfig& config);

}  // namespace tradegate
