#include "tradegate/config/config_loader.hpp"
#include "tradegate/domain/errors.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace tradegate {

namespace {

// Overwrites `field` when `key` is present in `section`.
template <typename T>
void readField(const nlohmann::json& section, const char* key, T& field) {
  auto it = section.find(key);
  if (it != section.end()) {
    field = it->template get<T>();
  }
}

const nlohmann::json& sectionOf(const nlohmann::json& root, const char* name) {
  static const nlohmann::json kEmpty = nlohmann::json::object();
  auto it = root.find(name);
  if (it == root.end()) {
    return kEmpty;
  }
  if (!it->is_object()) {
    throw ConfigError(std::string("section '") + name + "' must be an object");
  }
  return *it;
}

std::string percent(double fraction) {
  std::ostringstream os;
  os.precision(3);
  os << fraction * 100.0 << "%";
  return os.str();
}

// One row of the safe-limit table: above `error_at` is an error, above
// `warn_at` a warning.
void checkUpperBound(ConfigValidation& out, const std::string& what,
                     double value, double error_at, double warn_at) {
  if (value > error_at) {
    out.errors.push_back(what + " " + percent(value) +
                         " exceeds safe limit of " + percent(error_at));
  } else if (value > warn_at) {
    out.warnings.push_back(what + " " + percent(value) +
                           " is higher than recommended " + percent(warn_at));
  }
}

void requirePositive(ConfigValidation& out, const std::string& what,
                     double value) {
  if (!(value > 0.0)) {
    out.errors.push_back(what + " must be positive");
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// loadConfigFromFile()
// -----------------------------------------------------------------------------
EngineConfig loadConfigFromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw ConfigError("cannot open config file: " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return parseConfig(buffer.str());
}

// -----------------------------------------------------------------------------
// parseConfig()
// -----------------------------------------------------------------------------
EngineConfig parseConfig(const std::string& json_text) {
  EngineConfig cfg;
  try {
    auto root = nlohmann::json::parse(json_text);
    if (!root.is_object()) {
      throw ConfigError("config root must be a JSON object");
    }

    readField(root, "initial_capital", cfg.initial_capital);
    readField(root, "trade_journal_path", cfg.trade_journal_path);
    cfg.backtest.initial_capital = cfg.initial_capital;

    const auto& risk = sectionOf(root, "risk");
    readField(risk, "max_position_fraction", cfg.risk.max_position_fraction);
    readField(risk, "max_total_exposure", cfg.risk.max_total_exposure);
    readField(risk, "max_drawdown", cfg.risk.max_drawdown);
    readField(risk, "risk_per_trade", cfg.risk.risk_per_trade);
    readField(risk, "max_daily_trades", cfg.risk.max_daily_trades);
    readField(risk, "max_daily_loss", cfg.risk.max_daily_loss);
    readField(risk, "correlation_threshold", cfg.risk.correlation_threshold);
    readField(risk, "min_volatility", cfg.risk.min_volatility);
    readField(risk, "max_volatility", cfg.risk.max_volatility);
    readField(risk, "min_liquidity", cfg.risk.min_liquidity);
    readField(risk, "min_trade_interval_s", cfg.risk.min_trade_interval_s);
    readField(risk, "atr_period", cfg.risk.atr_period);
    readField(risk, "stop_loss_atr_multiplier",
              cfg.risk.stop_loss_atr_multiplier);
    readField(risk, "take_profit_atr_multiplier",
              cfg.risk.take_profit_atr_multiplier);
    readField(risk, "correlation_window", cfg.risk.correlation_window);
    readField(risk, "history_depth", cfg.risk.history_depth);

    const auto& exec = sectionOf(root, "executor");
    readField(exec, "max_slippage", cfg.executor.max_slippage);
    readField(exec, "min_order_interval_s", cfg.executor.min_order_interval_s);
    readField(exec, "fee_rate", cfg.executor.fee_rate);
    readField(exec, "pending_timeout_s", cfg.executor.pending_timeout_s);

    const auto& proc = sectionOf(root, "processor");
    readField(proc, "rate_per_second", cfg.processor.rate_per_second);
    readField(proc, "burst", cfg.processor.burst);
    readField(proc, "failure_threshold", cfg.processor.failure_threshold);
    readField(proc, "reset_timeout_s", cfg.processor.reset_timeout_s);
    readField(proc, "retry_backoff_ms", cfg.processor.retry_backoff_ms);
    readField(proc, "rate_limit_wait_ms", cfg.processor.rate_limit_wait_ms);

    const auto& bt = sectionOf(root, "backtest");
    readField(bt, "initial_capital", cfg.backtest.initial_capital);
    readField(bt, "fee_rate", cfg.backtest.fee_rate);
    readField(bt, "periods_per_year", cfg.backtest.periods_per_year);
    readField(bt, "risk_free_rate", cfg.backtest.risk_free_rate);

    const auto& strat = sectionOf(root, "strategy");
    readField(strat, "fallback_stop_fraction",
              cfg.strategy.fallback_stop_fraction);

    const auto& net = sectionOf(root, "network");
    readField(net, "signal_endpoint", cfg.signal_endpoint);
    readField(net, "telemetry_cmd_endpoint", cfg.telemetry_cmd_endpoint);
    readField(net, "telemetry_pub_endpoint", cfg.telemetry_pub_endpoint);
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("malformed config: ") + e.what());
  }
  return cfg;
}

// -----------------------------------------------------------------------------
// validateConfig()
// -----------------------------------------------------------------------------
ConfigValidation validateConfig(const EngineConfig& config) {
  ConfigValidation out;
  const auto& r = config.risk;

  // --- Safe-limit table ------------------------------------------------------
  checkUpperBound(out, "Max position size", r.max_position_fraction, 0.2, 0.1);
  checkUpperBound(out, "Max total exposure", r.max_total_exposure, 0.8, 0.5);
  checkUpperBound(out, "Max drawdown", r.max_drawdown, 0.2, 0.1);
  checkUpperBound(out, "Risk per trade", r.risk_per_trade, 0.05, 0.02);

  if (r.min_trade_interval_s < 60.0) {
    out.errors.push_back("Minimum trade interval " +
                         std::to_string(r.min_trade_interval_s) +
                         "s is too low, should be at least 60s");
  } else if (r.min_trade_interval_s < 300.0) {
    out.warnings.push_back("Minimum trade interval " +
                           std::to_string(r.min_trade_interval_s) +
                           "s is lower than recommended 300s");
  }

  if (r.max_daily_trades > 50) {
    out.errors.push_back("Maximum daily trades " +
                         std::to_string(r.max_daily_trades) +
                         " exceeds safe limit of 50");
  } else if (r.max_daily_trades > 20) {
    out.warnings.push_back("Maximum daily trades " +
                           std::to_string(r.max_daily_trades) +
                           " is higher than recommended 20");
  }

  // --- Structural ------------------------------------------------------------
  requirePositive(out, "initial_capital", config.initial_capital);
  requirePositive(out, "backtest.initial_capital",
                  config.backtest.initial_capital);
  requirePositive(out, "risk.max_position_fraction", r.max_position_fraction);
  requirePositive(out, "risk.max_total_exposure", r.max_total_exposure);
  requirePositive(out, "risk.max_drawdown", r.max_drawdown);
  requirePositive(out, "risk.risk_per_trade", r.risk_per_trade);
  requirePositive(out, "risk.max_daily_loss", r.max_daily_loss);
  requirePositive(out, "risk.stop_loss_atr_multiplier",
                  r.stop_loss_atr_multiplier);
  requirePositive(out, "risk.take_profit_atr_multiplier",
                  r.take_profit_atr_multiplier);
  if (r.max_daily_trades < 1) {
    out.errors.push_back("risk.max_daily_trades must be at least 1");
  }
  if (r.atr_period < 1) {
    out.errors.push_back("risk.atr_period must be at least 1");
  }
  if (r.min_volatility > r.max_volatility) {
    out.errors.push_back("risk.min_volatility is above risk.max_volatility");
  }
  if (r.history_depth < r.correlation_window) {
    out.errors.push_back(
        "risk.history_depth is shorter than risk.correlation_window");
  }

  requirePositive(out, "processor.rate_per_second",
                  config.processor.rate_per_second);
  if (config.processor.burst < 1.0) {
    out.errors.push_back("processor.burst must be at least 1");
  }
  if (config.processor.failure_threshold < 1) {
    out.errors.push_back("processor.failure_threshold must be at least 1");
  }
  if (config.processor.reset_timeout_s < 0.0 ||
      config.processor.retry_backoff_ms < 0 ||
      config.processor.rate_limit_wait_ms < 0) {
    out.errors.push_back("processor timings must not be negative");
  }

  if (config.executor.fee_rate < 0.0 || config.backtest.fee_rate < 0.0) {
    out.errors.push_back("fee rates must not be negative");
  }
  if (config.executor.max_slippage < 0.0) {
    out.errors.push_back("executor.max_slippage must not be negative");
  }
  requirePositive(out, "executor.pending_timeout_s",
                  config.executor.pending_timeout_s);
  requirePositive(out, "backtest.periods_per_year",
                  config.backtest.periods_per_year);

  double f = config.strategy.fallback_stop_fraction;
  if (!(f > 0.0 && f < 1.0)) {
    out.errors.push_back("strategy.fallback_stop_fraction must be in (0, 1)");
  }

  return out;
}

}  // namespace tradegate
