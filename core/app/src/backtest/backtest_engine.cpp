#include "tradegate/backtest/backtest_engine.hpp"
#include "tradegate/domain/errors.hpp"
#include "tradegate/risk/risk_manager.hpp"
#include "tradegate/strategy/decision_engine.hpp"
#include "tradegate/time/simulation_time_provider.hpp"
#include "tradegate/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <iterator>
#include <sstream>

namespace tradegate {

namespace {

// Sample standard deviation (n − 1). nullopt below two values.
std::optional<double> sampleStd(const std::vector<double>& xs) {
  if (xs.size() < 2) {
    return std::nullopt;
  }
  double mean = 0.0;
  for (double x : xs) {
    mean += x;
  }
  mean /= static_cast<double>(xs.size());
  double ss = 0.0;
  for (double x : xs) {
    ss += (x - mean) * (x - mean);
  }
  return std::sqrt(ss / static_cast<double>(xs.size() - 1));
}

}  // namespace

BacktestEngine::BacktestEngine(const BacktestConfig& config,
                               const domain::RiskLimits& limits,
                               const StrategyConfig& strategy)
    : config_(config), limits_(limits), strategy_(strategy) {}

// -----------------------------------------------------------------------------
// run(): validate, then replay bar by bar
// -----------------------------------------------------------------------------
BacktestResult BacktestEngine::run(
    const std::string& symbol,
    const std::vector<domain::SignalSnapshot>& bars,
    std::optional<std::int64_t> start_ms,
    std::optional<std::int64_t> end_ms) const {
  validate(bars, start_ms, end_ms);

  std::vector<const domain::SignalSnapshot*> window;
  for (const auto& bar : bars) {
    if ((!start_ms || bar.timestamp_ms >= *start_ms) &&
        (!end_ms || bar.timestamp_ms <= *end_ms)) {
      window.push_back(&bar);
    }
  }
  if (window.empty()) {
    throw BacktestDataError("no bars inside the requested window");
  }

  // --- Private state for this run -------------------------------------------
  SimulationTimeProvider clock(window.front()->timestamp_ms);
  RiskManager risk(config_.initial_capital, limits_, clock);
  DecisionEngine decisions(risk, strategy_);

  BacktestResult result;
  result.symbol = symbol;
  result.equity_curve.reserve(window.size() + 1);
  result.equity_curve.push_back(config_.initial_capital);

  std::cout << "[BacktestEngine] replaying " << window.size() << " bar(s) of "
            << symbol << " from capital " << config_.initial_capital << "\n";

  for (const domain::SignalSnapshot* raw : window) {
    domain::SignalSnapshot bar = *raw;
    bar.symbol = symbol;
    clock.advance_time(bar.timestamp_ms);
    decisions.observe(bar);

    double capital = risk.capital().current;
    if (auto decision = decisions.evaluate(bar, capital)) {
      if (decision->intent == domain::OrderIntent::Close) {
        double fee = config_.fee_rate * bar.price * decision->quantity;
        risk.close(symbol, bar.price, bar.timestamp_ms, fee, decision->reason);
      } else {
        domain::RiskDecision gate =
            risk.canOpen(symbol, decision->price, decision->quantity);
        if (gate.allowed()) {
          OpenParams params;
          params.symbol = symbol;
          params.side = decision->side;
          params.price = decision->price;
          params.quantity = decision->quantity;
          params.timestamp_ms = bar.timestamp_ms;
          params.stop_loss = decision->stop_loss;
          params.take_profit = decision->take_profit;
          params.entry_fee =
              config_.fee_rate * decision->price * decision->quantity;
          risk.open(params);
        }
      }
    }

    result.equity_curve.push_back(risk.capital().current);
  }

  // --- Force-close whatever is still open ------------------------------------
  if (auto pos = risk.position(symbol)) {
    const domain::SignalSnapshot& last = *window.back();
    double fee = config_.fee_rate * last.price * pos->quantity;
    risk.close(symbol, last.price, last.timestamp_ms, fee, "backtest_end");
    result.equity_curve.back() = risk.capital().current;
  }

  result.trades = risk.closedTrades();
  result.metrics = computeMetrics(result.trades, result.equity_curve);

  std::cout << "[BacktestEngine] done: " << result.metrics.total_trades
            << " trade(s), final capital " << result.metrics.final_capital
            << "\n";
  return result;
}

// -----------------------------------------------------------------------------
// validate(): whole-run input checks
// -----------------------------------------------------------------------------
void BacktestEngine::validate(const std::vector<domain::SignalSnapshot>& bars,
                              std::optional<std::int64_t> start_ms,
                              std::optional<std::int64_t> end_ms) {
  if (bars.empty()) {
    throw BacktestDataError("bar series is empty");
  }
  if (start_ms && end_ms && *start_ms > *end_ms) {
    throw BacktestDataError("start is after end");
  }
  for (std::size_t i = 0; i < bars.size(); ++i) {
    if (!(bars[i].price > 0.0) || !std::isfinite(bars[i].price)) {
      std::ostringstream os;
      os << "bar " << i << " has non-positive price " << bars[i].price;
      throw BacktestDataError(os.str());
    }
    if (i > 0 && bars[i].timestamp_ms <= bars[i - 1].timestamp_ms) {
      std::ostringstream os;
      os << "timestamps do not increase at bar " << i;
      throw BacktestDataError(os.str());
    }
  }
}

// -----------------------------------------------------------------------------
// computeMetrics()
// -----------------------------------------------------------------------------
BacktestMetrics BacktestEngine::computeMetrics(
    const std::vector<domain::ClosedTrade>& trades,
    const std::vector<double>& equity_curve) const {
  BacktestMetrics m;
  m.total_trades = trades.size();
  m.final_capital =
      equity_curve.empty() ? config_.initial_capital : equity_curve.back();
  if (config_.initial_capital > 0.0) {
    m.realized_return =
        (m.final_capital - config_.initial_capital) / config_.initial_capital;
  }

  // --- Trade statistics -------------------------------------------------------
  double gross_win = 0.0;
  double gross_loss = 0.0;
  double total_hours = 0.0;
  for (const auto& t : trades) {
    m.total_pnl += t.pnl;
    if (t.pnl > 0.0) {
      ++m.winning_trades;
      gross_win += t.pnl;
    } else if (t.pnl < 0.0) {
      ++m.losing_trades;
      gross_loss += t.pnl;
    }
    total_hours += ms_to_hours(t.exit_ms - t.entry_ms);
  }
  if (!trades.empty()) {
    m.win_rate = static_cast<double>(m.winning_trades) /
                 static_cast<double>(trades.size());
    m.avg_trade_duration_hours =
        total_hours / static_cast<double>(trades.size());
  }
  if (m.winning_trades > 0) {
    m.avg_win = gross_win / static_cast<double>(m.winning_trades);
  }
  if (m.losing_trades > 0) {
    m.avg_loss = gross_loss / static_cast<double>(m.losing_trades);
    m.profit_factor = gross_win / -gross_loss;
  }

  // --- Per-bar returns --------------------------------------------------------
  std::vector<double> returns;
  for (std::size_t i = 1; i < equity_curve.size(); ++i) {
    if (equity_curve[i - 1] != 0.0) {
      returns.push_back(equity_curve[i] / equity_curve[i - 1] - 1.0);
    }
  }

  // Max drawdown of cumulative returns against their running peak.
  double cumulative = 1.0;
  double running_peak = 1.0;
  for (double r : returns) {
    cumulative *= 1.0 + r;
    running_peak = std::max(running_peak, cumulative);
    if (running_peak > 0.0) {
      m.max_drawdown =
          std::max(m.max_drawdown, (running_peak - cumulative) / running_peak);
    }
  }

  if (returns.size() < 2) {
    return m;
  }

  double mean = 0.0;
  for (double r : returns) {
    mean += r;
  }
  mean /= static_cast<double>(returns.size());
  double excess = mean - config_.risk_free_rate / config_.periods_per_year;
  double annualize = std::sqrt(config_.periods_per_year);

  auto stddev = sampleStd(returns);
  if (stddev && *stddev > 0.0) {
    m.sharpe_ratio = annualize * excess / *stddev;
  }

  std::vector<double> downside;
  std::copy_if(returns.begin(), returns.end(), std::back_inserter(downside),
               [](double r) { return r < 0.0; });
  auto downside_std = sampleStd(downside);
  if (downside_std && *downside_std > 0.0) {
    m.sortino_ratio = annualize * excess / *downside_std;
  }

  return m;
}

}  // namespace tradegate
