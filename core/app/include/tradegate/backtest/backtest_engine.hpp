#pragma once

#include "tradegate/backtest/backtest_config.hpp"
#include "tradegate/domain/closed_trade.hpp"
#include "tradegate/domain/risk_limits.hpp"
#include "tradegate/domain/signal_snapshot.hpp"
#include "tradegate/strategy/strategy_config.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tradegate {

// -----------------------------------------------------------------------------
// BacktestMetrics — performance summary of one replay
// -----------------------------------------------------------------------------
// max_drawdown is reported as a magnitude, never negative: it is
// -min((cum - running_max) / running_max) over the cumulative-return series,
// so 0.1 means the worst fall was 10% below the running peak. Ratios are unavailable (nullopt) with fewer than two per-bar
// returns, a zero spread, or (Sortino) fewer than two negative returns.
// -----------------------------------------------------------------------------
struct BacktestMetrics {
  std::size_t total_trades{0};
  std::size_t winning_trades{0};
  std::size_t losing_trades{0};
  double total_pnl{0.0};      // Sum of net trade P&L
  double realized_return{0.0};  // (final − initial) / initial
  double final_capital{0.0};
  double win_rate{0.0};
  double avg_win{0.0};
  double avg_loss{0.0};
  std::optional<double> profit_factor;
  std::optional<double> sharpe_ratio;
  std::optional<double> sortino_ratio;
  double max_drawdown{0.0};  // >= 0; see above
  std::optional<double> avg_trade_duration_hours;
};

struct BacktestResult {
  std::string symbol;
  std::vector<domain::ClosedTrade> trades;
  std::vector<double> equity_curve;  // Initial capital, then one per bar
  BacktestMetrics metrics;
};

// -----------------------------------------------------------------------------
// BacktestEngine — deterministic replay of the live decision logic
// -----------------------------------------------------------------------------
//
// @brief  Replays a bar series through a private RiskManager and
//         DecisionEngine and reports the resulting trades and statistics.
//
// @details
// Each run() builds fresh state: a SimulationTimeProvider, a RiskManager
// starting at initial_capital with the configured limits, and a
// DecisionEngine over them. Nothing is shared with a live engine or with
// other runs, so replays are repeatable and may run concurrently on
// separate BacktestEngine instances.
//
// Per bar inside [start_ms, end_ms]:
//   1) advance the clock to the bar and observe it
//   2) holding → close on a protective level or exit rule
//      flat     → on an entry rule, canOpen() with the sized quantity and
//                 open if allowed
//   3) every fill pays fee_rate × notional
//   4) append capital to the equity curve
// A position still open after the last bar is closed at that bar's price
// with reason "backtest_end", and the last equity point is updated to the
// capital after that close.
//
// @throws BacktestDataError  for an empty series, timestamps that do not
//         strictly increase, a non-positive price, start > end, or a window
//         containing no bars. The run produces no partial result.
// -----------------------------------------------------------------------------
class BacktestEngine {
 public:
  BacktestEngine(const BacktestConfig& config,
                 const domain::RiskLimits& limits,
                 const StrategyConfig& strategy = StrategyConfig{});

  BacktestResult run(const std::string& symbol,
                     const std::vector<domain::SignalSnapshot>& bars,
                     std::optional<std::int64_t> start_ms = std::nullopt,
                     std::optional<std::int64_t> end_ms = std::nullopt) const;

  // Statistics over a finished replay. Public so the formulas can be
  // checked on hand-built curves.
  BacktestMetrics computeMetrics(const std::vector<domain::ClosedTrade>& trades,
                                 const std::vector<double>& equity_curve) const;

 private:
  static void validate(const std::vector<domain::SignalSnapshot>& bars,
                       std::optional<std::int64_t> start_ms,
                       std::optional<std::int64_t> end_ms);

  BacktestConfig config_;
  domain::RiskLimits limits_;
  StrategyConfig strategy_;
};

}  // namespace tradegate
