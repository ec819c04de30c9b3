#pragma once

#include <cstddef>

namespace tradegate {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLimits — session-wide risk thresholds
// -----------------------------------------------------------------------------
//
// @brief  Immutable collection of parameters that govern every pre-trade
//         check, stop/target placement and position sizing.
//
// @details
// All "fraction" fields are fractions of current capital (0.1 == 10%).
// Loaded from the "risk" section of the JSON config by ConfigLoader and
// validated by validateConfig() before the engine starts. Copied by value
// into each RiskManager; a backtest gets its own copy.
//
// Defaults are the conservative profile the engine ships with.
// -----------------------------------------------------------------------------
struct RiskLimits {
  /// Largest single position, as notional / capital.
  double max_position_fraction{0.1};

  /// Sum of all open notionals (including a proposed one) / capital.
  double max_total_exposure{0.5};

  /// No new position while (peak - current) / peak exceeds this.
  double max_drawdown{0.15};

  /// Capital put at risk between entry and stop on each trade.
  double risk_per_trade{0.02};

  /// Opens allowed per UTC day.
  int max_daily_trades{10};

  /// Loss allowed per UTC day, as a fraction of capital at the day's start.
  double max_daily_loss{0.05};

  /// |Pearson correlation| above which a new symbol is refused when it moves
  /// with an already-open one.
  double correlation_threshold{0.7};

  /// Acceptable band for the latest recorded volatility of a symbol.
  double min_volatility{0.01};
  double max_volatility{0.05};

  /// Minimum mean recorded liquidity (quote-currency volume).
  double min_liquidity{1'000'000.0};

  /// Minimum seconds between two opens on the same symbol.
  double min_trade_interval_s{300.0};

  /// ATR lookback and the multiples used for stops and targets.
  int atr_period{14};
  double stop_loss_atr_multiplier{2.0};
  double take_profit_atr_multiplier{3.0};

  /// Observations the correlation check looks back over. Fewer recorded
  /// prices than this means the check passes.
  std::size_t correlation_window{30};

  /// Depth of each per-symbol rolling history.
  std::size_t history_depth{100};
};

}  // namespace domain
}  // namespace tradegate
