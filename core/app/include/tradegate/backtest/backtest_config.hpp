#pragma once

namespace tradegate {

// -----------------------------------------------------------------------------
// BacktestConfig — replay parameters
// -----------------------------------------------------------------------------
struct BacktestConfig {
  double initial_capital{100.0};

  /// Proportional fee on every simulated fill (entry and exit).
  double fee_rate{0.0005};

  /// Annualization of per-bar returns for Sharpe and Sortino.
  double periods_per_year{252.0};

  /// Annual risk-free rate; each bar's share is subtracted from returns.
  double risk_free_rate{0.02};
};

}  // namespace tradegate
