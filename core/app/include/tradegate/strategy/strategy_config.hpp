#pragma once

namespace tradegate {

// -----------------------------------------------------------------------------
// StrategyConfig — DecisionEngine parameters
// -----------------------------------------------------------------------------
struct StrategyConfig {
  /// Stop distance, as a fraction of price, used while ATR is still warming
  /// up and the snapshot carries no volatility either.
  double fallback_stop_fraction{0.05};
};

}  // namespace tradegate
