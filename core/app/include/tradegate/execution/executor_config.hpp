#pragma once

namespace tradegate {

// -----------------------------------------------------------------------------
// ExecutorConfig — OrderExecutor policy
// -----------------------------------------------------------------------------
struct ExecutorConfig {
  /// Relative fill-vs-request price difference above which a fill is flagged.
  /// Advisory only: the fill is still applied.
  double max_slippage{0.001};

  /// Minimum seconds between two orders on the same symbol.
  double min_order_interval_s{60.0};

  /// Proportional fee charged on each fill's notional.
  double fee_rate{0.0};

  /// Seconds a Pending order may wait for its fill before it is failed.
  double pending_timeout_s{300.0};
};

}  // namespace tradegate
