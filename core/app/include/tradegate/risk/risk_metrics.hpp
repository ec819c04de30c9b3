#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace tradegate {

// -----------------------------------------------------------------------------
// RiskMetrics — point-in-time portfolio statistics
// -----------------------------------------------------------------------------
// Produced by IRiskManager::riskMetrics(). Exposures are fractions of current
// capital. Unrealized P&L marks each open position at the last price given to
// recordPrice() for its symbol, or at its entry price when none was recorded.
// Optional fields are unavailable until enough history exists:
//   profit_factor      — needs at least one losing trade
//   avg_win_loss_ratio — needs at least one win and one loss
//   kelly_fraction     — same as avg_win_loss_ratio; half-Kelly, floored at 0
//   sharpe_ratio       — needs 30 closed trades spread over 2+ exit days and
//                        a non-zero spread of daily P&L
// -----------------------------------------------------------------------------
struct RiskMetrics {
  double capital{0.0};
  double peak_capital{0.0};
  std::map<std::string, double> exposure_by_symbol;
  double total_exposure{0.0};
  std::map<std::string, double> unrealized_by_symbol;
  double unrealized_pnl{0.0};
  double drawdown{0.0};
  double daily_pnl{0.0};
  int daily_trades{0};
  std::size_t open_positions{0};
  std::size_t closed_trades{0};
  double win_rate{0.0};
  std::optional<double> profit_factor;
  std::optional<double> avg_win_loss_ratio;
  std::optional<double> kelly_fraction;
  std::optional<double> sharpe_ratio;
  bool halted{false};
};

}  // namespace tradegate
