#pragma once

#include <string>
#include <utility>

namespace tradegate {
namespace domain {

// -----------------------------------------------------------------------------
// RiskRejection — why the risk gate said no
// -----------------------------------------------------------------------------
// None means the check passed. The remaining values are listed in the order
// RiskManager::canOpen() evaluates them; the first failing check wins.
// OrderThrottled and PendingOrder come from the OrderExecutor, which runs its
// own throttle before consulting the RiskManager.
// -----------------------------------------------------------------------------
enum class RiskRejection {
  None,
  InvalidOrder,
  Halted,
  DailyTradeLimit,
  DailyLossLimit,
  MaxDrawdown,
  PositionTooLarge,
  ExposureLimit,
  DuplicatePosition,
  CorrelationLimit,
  VolatilityOutOfRange,
  InsufficientLiquidity,
  TradeInterval,
  NoOpenPosition,
  OrderThrottled,
  PendingOrder,
};

inline const char* toString(RiskRejection r) {
  switch (r) {
    case RiskRejection::None:                  return "none";
    case RiskRejection::InvalidOrder:          return "invalid_order";
    case RiskRejection::Halted:                return "halted";
    case RiskRejection::DailyTradeLimit:       return "daily_trade_limit";
    case RiskRejection::DailyLossLimit:        return "daily_loss_limit";
    case RiskRejection::MaxDrawdown:           return "max_drawdown";
    case RiskRejection::PositionTooLarge:      return "position_too_large";
    case RiskRejection::ExposureLimit:         return "exposure_limit";
    case RiskRejection::DuplicatePosition:     return "duplicate_position";
    case RiskRejection::CorrelationLimit:      return "correlation_limit";
    case RiskRejection::VolatilityOutOfRange:  return "volatility_out_of_range";
    case RiskRejection::InsufficientLiquidity: return "insufficient_liquidity";
    case RiskRejection::TradeInterval:         return "trade_interval";
    case RiskRejection::NoOpenPosition:        return "no_open_position";
    case RiskRejection::OrderThrottled:        return "order_throttled";
    case RiskRejection::PendingOrder:          return "pending_order";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// RiskDecision — result of a pre-trade check
// -----------------------------------------------------------------------------
// A rejection is a value, never an exception. detail carries the numbers
// behind the verdict for logs and operators.
// -----------------------------------------------------------------------------
struct RiskDecision {
  RiskRejection rejection{RiskRejection::None};
  std::string detail;

  bool allowed() const { return rejection == RiskRejection::None; }

  static RiskDecision allow() { return {}; }
  static RiskDecision reject(RiskRejection r, std::string why) {
    return RiskDecision{r, std::move(why)};
  }
};

}  // namespace domain
}  // namespace tradegate
