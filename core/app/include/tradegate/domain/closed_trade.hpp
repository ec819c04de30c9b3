#pragma once

#include "tradegate/domain/order.hpp"

#include <cstdint>
#include <string>

namespace tradegate {
namespace domain {

// -----------------------------------------------------------------------------
// ClosedTrade — immutable record of a completed round trip
// -----------------------------------------------------------------------------
// Appended to the RiskManager's trade history on every close and forwarded
// to the ITradeSink. pnl is net: gross price move times quantity, minus the
// entry and exit fees (fees holds their sum). reason records what closed it
// ("signal", "stop_loss", "take_profit", "backtest_end", "manual").
// -----------------------------------------------------------------------------
struct ClosedTrade {
  std::string symbol;
  PositionSide side{PositionSide::Long};
  double entry_price{0.0};
  double exit_price{0.0};
  double quantity{0.0};
  std::int64_t entry_ms{0};
  std::int64_t exit_ms{0};
  double pnl{0.0};
  double fees{0.0};
  std::string reason;
};

}  // namespace domain
}  // namespace tradegate
