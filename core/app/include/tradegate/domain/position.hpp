#pragma once

#include "tradegate/domain/order.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace tradegate {
namespace domain {

// -----------------------------------------------------------------------------
// Position — one open exposure held by a RiskManager
// -----------------------------------------------------------------------------
//
// @brief  Open position on a single symbol. At most one per symbol.
//
// @details
// Created by RiskManager::open() and owned exclusively by the RiskManager
// that opened it. The only mutation after creation is attaching or moving
// the protective levels. RiskManager::close() removes it and emits exactly
// one ClosedTrade.
//
// entry_fee is the fee already deducted from capital when the position was
// opened; close() subtracts it again from the trade's realized P&L so the
// ClosedTrade reports the net result of the round trip.
// -----------------------------------------------------------------------------
struct Position {
  std::string symbol;
  PositionSide side{PositionSide::Long};
  double entry_price{0.0};
  double quantity{0.0};
  std::int64_t opened_ms{0};
  std::optional<double> stop_loss;
  std::optional<double> take_profit;
  double entry_fee{0.0};

  // Notional value at entry. Exposure limits are measured in these terms.
  double value() const { return entry_price * quantity; }
};

}  // namespace domain
}  // namespace tradegate
