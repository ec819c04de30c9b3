#pragma once

#include "tradegate/domain/order_status.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace tradegate {
namespace domain {

// Unique, opaque order identifier issued by OrderIdGenerator. 0 means unset.
using OrderId = std::uint64_t;

// -----------------------------------------------------------------------------
// Side / PositionSide / OrderIntent
// -----------------------------------------------------------------------------
// Side is the direction of a single order on the wire. PositionSide is the
// direction of the exposure a position carries. OrderIntent says whether the
// order opens a new position or flattens an existing one. Opening a Long is a
// Buy; closing it is a Sell. Shorts mirror that.
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

enum class PositionSide {
  Long,
  Short,
};

enum class OrderIntent {
  Open,
  Close,
};

inline Side sideFor(OrderIntent intent, PositionSide position_side) {
  bool buy = (intent == OrderIntent::Open) ==
             (position_side == PositionSide::Long);
  return buy ? Side::Buy : Side::Sell;
}

inline const char* toString(Side s) {
  return s == Side::Buy ? "buy" : "sell";
}

inline const char* toString(PositionSide s) {
  return s == PositionSide::Long ? "long" : "short";
}

inline const char* toString(OrderIntent i) {
  return i == OrderIntent::Open ? "open" : "close";
}

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
// Responsibility: The executor's authoritative record of one order: the
// requested intent plus its lifecycle status and fill.
//
// @details
// Created by OrderExecutor::placeOrder() only after the risk gate passes.
// Stop-loss and take-profit, when present, are attached to the position when
// an opening order fills. Copies handed out by OrderExecutor::order() are
// snapshots; only the executor mutates the original, and only on the
// processor's consumer thread.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id{};
  std::string symbol;
  Side side{Side::Buy};
  OrderIntent intent{OrderIntent::Open};
  PositionSide position_side{PositionSide::Long};
  double price{0.0};     // Requested price
  double quantity{0.0};  // Requested size
  OrderStatus status{OrderStatus::Pending};
  std::int64_t created_ms{0};
  std::optional<double> stop_loss;
  std::optional<double> take_profit;
  double filled_price{0.0};
  double filled_quantity{0.0};
  std::string reason;          // Why it was placed ("signal", "stop_loss", ...)
  std::string failure_reason;  // Set only when status == Failed
};

}  // namespace domain
}  // namespace tradegate
