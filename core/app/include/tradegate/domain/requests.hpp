#pragma once

#include "tradegate/domain/order.hpp"
#include "tradegate/domain/signal_snapshot.hpp"

#include <optional>
#include <string>

namespace tradegate {
namespace domain {

// -----------------------------------------------------------------------------
// Work items carried by the TradeProcessor queue
// -----------------------------------------------------------------------------
//
// PlaceOrderRequest — ask the OrderExecutor to open or close a position.
//   For Close the executor takes side and quantity from the open position;
//   position_side and quantity on the request are ignored.
//
// FillNotice — terminal outcome of a submitted order, pushed by the
//   FillWatcher. filled == false carries the transport's error text.
//
// CancelRequest — cancel a pending order.
//
// SignalRequest — an indicator snapshot to run through the DecisionEngine.
//
// All are plain values: they are copied into the queue by producers on
// other threads and consumed on the processor thread.
// -----------------------------------------------------------------------------
struct PlaceOrderRequest {
  std::string symbol;
  OrderIntent intent{OrderIntent::Open};
  PositionSide position_side{PositionSide::Long};
  double price{0.0};
  double quantity{0.0};
  std::optional<double> stop_loss;
  std::optional<double> take_profit;
  std::string reason{"signal"};
};

struct FillNotice {
  OrderId order_id{};
  double price{0.0};
  double quantity{0.0};
  bool filled{true};
  std::string error;
};

struct CancelRequest {
  OrderId order_id{};
};

struct SignalRequest {
  SignalSnapshot snapshot;
};

}  // namespace domain
}  // namespace tradegate
