#pragma once

namespace tradegate {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus — order lifecycle state machine
// -----------------------------------------------------------------------------
//
// @brief  Every state an order can occupy inside the OrderExecutor.
//
// @details
// An order is created Pending after it passes the risk gate, and reaches
// exactly one terminal state:
//
//   Pending ──> Filled      (handleFill)
//      │
//      ├──────> Cancelled   (cancelOrder)
//      │
//      └──────> Failed      (markFailed: transport error or risk mutation
//                            refused at fill time)
//
// Terminal states accept no further transitions. The legal graph is encoded
// once in OrderExecutor::transitionStatus().
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Pending,    // Risk-approved, awaiting a fill; counts against the throttle
  Filled,     // Fill applied to the RiskManager — terminal
  Cancelled,  // Cancelled while pending — terminal
  Failed,     // Transport or fill-time failure — terminal
};

inline const char* toString(OrderStatus s) {
  switch (s) {
    case OrderStatus::Pending:   return "pending";
    case OrderStatus::Filled:    return "filled";
    case OrderStatus::Cancelled: return "cancelled";
    case OrderStatus::Failed:    return "failed";
  }
  return "unknown";
}

inline bool isTerminal(OrderStatus s) { return s != OrderStatus::Pending; }

}  // namespace domain
}  // namespace tradegate
