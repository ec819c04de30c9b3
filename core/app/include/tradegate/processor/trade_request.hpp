#pragma once

#include "tradegate/domain/requests.hpp"

#include <variant>

namespace tradegate {

// -----------------------------------------------------------------------------
// TradeRequest — the closed set of work the TradeProcessor accepts
// -----------------------------------------------------------------------------
// std::variant gives value semantics and one heap-free queue element type.
// Handlers that care about one alternative register through
// TradeProcessor::registerHandler<T>(), which filters with std::get_if.
// -----------------------------------------------------------------------------
using TradeRequest = std::variant<domain::PlaceOrderRequest,
                                  domain::FillNotice,
                                  domain::CancelRequest,
                                  domain::SignalRequest>;

inline const char* requestKind(const TradeRequest& request) {
  if (std::holds_alternative<domain::PlaceOrderRequest>(request)) {
    return "place_order";
  }
  if (std::holds_alternative<domain::FillNotice>(request)) {
    return "fill";
  }
  if (std::holds_alternative<domain::CancelRequest>(request)) {
    return "cancel";
  }
  return "signal";
}

// Fills and cancels settle an order already placed; everything else asks for
// new work.
inline bool settlesOrder(const TradeRequest& request) {
  return std::holds_alternative<domain::FillNotice>(request) ||
         std::holds_alternative<domain::CancelRequest>(request);
}

}  // namespace tradegate
