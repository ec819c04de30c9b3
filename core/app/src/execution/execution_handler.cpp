#include "tradegate/execution/execution_handler.hpp"

#include <iostream>

namespace tradegate {

ExecutionHandler::ExecutionHandler(OrderExecutor& executor,
                                   IOrderTransport& transport,
                                   FillWatcher& watcher)
    : executor_(executor), transport_(transport), watcher_(watcher) {}

// -----------------------------------------------------------------------------
// registerWith(): one typed handler per request kind
// -----------------------------------------------------------------------------
void ExecutionHandler::registerWith(TradeProcessor& processor) {
  processor.registerHandler<domain::PlaceOrderRequest>(
      "execution.place",
      [this](const domain::PlaceOrderRequest& r) { onPlaceOrder(r); });
  processor.registerHandler<domain::FillNotice>(
      "execution.fill",
      [this](const domain::FillNotice& n) { onFill(n); });
  processor.registerHandler<domain::CancelRequest>(
      "execution.cancel",
      [this](const domain::CancelRequest& r) { onCancel(r); });
}

// -----------------------------------------------------------------------------
// onPlaceOrder(): gate, then quote + submit
// -----------------------------------------------------------------------------
void ExecutionHandler::onPlaceOrder(const domain::PlaceOrderRequest& request) {
  PlacementResult placed = executor_.placeOrder(request);
  if (!placed.accepted()) {
    return;
  }

  std::optional<domain::Order> order = executor_.order(placed.order_id);
  if (!order) {
    return;
  }

  try {
    Quote quote = transport_.getQuote(*order);
    watcher_.watch(transport_.submit(quote));
  } catch (const std::exception& e) {
    executor_.markFailed(placed.order_id,
                         std::string("transport error: ") + e.what());
    throw;
  }
}

// -----------------------------------------------------------------------------
// onFill()
// -----------------------------------------------------------------------------
void ExecutionHandler::onFill(const domain::FillNotice& notice) {
  if (notice.filled) {
    executor_.handleFill(notice.order_id, notice.price, notice.quantity);
  } else {
    executor_.markFailed(notice.order_id, notice.error);
  }
}

void ExecutionHandler::onCancel(const domain::CancelRequest& request) {
  if (!executor_.cancelOrder(request.order_id)) {
    std::cerr << "[ExecutionHandler] cancel of order " << request.order_id
              << " had no effect.\n";
  }
}

}  // namespace tradegate
