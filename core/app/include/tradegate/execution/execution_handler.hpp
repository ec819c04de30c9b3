#pragma once

#include "tradegate/execution/fill_watcher.hpp"
#include "tradegate/execution/i_order_transport.hpp"
#include "tradegate/execution/order_executor.hpp"
#include "tradegate/processor/trade_processor.hpp"

namespace tradegate {

// -----------------------------------------------------------------------------
// ExecutionHandler — TradeProcessor handler for order work
// -----------------------------------------------------------------------------
//
// @brief  Connects queued requests to the OrderExecutor and the transport.
//
// @details
//   PlaceOrderRequest → OrderExecutor::placeOrder(); on acceptance, quote
//                       and submit through the transport and hand the
//                       handle to the FillWatcher. A risk rejection is an
//                       outcome, not a failure.
//   FillNotice        → handleFill() or markFailed().
//   CancelRequest     → cancelOrder().
//
// A transport exception marks the order Failed and is rethrown so the
// processor records it on the circuit breaker and retries the request once.
//
// Thread model: all callbacks run on the processor consumer thread.
// -----------------------------------------------------------------------------
class ExecutionHandler {
 public:
  ExecutionHandler(OrderExecutor& executor, IOrderTransport& transport,
                   FillWatcher& watcher);

  ExecutionHandler(const ExecutionHandler&) = delete;
  ExecutionHandler& operator=(const ExecutionHandler&) = delete;

  // Registers the three typed handlers. Call before processor.start().
  void registerWith(TradeProcessor& processor);

  void onPlaceOrder(const domain::PlaceOrderRequest& request);
  void onFill(const domain::FillNotice& notice);
  void onCancel(const domain::CancelRequest& request);

 private:
  OrderExecutor& executor_;
  IOrderTransport& transport_;
  FillWatcher& watcher_;
};

}  // namespace tradegate
