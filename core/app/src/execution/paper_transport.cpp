#include "tradegate/execution/paper_transport.hpp"

namespace tradegate {

PaperTransport::PaperTransport(const ITimeProvider& time_provider,
                               double slippage)
    : time_provider_(time_provider), slippage_(slippage) {}

// -----------------------------------------------------------------------------
// getQuote(): requested price, shifted against the order by slippage
// -----------------------------------------------------------------------------
Quote PaperTransport::getQuote(const domain::Order& order) {
  Quote quote;
  quote.order_id = order.id;
  quote.symbol = order.symbol;
  quote.side = order.side;
  quote.quantity = order.quantity;
  quote.timestamp_ms = time_provider_.now_ms();

  double shift = order.price * slippage_;
  quote.price = order.side == domain::Side::Buy ? order.price + shift
                                                : order.price - shift;
  return quote;
}

// -----------------------------------------------------------------------------
// submit(): perfect, immediate fill at the quoted price
// -----------------------------------------------------------------------------
OrderHandle PaperTransport::submit(const Quote& quote) {
  std::promise<FillReport> promise;

  FillReport report;
  report.order_id = quote.order_id;
  report.filled = true;
  report.price = quote.price;
  report.quantity = quote.quantity;
  promise.set_value(report);

  OrderHandle handle;
  handle.order_id = quote.order_id;
  handle.fill = promise.get_future();
  return handle;
}

}  // namespace tradegate
