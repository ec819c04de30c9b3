#pragma once

#include "tradegate/domain/order.hpp"

#include <cstdint>
#include <future>
#include <string>

namespace tradegate {

// A priced, executable version of an order.
struct Quote {
  domain::OrderId order_id{};
  std::string symbol;
  domain::Side side{domain::Side::Buy};
  double price{0.0};
  double quantity{0.0};
  std::int64_t timestamp_ms{0};
};

// Terminal result of a submitted order.
struct FillReport {
  domain::OrderId order_id{};
  bool filled{false};
  double price{0.0};
  double quantity{0.0};
  std::string error;
};

// -----------------------------------------------------------------------------
// OrderHandle — what submit() returns
// -----------------------------------------------------------------------------
// The fill arrives later through the future. The FillWatcher owns handles
// after submission and turns each resolved future into a FillNotice on the
// TradeProcessor queue. A future that stores an exception is treated as a
// failed order carrying the exception's message.
// -----------------------------------------------------------------------------
struct OrderHandle {
  domain::OrderId order_id{};
  std::future<FillReport> fill;
};

// -----------------------------------------------------------------------------
// IOrderTransport — venue abstraction
// -----------------------------------------------------------------------------
//
// @brief  getQuote() prices an order; submit() sends the quote and returns
//         a handle to its eventual fill.
//
// @details
// Exchange and DEX clients implement this outside the core. PaperTransport
// is the in-process implementation used in paper mode and tests. Both calls
// may throw on transport errors; the ExecutionHandler marks the order
// Failed and lets the TradeProcessor's retry policy decide what happens to
// the request.
// -----------------------------------------------------------------------------
class IOrderTransport {
 public:
  virtual ~IOrderTransport() = default;

  virtual Quote getQuote(const domain::Order& order) = 0;
  virtual OrderHandle submit(const Quote& quote) = 0;
};

}  // namespace tradegate
