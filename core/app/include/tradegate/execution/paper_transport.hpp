#pragma once

#include "tradegate/execution/i_order_transport.hpp"
#include "tradegate/time/i_time_provider.hpp"

namespace tradegate {

// -----------------------------------------------------------------------------
// PaperTransport — deterministic in-process IOrderTransport
// -----------------------------------------------------------------------------
//
// @brief  Quotes at the order's requested price (optionally shifted by a
//         fixed slippage) and fills every submission immediately, in full.
//
// @details
// The returned future is already ready, so the FillWatcher turns it into a
// FillNotice on its next poll. Adverse slippage moves buys up and sells down
// by slippage × price; 0 gives a perfect fill.
//
// Thread model: stateless apart from configuration. Safe from any thread.
// -----------------------------------------------------------------------------
class PaperTransport final : public IOrderTransport {
 public:
  explicit PaperTransport(const ITimeProvider& time_provider,
                          double slippage = 0.0);

  Quote getQuote(const domain::Order& order) override;
  OrderHandle submit(const Quote& quote) override;

 private:
  const ITimeProvider& time_provider_;
  double slippage_;
};

}  // namespace tradegate
