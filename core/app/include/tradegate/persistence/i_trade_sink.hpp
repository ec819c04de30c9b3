#pragma once

#include "tradegate/domain/closed_trade.hpp"

namespace tradegate {

// -----------------------------------------------------------------------------
// ITradeSink — where closed trades are recorded
// -----------------------------------------------------------------------------
//
// @brief  Fire-and-forget destination for every ClosedTrade a RiskManager
//         produces.
//
// @details
// RiskManager::close() calls recordTrade() after the ledger is updated. The
// ledger is the source of truth; the sink is an audit trail. An
// implementation that fails to persist must report the failure itself and
// return normally, because an exception here would unwind a close that has
// already happened.
//
// Thread model: called on whatever thread owns the RiskManager (the
// processor consumer thread in live mode).
// -----------------------------------------------------------------------------
class ITradeSink {
 public:
  virtual ~ITradeSink() = default;

  virtual void recordTrade(const domain::ClosedTrade& trade) = 0;
};

}  // namespace tradegate
