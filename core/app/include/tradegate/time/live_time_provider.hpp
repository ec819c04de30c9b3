#pragma once

#include "tradegate/time/i_time_provider.hpp"

namespace tradegate {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Reads std::chrono::system_clock and converts to epoch ms.
//
// @details
// Used by the live TradingEngine in paper mode. Stateless, so it is safe to
// share one instance between the processor, the executor and the risk
// manager.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace tradegate
