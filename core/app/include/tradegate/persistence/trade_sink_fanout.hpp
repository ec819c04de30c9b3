#pragma once

#include "tradegate/persistence/i_trade_sink.hpp"

#include <utility>
#include <vector>

namespace tradegate {

// Forwards each closed trade to the journal and the telemetry stream.
// Sinks are borrowed and fixed at construction.
class TradeSinkFanout final : public ITradeSink {
 public:
  explicit TradeSinkFanout(std::vector<ITradeSink*> sinks)
      : sinks_(std::move(sinks)) {}

  void recordTrade(const domain::ClosedTrade& trade) override {
    for (auto* sink : sinks_) {
      sink->recordTrade(trade);
    }
  }

 private:
  std::vector<ITradeSink*> sinks_;
};

}  // namespace tradegate
