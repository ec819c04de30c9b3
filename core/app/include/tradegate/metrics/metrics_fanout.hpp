#pragma once

#include "tradegate/metrics/i_metrics_sink.hpp"

#include <string>
#include <utility>
#include <vector>

namespace tradegate {

// -----------------------------------------------------------------------------
// MetricsFanout — forwards every update to a fixed list of sinks
// -----------------------------------------------------------------------------
// The TradingEngine reports into InMemoryMetrics (for STATUS) and, when
// telemetry is enabled, into the TelemetryServer as well. Sinks are borrowed;
// the list is fixed after construction, so no locking is needed here.
// -----------------------------------------------------------------------------
class MetricsFanout final : public IMetricsSink {
 public:
  explicit MetricsFanout(std::vector<IMetricsSink*> sinks)
      : sinks_(std::move(sinks)) {}

  void incrementCounter(const std::string& name, double delta) override {
    for (auto* sink : sinks_) {
      sink->incrementCounter(name, delta);
    }
  }

  void setGauge(const std::string& name, double value) override {
    for (auto* sink : sinks_) {
      sink->setGauge(name, value);
    }
  }

 private:
  std::vector<IMetricsSink*> sinks_;
};

}  // namespace tradegate
