#pragma once

#include <string>

namespace tradegate {

// -----------------------------------------------------------------------------
// IMetricsSink — counters and gauges out of the core
// -----------------------------------------------------------------------------
//
// @brief  Write-only metrics interface the core reports through.
//
// @details
// The OrderExecutor, RiskManager and TradeProcessor each take an optional
// IMetricsSink* (nullptr disables reporting). Implementations:
//   - InMemoryMetrics  — thread-safe maps; read back by tests and by the
//                        engine's STATUS command.
//   - TelemetryServer  — publishes each update as JSON on a ZeroMQ PUB socket.
//   - MetricsFanout    — forwards to several sinks.
//
// Names are the constants in metric_names.hpp.
//
// Thread-safety contract: implementations must accept calls from any thread.
// Calls must not throw; a sink that cannot deliver drops the update.
// -----------------------------------------------------------------------------
class IMetricsSink {
 public:
  virtual ~IMetricsSink() = default;

  virtual void incrementCounter(const std::string& name, double delta) = 0;
  virtual void setGauge(const std::string& name, double value) = 0;
};

}  // namespace tradegate
