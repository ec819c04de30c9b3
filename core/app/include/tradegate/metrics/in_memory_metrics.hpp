#pragma once

#include "tradegate/metrics/i_metrics_sink.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace tradegate {

// -----------------------------------------------------------------------------
// InMemoryMetrics — IMetricsSink backed by two maps
// -----------------------------------------------------------------------------
// Thread model: every method locks mutex_. Writers are the processor
// consumer thread; readers are tests and the telemetry command thread.
// -----------------------------------------------------------------------------
class InMemoryMetrics final : public IMetricsSink {
 public:
  InMemoryMetrics() = default;

  InMemoryMetrics(const InMemoryMetrics&) = delete;
  InMemoryMetrics& operator=(const InMemoryMetrics&) = delete;

  void incrementCounter(const std::string& name, double delta) override;
  void setGauge(const std::string& name, double value) override;

  // 0 for a counter never incremented.
  double counter(const std::string& name) const;
  std::optional<double> gauge(const std::string& name) const;

  std::map<std::string, double> counters() const;
  std::map<std::string, double> gauges() const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, double> counters_;
  std::map<std::string, double> gauges_;
};

}  // namespace tradegate
