#include "tradegate/metrics/in_memory_metrics.hpp"

namespace tradegate {

void InMemoryMetrics::incrementCounter(const std::string& name, double delta) {
  std::lock_guard lock(mutex_);
  counters_[name] += delta;
}

void InMemoryMetrics::setGauge(const std::string& name, double value) {
  std::lock_guard lock(mutex_);
  gauges_[name] = value;
}

double InMemoryMetrics::counter(const std::string& name) const {
  std::lock_guard lock(mutex_);
  auto it = counters_.find(name);
  return it == counters_.end() ? 0.0 : it->second;
}

std::optional<double> InMemoryMetrics::gauge(const std::string& name) const {
  std::lock_guard lock(mutex_);
  auto it = gauges_.find(name);
  if (it == gauges_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::map<std::string, double> InMemoryMetrics::counters() const {
  std::lock_guard lock(mutex_);
  return counters_;
}

std::map<std::string, double> InMemoryMetrics::gauges() const {
  std::lock_guard lock(mutex_);
  return gauges_;
}

}  // namespace tradegate
