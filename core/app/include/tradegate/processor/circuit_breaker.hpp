#pragma once

#include "tradegate/time/i_time_provider.hpp"

#include <cstdint>
#include <mutex>
#include <optional>

namespace tradegate {

// Snapshot of the breaker for status reporting.
struct CircuitBreakerState {
  int consecutive_failures{0};
  std::optional<std::int64_t> last_failure_ms;
  bool open{false};
  int trips{0};
};

// -----------------------------------------------------------------------------
// CircuitBreaker — failure-count gate with timed self-reset
// -----------------------------------------------------------------------------
//
// @brief  Stops admitting work after failure_threshold failures and admits
//         again once reset_timeout has passed since the last failure.
//
// @details
// recordFailure(): if the previous failure is older than reset_timeout the
// count restarts, so only failures clustered within the timeout add up.
// Reaching the threshold opens the breaker.
//
// canExecute(): closed → true. Open and more than reset_timeout since the
// last failure → half-close: the breaker closes, the count resets and the
// call returns true. Otherwise false.
//
// recordSuccess(): resets the consecutive count while closed.
//
// Thread model: guarded by mutex_. The processor thread drives it; status
// readers take snapshots through state().
// -----------------------------------------------------------------------------
class CircuitBreaker {
 public:
  CircuitBreaker(int failure_threshold, std::int64_t reset_timeout_ms,
                 const ITimeProvider& time_provider);

  CircuitBreaker(const CircuitBreaker&) = delete;
  CircuitBreaker& operator=(const CircuitBreaker&) = delete;

  bool canExecute();

  // Returns true when this failure opened the breaker.
  bool recordFailure();

  void recordSuccess();

  bool isOpen() const;
  CircuitBreakerState state() const;

 private:
  int failure_threshold_;
  std::int64_t reset_timeout_ms_;
  const ITimeProvider& time_;

  mutable std::mutex mutex_;
  CircuitBreakerState state_;
};

}  // namespace tradegate
