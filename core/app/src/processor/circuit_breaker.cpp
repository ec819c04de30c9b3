#include "tradegate/processor/circuit_breaker.hpp"
#include "tradegate/domain/errors.hpp"

#include <iostream>

namespace tradegate {

CircuitBreaker::CircuitBreaker(int failure_threshold,
                               std::int64_t reset_timeout_ms,
                               const ITimeProvider& time_provider)
    : failure_threshold_(failure_threshold),
      reset_timeout_ms_(reset_timeout_ms),
      time_(time_provider) {
  if (failure_threshold <= 0 || reset_timeout_ms < 0) {
    throw PreconditionViolation(
        "CircuitBreaker needs threshold > 0 and reset timeout >= 0");
  }
}

// -----------------------------------------------------------------------------
// canExecute(): closed, or half-close once the cooldown has passed
// -----------------------------------------------------------------------------
bool CircuitBreaker::canExecute() {
  std::lock_guard lock(mutex_);
  if (!state_.open) {
    return true;
  }

  std::int64_t since_failure = time_.now_ms() - state_.last_failure_ms.value_or(0);
  if (since_failure > reset_timeout_ms_) {
    state_.open = false;
    state_.consecutive_failures = 0;
    std::cout << "[CircuitBreaker] reset after " << since_failure
              << " ms cooldown.\n";
    return true;
  }
  return false;
}

// -----------------------------------------------------------------------------
// recordFailure(): count within the window, open at the threshold
// -----------------------------------------------------------------------------
bool CircuitBreaker::recordFailure() {
  std::lock_guard lock(mutex_);
  std::int64_t now = time_.now_ms();

  if (state_.last_failure_ms &&
      now - *state_.last_failure_ms > reset_timeout_ms_) {
    state_.consecutive_failures = 0;
  }

  ++state_.consecutive_failures;
  state_.last_failure_ms = now;

  if (state_.consecutive_failures >= failure_threshold_ && !state_.open) {
    state_.open = true;
    ++state_.trips;
    std::cerr << "[CircuitBreaker] WARNING: opened after "
              << state_.consecutive_failures << " failures.\n";
    return true;
  }
  return false;
}

void CircuitBreaker::recordSuccess() {
  std::lock_guard lock(mutex_);
  if (!state_.open) {
    state_.consecutive_failures = 0;
  }
}

bool CircuitBreaker::isOpen() const {
  std::lock_guard lock(mutex_);
  return state_.open;
}

CircuitBreakerState CircuitBreaker::state() const {
  std::lock_guard lock(mutex_);
  return state_;
}

}  // namespace tradegate
