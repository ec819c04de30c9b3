// =============================================================================
// circuit_breaker_test.cpp
// =============================================================================
// Unit tests for tradegate::CircuitBreaker.
//
// Validates:
//   - Opens at the failure threshold and refuses work while open
//   - Half-closes only once MORE than reset_timeout has passed since the
//     last failure, with a fresh failure count
//   - Failures spaced wider than the timeout do not accumulate
//   - A success clears the count while closed
// =============================================================================

#include "tradegate/domain/errors.hpp"
#include "tradegate/processor/circuit_breaker.hpp"
#include "tradegate/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

namespace {
constexpr std::int64_t kResetMs = 60'000;
}

class CircuitBreakerTest : public ::testing::Test {
 protected:
  tradegate::SimulationTimeProvider clock{5'000'000};
  tradegate::CircuitBreaker breaker{5, kResetMs, clock};
};

// -----------------------------------------------------------------------------
// 1. Closed breaker admits work.
// -----------------------------------------------------------------------------
TEST_F(CircuitBreakerTest, StartsClosed) {
  EXPECT_TRUE(breaker.canExecute());
  EXPECT_FALSE(breaker.isOpen());
  EXPECT_EQ(breaker.state().consecutive_failures, 0);
  EXPECT_FALSE(breaker.state().last_failure_ms.has_value());
}

// -----------------------------------------------------------------------------
// 2. The threshold-th failure opens it; only that call reports the trip.
// -----------------------------------------------------------------------------
TEST_F(CircuitBreakerTest, OpensAtThreshold) {
  for (int i = 0; i < 4; ++i) {
    EXPECT_FALSE(breaker.recordFailure());
    EXPECT_TRUE(breaker.canExecute());
  }
  EXPECT_TRUE(breaker.recordFailure());
  EXPECT_TRUE(breaker.isOpen());
  EXPECT_FALSE(breaker.canExecute());
  EXPECT_EQ(breaker.state().trips, 1);

  EXPECT_FALSE(breaker.recordFailure());
  EXPECT_EQ(breaker.state().trips, 1);
}

// -----------------------------------------------------------------------------
// 3. Exactly reset_timeout after the last failure is still open; one
//    millisecond later it half-closes with a zero count.
// -----------------------------------------------------------------------------
TEST_F(CircuitBreakerTest, ResetsStrictlyAfterTimeout) {
  for (int i = 0; i < 5; ++i) {
    breaker.recordFailure();
  }
  ASSERT_TRUE(breaker.isOpen());

  clock.advance_by(kResetMs);
  EXPECT_FALSE(breaker.canExecute());

  clock.advance_by(1);
  EXPECT_TRUE(breaker.canExecute());
  EXPECT_FALSE(breaker.isOpen());
  EXPECT_EQ(breaker.state().consecutive_failures, 0);
}

// -----------------------------------------------------------------------------
// 4. A failure after a long quiet period starts a new count.
// Why: Sporadic failures hours apart are not an outage.
// -----------------------------------------------------------------------------
TEST_F(CircuitBreakerTest, SpacedFailuresDoNotAccumulate) {
  for (int i = 0; i < 10; ++i) {
    EXPECT_FALSE(breaker.recordFailure());
    clock.advance_by(kResetMs + 1);
  }
  EXPECT_FALSE(breaker.isOpen());
  EXPECT_EQ(breaker.state().consecutive_failures, 1);
}

// -----------------------------------------------------------------------------
// 5. Success while closed clears the count.
// -----------------------------------------------------------------------------
TEST_F(CircuitBreakerTest, SuccessClearsCount) {
  for (int i = 0; i < 4; ++i) {
    breaker.recordFailure();
  }
  breaker.recordSuccess();
  EXPECT_EQ(breaker.state().consecutive_failures, 0);
  EXPECT_FALSE(breaker.recordFailure());
  EXPECT_FALSE(breaker.isOpen());
}

// -----------------------------------------------------------------------------
// 6. Threshold must be positive.
// -----------------------------------------------------------------------------
TEST_F(CircuitBreakerTest, InvalidThreshold) {
  EXPECT_THROW(tradegate::CircuitBreaker(0, kResetMs, clock),
               tradegate::PreconditionViolation);
}
