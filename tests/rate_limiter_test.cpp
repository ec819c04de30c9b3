// =============================================================================
// rate_limiter_test.cpp
// =============================================================================
// Unit tests for tradegate::RateLimiter (token bucket).
//
// Validates:
//   - The bucket starts full and admits exactly `burst` immediate requests
//   - Refill is rate × elapsed, capped at burst
//   - A refused request does not consume or reset anything
//   - Invalid parameters are rejected at construction
// =============================================================================

#include "tradegate/domain/errors.hpp"
#include "tradegate/processor/rate_limiter.hpp"
#include "tradegate/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

class RateLimiterTest : public ::testing::Test {
 protected:
  tradegate::SimulationTimeProvider clock{1'000'000};
};

// -----------------------------------------------------------------------------
// 1. burst immediate requests pass, the next one is refused.
// -----------------------------------------------------------------------------
TEST_F(RateLimiterTest, BurstThenRefuse) {
  tradegate::RateLimiter limiter(10.0, 20.0, clock);
  for (int i = 0; i < 20; ++i) {
    EXPECT_TRUE(limiter.tryAcquire()) << "request " << i;
  }
  EXPECT_FALSE(limiter.tryAcquire());
}

// -----------------------------------------------------------------------------
// 2. At 10 tokens/s one token returns after exactly 100 ms.
// Why: Refusals must not push the refill point forward, or a busy caller
//      would starve itself.
// -----------------------------------------------------------------------------
TEST_F(RateLimiterTest, RefillAfterInterval) {
  tradegate::RateLimiter limiter(10.0, 20.0, clock);
  for (int i = 0; i < 20; ++i) {
    ASSERT_TRUE(limiter.tryAcquire());
  }

  clock.advance_by(50);
  EXPECT_FALSE(limiter.tryAcquire());
  clock.advance_by(49);
  EXPECT_FALSE(limiter.tryAcquire());
  clock.advance_by(1);
  EXPECT_TRUE(limiter.tryAcquire());
  EXPECT_FALSE(limiter.tryAcquire());
}

// -----------------------------------------------------------------------------
// 3. A long idle period refills only up to burst.
// -----------------------------------------------------------------------------
TEST_F(RateLimiterTest, RefillCappedAtBurst) {
  tradegate::RateLimiter limiter(10.0, 5.0, clock);
  ASSERT_TRUE(limiter.tryAcquire());
  clock.advance_by(60'000);
  EXPECT_DOUBLE_EQ(limiter.available(), 5.0);

  for (int i = 0; i < 5; ++i) {
    EXPECT_TRUE(limiter.tryAcquire());
  }
  EXPECT_FALSE(limiter.tryAcquire());
}

// -----------------------------------------------------------------------------
// 4. available() reports fractional tokens without consuming them.
// -----------------------------------------------------------------------------
TEST_F(RateLimiterTest, AvailableIsReadOnly) {
  tradegate::RateLimiter limiter(4.0, 1.0, clock);
  ASSERT_TRUE(limiter.tryAcquire());
  clock.advance_by(125);
  EXPECT_DOUBLE_EQ(limiter.available(), 0.5);
  EXPECT_DOUBLE_EQ(limiter.available(), 0.5);
  EXPECT_FALSE(limiter.tryAcquire());
}

// -----------------------------------------------------------------------------
// 5. rate must be positive and burst at least one.
// -----------------------------------------------------------------------------
TEST_F(RateLimiterTest, InvalidParameters) {
  EXPECT_THROW(tradegate::RateLimiter(0.0, 5.0, clock),
               tradegate::PreconditionViolation);
  EXPECT_THROW(tradegate::RateLimiter(10.0, 0.5, clock),
               tradegate::PreconditionViolation);
}
