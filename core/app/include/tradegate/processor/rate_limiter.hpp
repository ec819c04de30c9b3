#pragma once

#include "tradegate/time/i_time_provider.hpp"

#include <cstdint>
#include <mutex>

namespace tradegate {

// -----------------------------------------------------------------------------
// RateLimiter — token bucket
// -----------------------------------------------------------------------------
//
// @brief  Admits at most `burst` requests at once and `rate` per second
//         sustained.
//
// @details
// The bucket starts full. tryAcquire() first refills by elapsed × rate since
// the last successful acquisition, capped at burst, then takes one token if
// at least one is available. The refill is computed from the last
// successful acquisition rather than the last call, so repeated failed
// attempts do not accumulate rounding error: with rate = 10, exactly 100 ms
// after the bucket ran dry one token is available again.
//
// Time comes from the injected clock, which lets tests step through refill
// windows without sleeping.
//
// Thread model: guarded by mutex_; safe from any thread.
// -----------------------------------------------------------------------------
class RateLimiter {
 public:
  RateLimiter(double rate_per_second, double burst,
              const ITimeProvider& time_provider);

  RateLimiter(const RateLimiter&) = delete;
  RateLimiter& operator=(const RateLimiter&) = delete;

  // true if a token was taken. Never blocks.
  bool tryAcquire();

  // Tokens that would be available right now.
  double available() const;

 private:
  double refilled(std::int64_t now_ms) const;

  double rate_;
  double burst_;
  const ITimeProvider& time_;

  mutable std::mutex mutex_;
  double tokens_;
  std::int64_t last_refill_ms_;
};

}  // namespace tradegate
