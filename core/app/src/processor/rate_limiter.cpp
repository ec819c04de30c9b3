#include "tradegate/processor/rate_limiter.hpp"
#include "tradegate/domain/errors.hpp"

#include <algorithm>

namespace tradegate {

// -----------------------------------------------------------------------------
// Constructor: bucket starts full
// -----------------------------------------------------------------------------
RateLimiter::RateLimiter(double rate_per_second, double burst,
                         const ITimeProvider& time_provider)
    : rate_(rate_per_second),
      burst_(burst),
      time_(time_provider),
      tokens_(burst),
      last_refill_ms_(time_provider.now_ms()) {
  if (!(rate_per_second > 0.0) || !(burst >= 1.0)) {
    throw PreconditionViolation(
        "RateLimiter needs rate > 0 and burst >= 1");
  }
}

// -----------------------------------------------------------------------------
// tryAcquire(): refill, then take one token if available
// -----------------------------------------------------------------------------
bool RateLimiter::tryAcquire() {
  std::lock_guard lock(mutex_);
  std::int64_t now = time_.now_ms();
  double available = refilled(now);
  if (available < 1.0) {
    return false;
  }
  tokens_ = available - 1.0;
  last_refill_ms_ = now;
  return true;
}

double RateLimiter::available() const {
  std::lock_guard lock(mutex_);
  return refilled(time_.now_ms());
}

// -----------------------------------------------------------------------------
// refilled(): tokens at now_ms without mutating state. Caller holds mutex_.
// -----------------------------------------------------------------------------
double RateLimiter::refilled(std::int64_t now_ms) const {
  std::int64_t elapsed_ms = std::max<std::int64_t>(0, now_ms - last_refill_ms_);
  double added = static_cast<double>(elapsed_ms) * rate_ / 1000.0;
  return std::min(burst_, tokens_ + added);
}

}  // namespace tradegate
