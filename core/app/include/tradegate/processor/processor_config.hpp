#pragma once

#include <cstdint>

namespace tradegate {

// -----------------------------------------------------------------------------
// ProcessorConfig — admission and retry policy of the TradeProcessor
// -----------------------------------------------------------------------------
struct ProcessorConfig {
  /// Token bucket: permits per second and bucket capacity.
  double rate_per_second{10.0};
  double burst{20.0};

  /// Circuit breaker: failures within reset_timeout that open it, and the
  /// cooldown after the last failure before it half-closes.
  int failure_threshold{5};
  double reset_timeout_s{60.0};

  /// Delay before a failed request is retried (once).
  std::int64_t retry_backoff_ms{1000};

  /// Sleep between attempts to take a token for the same request.
  std::int64_t rate_limit_wait_ms{100};
};

}  // namespace tradegate
