#pragma once

#include <cstdint>

namespace tradegate {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Abstracts "current time" away from std::chrono::system_clock.
//
// @details
// Every time-dependent rule in the engine reads the clock through this
// interface: the per-symbol trade and order intervals, daily counter
// rollover, the circuit breaker cooldown and the token bucket refill. Live
// trading injects LiveTimeProvider; tests and the BacktestEngine inject a
// SimulationTimeProvider and move it forward explicitly, which makes every
// one of those rules deterministic.
//
// Time is int64 milliseconds since the Unix epoch. Bar data and signal
// messages carry timestamps in the same unit, so no conversion happens on
// the hot path.
//
// Thread-safety contract:
//   Implementations must allow concurrent now_ms() calls from any thread.
//
// Ownership:
//   Components hold a const reference and never own the provider. The
//   provider must outlive every component that references it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Current time in epoch milliseconds.
  //
  // @return Wall-clock time for LiveTimeProvider; the last value passed to
  //         advance_time() for SimulationTimeProvider.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace tradegate
