#pragma once

#include "tradegate/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace tradegate {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is whatever the owner last set.
//
// @details
// The BacktestEngine owns one per run and calls advance_time() with each
// bar's timestamp before evaluating it, so the private RiskManager's
// interval and daily-rollover rules follow historical time instead of the
// wall clock. The SignalGateway does the same for live signals that carry
// their own timestamp. Unit tests use it to step through cooldowns and
// refill windows without sleeping.
//
// Why std::atomic instead of a mutex:
//   One writer (the replay loop or gateway thread) and many readers (the
//   processor consumer thread, the executor). An atomic int64 is lock-free
//   on every 64-bit target and gives the needed visibility.
//
// Ownership:
//   Owned by whoever drives the replay: BacktestEngine::run() keeps it on
//   the stack; tests keep it in their fixture.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;

  // Starts the clock at a given epoch time instead of 0.
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the simulated "now".
  //
  // @param  new_time_ms  Epoch milliseconds. Monotonicity is the caller's
  //                      responsibility; the BacktestEngine validates its
  //                      input series before replaying it.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms. Convenience for tests.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace tradegate
