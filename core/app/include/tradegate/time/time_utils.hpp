#pragma once

#include <cstdint>

namespace tradegate {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Inline helpers over the engine's int64 epoch-millisecond clock.
//
// @details
// The RiskManager resets its daily counters when utc_day_index() of the
// injected clock changes, groups closed trades by exit day for the Sharpe
// ratio, and the BacktestEngine reports trade durations in hours. All of
// them use these helpers so the unit conventions live in one place.
//
// Thread-safety: Stateless — safe to call from any thread.
// -----------------------------------------------------------------------------

constexpr std::int64_t kMillisPerSecond = 1000;
constexpr std::int64_t kMillisPerHour = 60 * 60 * kMillisPerSecond;
constexpr std::int64_t kMillisPerDay = 24 * kMillisPerHour;

// UTC calendar day number since the epoch. Floors towards negative infinity
// so pre-1970 timestamps still land on distinct days.
inline std::int64_t utc_day_index(std::int64_t epoch_ms) {
  std::int64_t day = epoch_ms / kMillisPerDay;
  if (epoch_ms < 0 && epoch_ms % kMillisPerDay != 0) {
    --day;
  }
  return day;
}

inline std::int64_t seconds_to_ms(double seconds) {
  return static_cast<std::int64_t>(seconds * kMillisPerSecond);
}

inline double ms_to_hours(std::int64_t ms) {
  return static_cast<double>(ms) / static_cast<double>(kMillisPerHour);
}

}  // namespace tradegate
