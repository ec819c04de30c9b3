#pragma once

#include <cstdint>
#include <string>

namespace tradegate {
namespace domain {

enum class Trend {
  Up,
  Down,
  Sideways,
};

inline const char* toString(Trend t) {
  switch (t) {
    case Trend::Up:       return "up";
    case Trend::Down:     return "down";
    case Trend::Sideways: return "sideways";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// SignalSnapshot — indicator state for one symbol at one step
// -----------------------------------------------------------------------------
//
// @brief  Everything the entry/exit rules need about a symbol at time t.
//
// @details
// Produced outside the engine by the indicator process (live, via the
// SignalGateway) or loaded from a bar file (backtest). The engine never
// computes RSI/MACD/support/resistance itself; it only consumes them.
//
// high/low feed the ATR used for stops. A source that does not supply them
// leaves them at 0, and the DecisionEngine then takes price for both, which
// yields a zero range for that bar.
// volume feeds the liquidity floor; volatility feeds the volatility band and
// the stop fallback when ATR is still warming up.
// -----------------------------------------------------------------------------
struct SignalSnapshot {
  std::string symbol;
  std::int64_t timestamp_ms{0};
  double price{0.0};
  double high{0.0};
  double low{0.0};
  double volume{0.0};
  double rsi{50.0};
  double macd{0.0};
  double macd_signal{0.0};
  Trend trend{Trend::Sideways};
  double support{0.0};
  double resistance{0.0};
  double volatility{0.0};
};

}  // namespace domain
}  // namespace tradegate
