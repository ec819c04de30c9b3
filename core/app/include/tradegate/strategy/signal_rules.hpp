#pragma once

#include "tradegate/domain/order.hpp"
#include "tradegate/domain/signal_snapshot.hpp"

#include <optional>

namespace tradegate {

// -----------------------------------------------------------------------------
// Entry and exit rules
// -----------------------------------------------------------------------------
//
// @brief  The indicator rule set, as pure functions of one SignalSnapshot.
//
// @details
// Entry (only evaluated when flat on the symbol):
//   Long  — rsi < 30, macd above its signal line, price above support,
//           trend up.
//   Short — rsi > 70, macd below its signal line, price below resistance,
//           trend down.
//
// Exit (only evaluated with a position open), first match wins:
//   Long  — rsi > 70 with macd below signal  → "overbought_macd_cross"
//           price below support              → "support_breach"
//           trend down                       → "trend_reversal"
//   Short — rsi < 30 with macd above signal  → "oversold_macd_cross"
//           price above resistance           → "resistance_breach"
//           trend up                         → "trend_reversal"
//
// Used unchanged by live trading and by the BacktestEngine.
// -----------------------------------------------------------------------------

constexpr double kOversoldRsi = 30.0;
constexpr double kOverboughtRsi = 70.0;

std::optional<domain::PositionSide> entrySignal(
    const domain::SignalSnapshot& s);

// Returns the exit reason, or nullopt to hold.
std::optional<const char*> exitSignal(domain::PositionSide side,
                                      const domain::SignalSnapshot& s);

}  // namespace tradegate
