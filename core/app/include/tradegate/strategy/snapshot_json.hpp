#pragma once

#include "tradegate/domain/signal_snapshot.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace tradegate {

// -----------------------------------------------------------------------------
// SignalSnapshot <-> JSON
// -----------------------------------------------------------------------------
//
// Wire/file format shared by the SignalGateway and the backtest bar loader:
//
//   {
//     "symbol": "SOL", "timestamp_ms": 1700000000000,
//     "price": 101.5,                          // or "close"
//     "high": 102.0, "low": 100.9, "volume": 2.5e6,
//     "rsi": 28.0, "macd": 0.4, "macd_signal": 0.1,
//     "trend": "weak_uptrend",
//     "support": 99.0, "resistance": 110.0, "volatility": 0.02
//   }
//
// timestamp_ms and price (or close) are required. high/low default to price,
// everything else to neutral values. Trend accepts "up"/"uptrend"/
// "weak_uptrend"/"strong_uptrend" (and the down equivalents); anything else
// is sideways.
//
// snapshotFromJson() throws nlohmann::json::exception on missing or
// mistyped required fields; callers decide whether that is fatal.
// -----------------------------------------------------------------------------

domain::Trend parseTrend(const std::string& text);

domain::SignalSnapshot snapshotFromJson(const nlohmann::json& j,
                                        const std::string& default_symbol = "");

nlohmann::json snapshotToJson(const domain::SignalSnapshot& s);

}  // namespace tradegate
