#include "tradegate/strategy/signal_rules.hpp"

namespace tradegate {

using domain::PositionSide;
using domain::Trend;

std::optional<PositionSide> entrySignal(const domain::SignalSnapshot& s) {
  if (s.rsi < kOversoldRsi && s.macd > s.macd_signal && s.price > s.support &&
      s.trend == Trend::Up) {
    return PositionSide::Long;
  }
  if (s.rsi > kOverboughtRsi && s.macd < s.macd_signal &&
      s.price < s.resistance && s.trend == Trend::Down) {
    return PositionSide::Short;
  }
  return std::nullopt;
}

std::optional<const char*> exitSignal(PositionSide side,
                                      const domain::SignalSnapshot& s) {
  if (side == PositionSide::Long) {
    if (s.rsi > kOverboughtRsi && s.macd < s.macd_signal) {
      return "overbought_macd_cross";
    }
    if (s.price < s.support) {
      return "support_breach";
    }
    if (s.trend == Trend::Down) {
      return "trend_reversal";
    }
    return std::nullopt;
  }

  if (s.rsi < kOversoldRsi && s.macd > s.macd_signal) {
    return "oversold_macd_cross";
  }
  if (s.price > s.resistance) {
    return "resistance_breach";
  }
  if (s.trend == Trend::Up) {
    return "trend_reversal";
  }
  return std::nullopt;
}

}  // namespace tradegate
