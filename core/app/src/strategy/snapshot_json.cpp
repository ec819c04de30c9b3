#include "tradegate/strategy/snapshot_json.hpp"

#include <algorithm>
#include <cctype>

namespace tradegate {

// -----------------------------------------------------------------------------
// parseTrend(): lenient, case-insensitive
// -----------------------------------------------------------------------------
domain::Trend parseTrend(const std::string& text) {
  std::string t = text;
  std::transform(t.begin(), t.end(), t.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (t == "up" || t == "uptrend" || t == "weak_uptrend" ||
      t == "strong_uptrend") {
    return domain::Trend::Up;
  }
  if (t == "down" || t == "downtrend" || t == "weak_downtrend" ||
      t == "strong_downtrend") {
    return domain::Trend::Down;
  }
  return domain::Trend::Sideways;
}

// -----------------------------------------------------------------------------
// snapshotFromJson()
// -----------------------------------------------------------------------------
domain::SignalSnapshot snapshotFromJson(const nlohmann::json& j,
                                        const std::string& default_symbol) {
  domain::SignalSnapshot s;
  s.symbol = j.value("symbol", default_symbol);
  s.timestamp_ms = j.at("timestamp_ms").get<std::int64_t>();
  s.price = j.contains("price") ? j.at("price").get<double>()
                                : j.at("close").get<double>();
  s.high = j.value("high", s.price);
  s.low = j.value("low", s.price);
  s.volume = j.value("volume", 0.0);
  s.rsi = j.value("rsi", 50.0);
  s.macd = j.value("macd", 0.0);
  s.macd_signal = j.value("macd_signal", 0.0);
  s.trend = parseTrend(j.value("trend", std::string("sideways")));
  s.support = j.value("support", 0.0);
  s.resistance = j.value("resistance", 0.0);
  s.volatility = j.value("volatility", 0.0);
  return s;
}

nlohmann::json snapshotToJson(const domain::SignalSnapshot& s) {
  nlohmann::json j;
  j["symbol"] = s.symbol;
  j["timestamp_ms"] = s.timestamp_ms;
  j["price"] = s.price;
  j["high"] = s.high;
  j["low"] = s.low;
  j["volume"] = s.volume;
  j["rsi"] = s.rsi;
  j["macd"] = s.macd;
  j["macd_signal"] = s.macd_signal;
  j["trend"] = domain::toString(s.trend);
  j["support"] = s.support;
  j["resistance"] = s.resistance;
  j["volatility"] = s.volatility;
  return j;
}

}  // namespace tradegate
