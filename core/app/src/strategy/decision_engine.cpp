#include "tradegate/strategy/decision_engine.hpp"
#include "tradegate/risk/risk_manager.hpp"
#include "tradegate/strategy/signal_rules.hpp"

#include <vector>

namespace tradegate {

using domain::OrderIntent;

DecisionEngine::DecisionEngine(IRiskManager& risk,
                               const StrategyConfig& config)
    : risk_(risk), config_(config) {}

// -----------------------------------------------------------------------------
// observe(): extend the bar history and the risk manager's market state
// -----------------------------------------------------------------------------
void DecisionEngine::observe(const domain::SignalSnapshot& snapshot) {
  std::size_t depth = risk_.limits().history_depth;
  BarHistory& h = history_[snapshot.symbol];
  h.highs.push_back(snapshot.high > 0.0 ? snapshot.high : snapshot.price);
  h.lows.push_back(snapshot.low > 0.0 ? snapshot.low : snapshot.price);
  h.closes.push_back(snapshot.price);
  while (h.closes.size() > depth) {
    h.highs.pop_front();
    h.lows.pop_front();
    h.closes.pop_front();
  }

  risk_.recordPrice(snapshot.symbol, snapshot.price);
  if (snapshot.volatility > 0.0) {
    risk_.recordVolatility(snapshot.symbol, snapshot.volatility);
  }
  if (snapshot.volume > 0.0) {
    risk_.recordLiquidity(snapshot.symbol, snapshot.volume);
  }
}

// -----------------------------------------------------------------------------
// evaluate()
// -----------------------------------------------------------------------------
std::optional<TradeDecision> DecisionEngine::evaluate(
    const domain::SignalSnapshot& snapshot, double available_capital) const {
  // --- Holding: protective levels first, then the exit rules ----------------
  if (auto pos = risk_.position(snapshot.symbol)) {
    std::optional<std::string> reason;
    if (auto trigger =
            risk_.checkProtectiveLevels(snapshot.symbol, snapshot.price)) {
      reason = toString(*trigger);
    } else if (auto exit = exitSignal(pos->side, snapshot)) {
      reason = *exit;
    }
    if (!reason) {
      return std::nullopt;
    }

    TradeDecision close;
    close.intent = OrderIntent::Close;
    close.side = pos->side;
    close.price = snapshot.price;
    close.quantity = pos->quantity;
    close.reason = *reason;
    return close;
  }

  // --- Flat: entry rules, ATR stops, risk sizing ----------------------------
  auto side = entrySignal(snapshot);
  if (!side) {
    return std::nullopt;
  }

  double atr_value = atr(snapshot.symbol).value_or(stopDistanceProxy(snapshot));
  double stop = risk_.stopLossPrice(*side, snapshot.price, atr_value);
  double target = risk_.takeProfitPrice(*side, snapshot.price, atr_value);
  double quantity = risk_.positionSize(snapshot.price, stop, available_capital);
  if (!(quantity > 0.0)) {
    return std::nullopt;
  }

  TradeDecision open;
  open.intent = OrderIntent::Open;
  open.side = *side;
  open.price = snapshot.price;
  open.quantity = quantity;
  open.stop_loss = stop;
  open.take_profit = target;
  open.reason = "signal";
  return open;
}

// -----------------------------------------------------------------------------
// atr()
// -----------------------------------------------------------------------------
std::optional<double> DecisionEngine::atr(const std::string& symbol) const {
  auto it = history_.find(symbol);
  if (it == history_.end()) {
    return std::nullopt;
  }
  const BarHistory& h = it->second;
  std::vector<double> highs(h.highs.begin(), h.highs.end());
  std::vector<double> lows(h.lows.begin(), h.lows.end());
  std::vector<double> closes(h.closes.begin(), h.closes.end());
  return RiskManager::computeAtr(highs, lows, closes,
                                 risk_.limits().atr_period);
}

// -----------------------------------------------------------------------------
// stopDistanceProxy(): ATR stand-in while warming up
// -----------------------------------------------------------------------------
double DecisionEngine::stopDistanceProxy(
    const domain::SignalSnapshot& snapshot) const {
  if (snapshot.volatility > 0.0) {
    return snapshot.price * snapshot.volatility;
  }
  // Scaled so the stop lands fallback_stop_fraction away from price.
  double multiplier = risk_.limits().stop_loss_atr_multiplier;
  if (multiplier <= 0.0) {
    multiplier = 1.0;
  }
  return snapshot.price * config_.fallback_stop_fraction / multiplier;
}

}  // namespace tradegate
