#pragma once

#include "tradegate/domain/order.hpp"
#include "tradegate/domain/signal_snapshot.hpp"
#include "tradegate/risk/i_risk_manager.hpp"
#include "tradegate/strategy/strategy_config.hpp"

#include <deque>
#include <map>
#include <optional>
#include <string>

namespace tradegate {

// What the DecisionEngine wants done on a snapshot.
struct TradeDecision {
  domain::OrderIntent intent{domain::OrderIntent::Open};
  domain::PositionSide side{domain::PositionSide::Long};
  double price{0.0};
  double quantity{0.0};  // Open only
  std::optional<double> stop_loss;
  std::optional<double> take_profit;
  std::string reason;
};

// -----------------------------------------------------------------------------
// DecisionEngine — rules + ATR stops + risk sizing, shared by live and replay
// -----------------------------------------------------------------------------
//
// @brief  Turns each SignalSnapshot into an open, a close, or nothing.
//
// @details
// observe() keeps a per-symbol bar history (bounded by history_depth) for
// the ATR and feeds price, volatility and liquidity into the IRiskManager's
// market-state histories. evaluate() then:
//
//   position open → protective level breached? close "stop_loss" /
//                   "take_profit"; else exitSignal() reason; else nothing.
//   flat          → entrySignal() side; stop/target from ATR via the risk
//                   manager's multipliers; size via positionSize(). A zero
//                   size means nothing.
//
// While fewer than atr_period bars exist, price × volatility stands in for
// the ATR; without volatility the stop is placed fallback_stop_fraction
// away from price.
//
// evaluate() does NOT call canOpen(): the live path gates in the
// OrderExecutor and the backtest gates explicitly, so each sees its own
// rejection.
//
// Thread model: not synchronized; runs where its IRiskManager runs.
// -----------------------------------------------------------------------------
class DecisionEngine {
 public:
  DecisionEngine(IRiskManager& risk, const StrategyConfig& config);

  DecisionEngine(const DecisionEngine&) = delete;
  DecisionEngine& operator=(const DecisionEngine&) = delete;

  void observe(const domain::SignalSnapshot& snapshot);

  std::optional<TradeDecision> evaluate(const domain::SignalSnapshot& snapshot,
                                        double available_capital) const;

  // ATR over the observed history, nullopt while warming up.
  std::optional<double> atr(const std::string& symbol) const;

 private:
  struct BarHistory {
    std::deque<double> highs;
    std::deque<double> lows;
    std::deque<double> closes;
  };

  double stopDistanceProxy(const domain::SignalSnapshot& snapshot) const;

  IRiskManager& risk_;
  StrategyConfig config_;
  std::map<std::string, BarHistory> history_;
};

}  // namespace tradegate
