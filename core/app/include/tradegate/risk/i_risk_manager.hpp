#pragma once

#include "tradegate/domain/capital_state.hpp"
#include "tradegate/domain/closed_trade.hpp"
#include "tradegate/domain/position.hpp"
#include "tradegate/domain/risk_decision.hpp"
#include "tradegate/domain/risk_limits.hpp"
#include "tradegate/risk/risk_metrics.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tradegate {

// -----------------------------------------------------------------------------
// OpenParams — arguments of IRiskManager::open()
// -----------------------------------------------------------------------------
struct OpenParams {
  std::string symbol;
  domain::PositionSide side{domain::PositionSide::Long};
  double price{0.0};
  double quantity{0.0};
  std::int64_t timestamp_ms{0};
  std::optional<double> stop_loss;
  std::optional<double> take_profit;
  double entry_fee{0.0};  // Deducted from capital immediately
};

// -----------------------------------------------------------------------------
// PendingOpens — open orders placed but not yet filled
// -----------------------------------------------------------------------------
// canOpen() adds these to the filled book, so orders in flight count against
// total exposure and the daily trade count before their fills land.
// -----------------------------------------------------------------------------
struct PendingOpens {
  double notional{0.0};
  int count{0};
};

// Which protective level a price breached.
enum class ExitTrigger {
  StopLoss,
  TakeProfit,
};

inline const char* toString(ExitTrigger t) {
  return t == ExitTrigger::StopLoss ? "stop_loss" : "take_profit";
}

// -----------------------------------------------------------------------------
// IRiskManager — the capital/position ledger and its gating rules
// -----------------------------------------------------------------------------
//
// @brief  One interface, one implementation (RiskManager). The OrderExecutor,
//         the DecisionEngine and the TradingEngine depend on this interface;
//         tests can substitute a fake.
//
// @details
// Checks (canOpen, canClose) are pure reads and never throw; they return a
// RiskDecision. Mutations (open, close) assume the matching check passed and
// throw PreconditionViolation when their preconditions do not hold.
//
// Thread model: NOT internally synchronized. The live instance is touched
// only on the TradeProcessor's consumer thread; each backtest owns its own.
// -----------------------------------------------------------------------------
class IRiskManager {
 public:
  virtual ~IRiskManager() = default;

  // --- Gates ----------------------------------------------------------------
  virtual domain::RiskDecision canOpen(
      const std::string& symbol, double price, double size,
      const PendingOpens& pending = PendingOpens{}) const = 0;
  virtual domain::RiskDecision canClose(const std::string& symbol) const = 0;

  // --- Ledger mutations -----------------------------------------------------
  virtual void open(const OpenParams& params) = 0;
  virtual domain::ClosedTrade close(const std::string& symbol, double price,
                                    std::int64_t timestamp_ms, double exit_fee,
                                    const std::string& reason) = 0;

  virtual void setProtectiveLevels(const std::string& symbol,
                                   std::optional<double> stop_loss,
                                   std::optional<double> take_profit) = 0;
  virtual std::optional<ExitTrigger> checkProtectiveLevels(
      const std::string& symbol, double price) const = 0;

  // --- Market state feeding the correlation/volatility/liquidity checks ----
  virtual void recordPrice(const std::string& symbol, double price) = 0;
  virtual void recordVolatility(const std::string& symbol,
                                double volatility) = 0;
  virtual void recordLiquidity(const std::string& symbol,
                               double liquidity) = 0;

  // --- Sizing ---------------------------------------------------------------
  virtual double positionSize(double price, double stop_loss,
                              double available_capital) const = 0;
  virtual double stopLossPrice(domain::PositionSide side, double price,
                               double atr) const = 0;
  virtual double takeProfitPrice(domain::PositionSide side, double price,
                                 double atr) const = 0;

  // --- Queries --------------------------------------------------------------
  virtual std::optional<domain::Position> position(
      const std::string& symbol) const = 0;
  virtual std::vector<domain::Position> positions() const = 0;
  virtual const std::vector<domain::ClosedTrade>& closedTrades() const = 0;
  virtual domain::CapitalState capital() const = 0;
  virtual RiskMetrics riskMetrics() const = 0;
  virtual const domain::RiskLimits& limits() const = 0;

  // --- Operator kill switch -------------------------------------------------
  virtual void halt() = 0;
  virtual void resume() = 0;
  virtual bool isHalted() const = 0;
};

}  // namespace tradegate
