#pragma once

#include "tradegate/metrics/i_metrics_sink.hpp"
#include "tradegate/persistence/i_trade_sink.hpp"
#include "tradegate/risk/i_risk_manager.hpp"
#include "tradegate/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tradegate {

// -----------------------------------------------------------------------------
// RiskManager — canonical IRiskManager
// -----------------------------------------------------------------------------
//
// @brief  Owns capital, peak capital, open positions, daily counters and the
//         per-symbol market-state histories, and applies every pre-trade
//         rule against them.
//
// @details
// canOpen() evaluates, in order, and reports the first failure:
//
//   invalid input → halted → daily trade count → daily loss → drawdown →
//   position size → total exposure → duplicate symbol → correlation →
//   volatility band → liquidity floor → per-symbol trade interval
//
// The daily trade count and total exposure include `pending`, the open
// orders the caller has in flight.
//
// Daily counters belong to the UTC day of the injected clock. A check made
// on a later day sees zero trades and today's starting capital even before
// the next mutation rolls the stored counters over.
//
// Fees: open() deducts the entry fee from capital at once. close() credits
// the gross move minus the exit fee, and reports pnl net of both fees on the
// ClosedTrade. With zero fees, capital moves by exactly the trade's pnl.
//
// Thread model:
//   Not synchronized. The live engine touches it only from the
//   TradeProcessor's consumer thread. Each backtest constructs its own.
//
// Ownership:
//   The time provider, trade sink and metrics sink are borrowed and must
//   outlive the RiskManager. Both sinks are optional (nullptr).
// -----------------------------------------------------------------------------
class RiskManager final : public IRiskManager {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  initial_capital  Starting capital; also the initial peak. Must
  //                          be positive (PreconditionViolation otherwise).
  // @param  limits           Copied; fixed for the manager's lifetime.
  // @param  time_provider    Clock for intervals and daily rollover.
  // @param  trade_sink       Receives every ClosedTrade. Optional.
  // @param  metrics          Receives capital/drawdown gauges. Optional.
  // -------------------------------------------------------------------------
  RiskManager(double initial_capital, const domain::RiskLimits& limits,
              const ITimeProvider& time_provider,
              ITradeSink* trade_sink = nullptr,
              IMetricsSink* metrics = nullptr);

  RiskManager(const RiskManager&) = delete;
  RiskManager& operator=(const RiskManager&) = delete;

  domain::RiskDecision canOpen(
      const std::string& symbol, double price, double size,
      const PendingOpens& pending = PendingOpens{}) const override;
  domain::RiskDecision canClose(const std::string& symbol) const override;

  // -------------------------------------------------------------------------
  // open(params)
  // -------------------------------------------------------------------------
  // @brief  Inserts a position, counts a daily trade and stamps the symbol's
  //         last trade time.
  //
  // @throws PreconditionViolation  on non-positive price/quantity, a
  //         negative fee, or a symbol that already has an open position.
  //
  // @details
  // Does not re-run canOpen(): callers gate first. The symmetric check for
  // duplicates is kept because a second position on a symbol would corrupt
  // the one-position-per-symbol ledger.
  // -------------------------------------------------------------------------
  void open(const OpenParams& params) override;

  // -------------------------------------------------------------------------
  // close(symbol, price, timestamp_ms, exit_fee, reason)
  // -------------------------------------------------------------------------
  // @brief  Removes the symbol's position and realizes its P&L.
  //
  // @return The ClosedTrade appended to the history.
  //
  // @throws PreconditionViolation  when nothing is open for symbol or the
  //         price is not positive.
  // -------------------------------------------------------------------------
  domain::ClosedTrade close(const std::string& symbol, double price,
                            std::int64_t timestamp_ms, double exit_fee,
                            const std::string& reason) override;

  void setProtectiveLevels(const std::string& symbol,
                           std::optional<double> stop_loss,
                           std::optional<double> take_profit) override;
  std::optional<ExitTrigger> checkProtectiveLevels(const std::string& symbol,
                                                   double price) const override;

  void recordPrice(const std::string& symbol, double price) override;
  void recordVolatility(const std::string& symbol, double volatility) override;
  void recordLiquidity(const std::string& symbol, double liquidity) override;

  // -------------------------------------------------------------------------
  // positionSize(price, stop_loss, available_capital)
  // -------------------------------------------------------------------------
  // @brief  Fixed-fractional sizing clamped by the position cap.
  //
  // @return min(risk_per_trade × capital / |price − stop|,
  //             max_position_fraction × capital / price)
  //         or 0 when price == stop, price <= 0 or capital <= 0.
  // -------------------------------------------------------------------------
  double positionSize(double price, double stop_loss,
                      double available_capital) const override;
  double stopLossPrice(domain::PositionSide side, double price,
                       double atr) const override;
  double takeProfitPrice(domain::PositionSide side, double price,
                         double atr) const override;

  // -------------------------------------------------------------------------
  // computeAtr(highs, lows, closes, period)
  // -------------------------------------------------------------------------
  // @brief  Average True Range over the trailing `period` bars.
  //
  // @return nullopt with fewer than `period` bars or a non-positive period.
  //
  // @throws PreconditionViolation  when the three series differ in length.
  //
  // @details
  // TR(i) = max(high − low, |high − close(i−1)|, |low − close(i−1)|). The
  // first bar has no previous close, so its TR is high − low.
  // -------------------------------------------------------------------------
  static std::optional<double> computeAtr(const std::vector<double>& highs,
                                          const std::vector<double>& lows,
                                          const std::vector<double>& closes,
                                          int period);

  std::optional<domain::Position> position(
      const std::string& symbol) const override;
  std::vector<domain::Position> positions() const override;
  const std::vector<domain::ClosedTrade>& closedTrades() const override;
  domain::CapitalState capital() const override;
  RiskMetrics riskMetrics() const override;
  const domain::RiskLimits& limits() const override { return limits_; }

  void halt() override;
  void resume() override;
  bool isHalted() const override { return halted_.load(); }

  // Pearson correlation of the last correlation_window recorded prices of
  // two symbols; nullopt while either history is shorter than the window
  // or either series is flat.
  std::optional<double> correlation(const std::string& a,
                                    const std::string& b) const;

 private:
  void rollDayIfNeeded();
  int effectiveDailyTrades() const;
  double effectiveDayStartCapital() const;
  double totalExposureValue() const;
  double unrealizedPnl(const domain::Position& pos) const;
  std::optional<double> sharpeRatio() const;
  void publishGauges();

  static void pushBounded(std::deque<double>& history, double value,
                          std::size_t depth);

  domain::RiskLimits limits_;
  const ITimeProvider& time_;
  ITradeSink* trade_sink_;
  IMetricsSink* metrics_;

  domain::CapitalState capital_;
  std::map<std::string, domain::Position> positions_;
  std::vector<domain::ClosedTrade> trades_;

  std::int64_t day_index_;
  int daily_trades_{0};
  double day_start_capital_;

  std::map<std::string, std::int64_t> last_trade_ms_;
  std::map<std::string, std::deque<double>> price_history_;
  std::map<std::string, std::deque<double>> volatility_history_;
  std::map<std::string, std::deque<double>> liquidity_history_;

  // Written by operator commands from another thread.
  std::atomic<bool> halted_{false};
};

}  // namespace tradegate
