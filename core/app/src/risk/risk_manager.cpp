#include "tradegate/risk/risk_manager.hpp"
#include "tradegate/domain/errors.hpp"
#include "tradegate/metrics/metric_names.hpp"
#include "tradegate/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>
#include <sstream>

namespace tradegate {

namespace {

// Sharpe gating and annualization for per-day P&L.
constexpr std::size_t kMinTradesForSharpe = 30;
constexpr double kTradingDaysPerYear = 252.0;

// Safety factor applied to the raw Kelly fraction.
constexpr double kKellySafetyFactor = 0.5;

// Relative slack on the size and exposure caps, so a quantity produced by
// positionSize() at exactly the cap is not refused on rounding.
constexpr double kCapTolerance = 1e-9;

using domain::PositionSide;
using domain::RiskDecision;
using domain::RiskRejection;

std::string describe(const char* what, double value, const char* cmp,
                     double limit) {
  std::ostringstream os;
  os << what << " " << value << " " << cmp << " limit " << limit;
  return os.str();
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
RiskManager::RiskManager(double initial_capital,
                         const domain::RiskLimits& limits,
                         const ITimeProvider& time_provider,
                         ITradeSink* trade_sink, IMetricsSink* metrics)
    : limits_(limits),
      time_(time_provider),
      trade_sink_(trade_sink),
      metrics_(metrics),
      day_index_(utc_day_index(time_provider.now_ms())),
      day_start_capital_(initial_capital) {
  if (!(initial_capital > 0.0)) {
    throw PreconditionViolation("initial capital must be positive");
  }
  capital_.current = initial_capital;
  capital_.peak = initial_capital;
}

// -----------------------------------------------------------------------------
// canOpen: ordered pre-trade checks, first failure wins
// -----------------------------------------------------------------------------
RiskDecision RiskManager::canOpen(const std::string& symbol, double price,
                                  double size,
                                  const PendingOpens& pending) const {
  if (symbol.empty() || !(price > 0.0) || !(size > 0.0) ||
      !std::isfinite(price) || !std::isfinite(size)) {
    return RiskDecision::reject(RiskRejection::InvalidOrder,
                                "symbol, price and size must be valid");
  }

  if (halted_) {
    return RiskDecision::reject(RiskRejection::Halted,
                                "trading halted by operator");
  }

  // --- Daily trade count ------------------------------------------------------
  int trades_today = effectiveDailyTrades() + pending.count;
  if (trades_today >= limits_.max_daily_trades) {
    return RiskDecision::reject(
        RiskRejection::DailyTradeLimit,
        describe("daily trades", trades_today, ">=", limits_.max_daily_trades));
  }

  // --- Daily loss -------------------------------------------------------------
  double day_start = effectiveDayStartCapital();
  double loss_today = day_start - capital_.current;
  double loss_limit = limits_.max_daily_loss * day_start;
  if (limits_.max_daily_loss > 0.0 && loss_today >= loss_limit) {
    return RiskDecision::reject(
        RiskRejection::DailyLossLimit,
        describe("daily loss", loss_today, ">=", loss_limit));
  }

  // --- Drawdown ---------------------------------------------------------------
  double drawdown = capital_.drawdown();
  if (drawdown > limits_.max_drawdown) {
    return RiskDecision::reject(
        RiskRejection::MaxDrawdown,
        describe("drawdown", drawdown, ">", limits_.max_drawdown));
  }

  // --- Position size and total exposure ---------------------------------------
  double value = price * size;
  double max_value = limits_.max_position_fraction * capital_.current;
  if (value > max_value * (1.0 + kCapTolerance)) {
    return RiskDecision::reject(
        RiskRejection::PositionTooLarge,
        describe("position value", value, ">", max_value));
  }

  double exposure_after = totalExposureValue() + pending.notional + value;
  double max_exposure = limits_.max_total_exposure * capital_.current;
  if (exposure_after > max_exposure * (1.0 + kCapTolerance)) {
    return RiskDecision::reject(
        RiskRejection::ExposureLimit,
        describe("total exposure", exposure_after, ">", max_exposure));
  }

  // --- One position per symbol ------------------------------------------------
  if (positions_.count(symbol) != 0) {
    return RiskDecision::reject(RiskRejection::DuplicatePosition,
                                "position already open for " + symbol);
  }

  // --- Correlation with open symbols ------------------------------------------
  for (const auto& [open_symbol, pos] : positions_) {
    auto rho = correlation(symbol, open_symbol);
    if (rho && std::abs(*rho) > limits_.correlation_threshold) {
      return RiskDecision::reject(
          RiskRejection::CorrelationLimit,
          describe(("correlation with " + open_symbol).c_str(), *rho, ">",
                   limits_.correlation_threshold));
    }
  }

  // --- Volatility band (latest observation; no data passes) --------------------
  auto vol_it = volatility_history_.find(symbol);
  if (vol_it != volatility_history_.end() && !vol_it->second.empty()) {
    double vol = vol_it->second.back();
    if (vol < limits_.min_volatility || vol > limits_.max_volatility) {
      std::ostringstream os;
      os << "volatility " << vol << " outside [" << limits_.min_volatility
         << ", " << limits_.max_volatility << "]";
      return RiskDecision::reject(RiskRejection::VolatilityOutOfRange,
                                  os.str());
    }
  }

  // --- Liquidity floor (mean of the window; no data passes) --------------------
  auto liq_it = liquidity_history_.find(symbol);
  if (liq_it != liquidity_history_.end() && !liq_it->second.empty()) {
    const auto& h = liq_it->second;
    double mean = std::accumulate(h.begin(), h.end(), 0.0) /
                  static_cast<double>(h.size());
    if (mean < limits_.min_liquidity) {
      return RiskDecision::reject(
          RiskRejection::InsufficientLiquidity,
          describe("liquidity", mean, "<", limits_.min_liquidity));
    }
  }

  // --- Per-symbol trade interval ----------------------------------------------
  auto last_it = last_trade_ms_.find(symbol);
  if (last_it != last_trade_ms_.end()) {
    std::int64_t elapsed = time_.now_ms() - last_it->second;
    std::int64_t required = seconds_to_ms(limits_.min_trade_interval_s);
    if (elapsed < required) {
      return RiskDecision::reject(
          RiskRejection::TradeInterval,
          describe("ms since last trade", static_cast<double>(elapsed), "<",
                   static_cast<double>(required)));
    }
  }

  return RiskDecision::allow();
}

// -----------------------------------------------------------------------------
// canClose
// -----------------------------------------------------------------------------
RiskDecision RiskManager::canClose(const std::string& symbol) const {
  if (positions_.count(symbol) == 0) {
    return RiskDecision::reject(RiskRejection::NoOpenPosition,
                                "no open position for " + symbol);
  }
  return RiskDecision::allow();
}

// -----------------------------------------------------------------------------
// open
// -----------------------------------------------------------------------------
void RiskManager::open(const OpenParams& params) {
  if (!(params.price > 0.0) || !(params.quantity > 0.0)) {
    throw PreconditionViolation("open " + params.symbol +
                                ": price and quantity must be positive");
  }
  if (params.entry_fee < 0.0) {
    throw PreconditionViolation("open " + params.symbol +
                                ": entry fee must not be negative");
  }
  if (positions_.count(params.symbol) != 0) {
    throw PreconditionViolation("open " + params.symbol +
                                ": position already open");
  }

  rollDayIfNeeded();

  domain::Position pos;
  pos.symbol = params.symbol;
  pos.side = params.side;
  pos.entry_price = params.price;
  pos.quantity = params.quantity;
  pos.opened_ms = params.timestamp_ms;
  pos.stop_loss = params.stop_loss;
  pos.take_profit = params.take_profit;
  pos.entry_fee = params.entry_fee;

  capital_.current -= params.entry_fee;
  positions_.emplace(params.symbol, pos);
  ++daily_trades_;
  last_trade_ms_[params.symbol] = time_.now_ms();

  std::cout << "[RiskManager] OPEN " << domain::toString(params.side) << " "
            << params.symbol << " qty=" << params.quantity
            << " @ " << params.price << " fee=" << params.entry_fee
            << " capital=" << capital_.current << "\n";

  publishGauges();
}

// -----------------------------------------------------------------------------
// close
// -----------------------------------------------------------------------------
domain::ClosedTrade RiskManager::close(const std::string& symbol, double price,
                                       std::int64_t timestamp_ms,
                                       double exit_fee,
                                       const std::string& reason) {
  auto it = positions_.find(symbol);
  if (it == positions_.end()) {
    throw PreconditionViolation("close " + symbol + ": no open position");
  }
  if (!(price > 0.0)) {
    throw PreconditionViolation("close " + symbol +
                                ": price must be positive");
  }
  if (exit_fee < 0.0) {
    throw PreconditionViolation("close " + symbol +
                                ": exit fee must not be negative");
  }

  rollDayIfNeeded();

  const domain::Position& pos = it->second;
  double gross = (price - pos.entry_price) * pos.quantity;
  if (pos.side == PositionSide::Short) {
    gross = -gross;
  }

  domain::ClosedTrade trade;
  trade.symbol = symbol;
  trade.side = pos.side;
  trade.entry_price = pos.entry_price;
  trade.exit_price = price;
  trade.quantity = pos.quantity;
  trade.entry_ms = pos.opened_ms;
  trade.exit_ms = timestamp_ms;
  trade.fees = pos.entry_fee + exit_fee;
  trade.pnl = gross - trade.fees;
  trade.reason = reason;

  // The entry fee already left capital at open().
  capital_.current += gross - exit_fee;
  capital_.peak = std::max(capital_.peak, capital_.current);

  positions_.erase(it);
  trades_.push_back(trade);

  std::cout << "[RiskManager] CLOSE " << domain::toString(trade.side) << " "
            << symbol << " @ " << price << " pnl=" << trade.pnl
            << " reason=" << reason << " capital=" << capital_.current
            << "\n";

  if (trade_sink_ != nullptr) {
    trade_sink_->recordTrade(trade);
  }
  if (metrics_ != nullptr) {
    metrics_->incrementCounter(metric::kTradesClosed, 1.0);
  }
  publishGauges();

  return trade;
}

// -----------------------------------------------------------------------------
// Protective levels
// -----------------------------------------------------------------------------
void RiskManager::setProtectiveLevels(const std::string& symbol,
                                      std::optional<double> stop_loss,
                                      std::optional<double> take_profit) {
  auto it = positions_.find(symbol);
  if (it == positions_.end()) {
    throw PreconditionViolation("set levels " + symbol +
                                ": no open position");
  }
  it->second.stop_loss = stop_loss;
  it->second.take_profit = take_profit;
}

std::optional<ExitTrigger> RiskManager::checkProtectiveLevels(
    const std::string& symbol, double price) const {
  auto it = positions_.find(symbol);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  const domain::Position& pos = it->second;

  if (pos.side == PositionSide::Long) {
    if (pos.stop_loss && price <= *pos.stop_loss) {
      return ExitTrigger::StopLoss;
    }
    if (pos.take_profit && price >= *pos.take_profit) {
      return ExitTrigger::TakeProfit;
    }
  } else {
    if (pos.stop_loss && price >= *pos.stop_loss) {
      return ExitTrigger::StopLoss;
    }
    if (pos.take_profit && price <= *pos.take_profit) {
      return ExitTrigger::TakeProfit;
    }
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// Market-state histories
// -----------------------------------------------------------------------------
void RiskManager::recordPrice(const std::string& symbol, double price) {
  pushBounded(price_history_[symbol], price, limits_.history_depth);
  if (positions_.count(symbol) != 0) {
    publishGauges();
  }
}

void RiskManager::recordVolatility(const std::string& symbol,
                                   double volatility) {
  pushBounded(volatility_history_[symbol], volatility, limits_.history_depth);
}

void RiskManager::recordLiquidity(const std::string& symbol,
                                  double liquidity) {
  pushBounded(liquidity_history_[symbol], liquidity, limits_.history_depth);
}

void RiskManager::pushBounded(std::deque<double>& history, double value,
                              std::size_t depth) {
  history.push_back(value);
  while (history.size() > depth) {
    history.pop_front();
  }
}

// -----------------------------------------------------------------------------
// Sizing
// -----------------------------------------------------------------------------
double RiskManager::positionSize(double price, double stop_loss,
                                 double available_capital) const {
  if (!(price > 0.0) || !(available_capital > 0.0)) {
    return 0.0;
  }
  double distance = std::abs(price - stop_loss);
  if (distance == 0.0) {
    return 0.0;
  }
  double risk_sized = limits_.risk_per_trade * available_capital / distance;
  double cap = limits_.max_position_fraction * available_capital / price;
  return std::min(risk_sized, cap);
}

double RiskManager::stopLossPrice(PositionSide side, double price,
                                  double atr) const {
  double offset = atr * limits_.stop_loss_atr_multiplier;
  return side == PositionSide::Long ? price - offset : price + offset;
}

double RiskManager::takeProfitPrice(PositionSide side, double price,
                                    double atr) const {
  double offset = atr * limits_.take_profit_atr_multiplier;
  return side == PositionSide::Long ? price + offset : price - offset;
}

// -----------------------------------------------------------------------------
// computeAtr
// -----------------------------------------------------------------------------
std::optional<double> RiskManager::computeAtr(const std::vector<double>& highs,
                                              const std::vector<double>& lows,
                                              const std::vector<double>& closes,
                                              int period) {
  if (highs.size() != lows.size() || highs.size() != closes.size()) {
    throw PreconditionViolation("computeAtr: series lengths differ");
  }
  if (period <= 0 || highs.size() < static_cast<std::size_t>(period)) {
    return std::nullopt;
  }

  std::size_t n = highs.size();
  std::size_t first = n - static_cast<std::size_t>(period);
  double sum = 0.0;
  for (std::size_t i = first; i < n; ++i) {
    double tr = highs[i] - lows[i];
    if (i > 0) {
      tr = std::max({tr, std::abs(highs[i] - closes[i - 1]),
                     std::abs(lows[i] - closes[i - 1])});
    }
    sum += tr;
  }
  return sum / static_cast<double>(period);
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::optional<domain::Position> RiskManager::position(
    const std::string& symbol) const {
  auto it = positions_.find(symbol);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Position> RiskManager::positions() const {
  std::vector<domain::Position> out;
  out.reserve(positions_.size());
  for (const auto& [symbol, pos] : positions_) {
    out.push_back(pos);
  }
  return out;
}

const std::vector<domain::ClosedTrade>& RiskManager::closedTrades() const {
  return trades_;
}

domain::CapitalState RiskManager::capital() const { return capital_; }

// -----------------------------------------------------------------------------
// correlation: Pearson over the trailing window of both price histories
// -----------------------------------------------------------------------------
std::optional<double> RiskManager::correlation(const std::string& a,
                                               const std::string& b) const {
  auto it_a = price_history_.find(a);
  auto it_b = price_history_.find(b);
  std::size_t window = limits_.correlation_window;
  if (window < 2 || it_a == price_history_.end() ||
      it_b == price_history_.end() || it_a->second.size() < window ||
      it_b->second.size() < window) {
    return std::nullopt;
  }

  const auto& xs = it_a->second;
  const auto& ys = it_b->second;
  std::size_t off_x = xs.size() - window;
  std::size_t off_y = ys.size() - window;

  double mean_x = 0.0;
  double mean_y = 0.0;
  for (std::size_t i = 0; i < window; ++i) {
    mean_x += xs[off_x + i];
    mean_y += ys[off_y + i];
  }
  mean_x /= static_cast<double>(window);
  mean_y /= static_cast<double>(window);

  double cov = 0.0;
  double var_x = 0.0;
  double var_y = 0.0;
  for (std::size_t i = 0; i < window; ++i) {
    double dx = xs[off_x + i] - mean_x;
    double dy = ys[off_y + i] - mean_y;
    cov += dx * dy;
    var_x += dx * dx;
    var_y += dy * dy;
  }
  if (var_x == 0.0 || var_y == 0.0) {
    return std::nullopt;
  }
  return cov / std::sqrt(var_x * var_y);
}

// -----------------------------------------------------------------------------
// riskMetrics
// -----------------------------------------------------------------------------
RiskMetrics RiskManager::riskMetrics() const {
  RiskMetrics m;
  m.capital = capital_.current;
  m.peak_capital = capital_.peak;
  m.drawdown = capital_.drawdown();
  m.daily_pnl = capital_.current - effectiveDayStartCapital();
  m.daily_trades = effectiveDailyTrades();
  m.open_positions = positions_.size();
  m.closed_trades = trades_.size();
  m.halted = halted_.load();

  for (const auto& [symbol, pos] : positions_) {
    double fraction =
        capital_.current > 0.0 ? pos.value() / capital_.current : 0.0;
    m.exposure_by_symbol[symbol] = fraction;
    m.total_exposure += fraction;

    double unrealized = unrealizedPnl(pos);
    m.unrealized_by_symbol[symbol] = unrealized;
    m.unrealized_pnl += unrealized;
  }

  std::size_t wins = 0;
  std::size_t losses = 0;
  double gross_win = 0.0;
  double gross_loss = 0.0;
  for (const auto& t : trades_) {
    if (t.pnl > 0.0) {
      ++wins;
      gross_win += t.pnl;
    } else if (t.pnl < 0.0) {
      ++losses;
      gross_loss += -t.pnl;
    }
  }

  if (!trades_.empty()) {
    m.win_rate = static_cast<double>(wins) / static_cast<double>(trades_.size());
  }
  if (gross_loss > 0.0) {
    m.profit_factor = gross_win / gross_loss;
  }
  if (wins > 0 && losses > 0) {
    double avg_win = gross_win / static_cast<double>(wins);
    double avg_loss = gross_loss / static_cast<double>(losses);
    double ratio = avg_win / avg_loss;
    m.avg_win_loss_ratio = ratio;
    double kelly = (m.win_rate * ratio - (1.0 - m.win_rate)) / ratio;
    m.kelly_fraction = std::max(0.0, kelly * kKellySafetyFactor);
  }
  m.sharpe_ratio = sharpeRatio();
  return m;
}

// -----------------------------------------------------------------------------
// sharpeRatio: annualized mean/std of per-exit-day P&L
// -----------------------------------------------------------------------------
std::optional<double> RiskManager::sharpeRatio() const {
  if (trades_.size() < kMinTradesForSharpe) {
    return std::nullopt;
  }

  std::map<std::int64_t, double> pnl_by_day;
  for (const auto& t : trades_) {
    pnl_by_day[utc_day_index(t.exit_ms)] += t.pnl;
  }
  if (pnl_by_day.size() < 2) {
    return std::nullopt;
  }

  double n = static_cast<double>(pnl_by_day.size());
  double mean = 0.0;
  for (const auto& [day, pnl] : pnl_by_day) {
    mean += pnl;
  }
  mean /= n;

  double var = 0.0;
  for (const auto& [day, pnl] : pnl_by_day) {
    var += (pnl - mean) * (pnl - mean);
  }
  double stddev = std::sqrt(var / n);
  if (stddev == 0.0) {
    return std::nullopt;
  }
  return std::sqrt(kTradingDaysPerYear) * mean / stddev;
}

// -----------------------------------------------------------------------------
// Kill switch
// -----------------------------------------------------------------------------
void RiskManager::halt() {
  halted_ = true;
  std::cerr << "[RiskManager] CRITICAL: trading halted. New positions will "
               "be rejected until resume().\n";
}

void RiskManager::resume() {
  halted_ = false;
  std::cout << "[RiskManager] trading resumed.\n";
}

// -----------------------------------------------------------------------------
// Daily rollover helpers
// -----------------------------------------------------------------------------
void RiskManager::rollDayIfNeeded() {
  std::int64_t today = utc_day_index(time_.now_ms());
  if (today != day_index_) {
    day_index_ = today;
    daily_trades_ = 0;
    day_start_capital_ = capital_.current;
  }
}

int RiskManager::effectiveDailyTrades() const {
  return utc_day_index(time_.now_ms()) == day_index_ ? daily_trades_ : 0;
}

double RiskManager::effectiveDayStartCapital() const {
  return utc_day_index(time_.now_ms()) == day_index_ ? day_start_capital_
                                                      : capital_.current;
}

double RiskManager::totalExposureValue() const {
  double total = 0.0;
  for (const auto& [symbol, pos] : positions_) {
    total += pos.value();
  }
  return total;
}

// Marked at the latest recorded price; entry price until one arrives.
double RiskManager::unrealizedPnl(const domain::Position& pos) const {
  double mark = pos.entry_price;
  auto it = price_history_.find(pos.symbol);
  if (it != price_history_.end() && !it->second.empty()) {
    mark = it->second.back();
  }
  double pnl = (mark - pos.entry_price) * pos.quantity;
  return pos.side == PositionSide::Short ? -pnl : pnl;
}

void RiskManager::publishGauges() {
  if (metrics_ == nullptr) {
    return;
  }
  double unrealized = 0.0;
  for (const auto& [symbol, pos] : positions_) {
    unrealized += unrealizedPnl(pos);
  }
  metrics_->setGauge(metric::kCapital, capital_.current);
  metrics_->setGauge(metric::kDrawdown, capital_.drawdown());
  metrics_->setGauge(metric::kOpenPositions,
                     static_cast<double>(positions_.size()));
  metrics_->setGauge(metric::kUnrealizedPnl, unrealized);
}

}  // namespace tradegate
