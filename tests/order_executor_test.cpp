// =============================================================================
// order_executor_test.cpp
// =============================================================================
// Unit tests for tradegate::OrderExecutor.
//
// Validates:
//   - Placement: per-symbol throttle and pending-order check, then the risk
//     gate; accepted orders are Pending with a fresh id
//   - Fills open or close positions in the RiskManager, with fees
//   - Slippage above max_slippage is flagged but still applied
//   - Cancel / fail transitions and the terminal-state guard
//   - markFailed() releases the throttle stamp of the failed order
//   - Pending opens reserve exposure and daily trades until they settle
//   - A Pending order with no fill inside pending_timeout_s is failed
//
// The executor runs against a real RiskManager on a simulation clock.
// =============================================================================

#include "tradegate/concurrent/order_id_generator.hpp"
#include "tradegate/domain/errors.hpp"
#include "tradegate/execution/order_executor.hpp"
#include "tradegate/metrics/in_memory_metrics.hpp"
#include "tradegate/metrics/metric_names.hpp"
#include "tradegate/risk/risk_manager.hpp"
#include "tradegate/time/simulation_time_provider.hpp"
#include "tradegate/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <memory>

using tradegate::domain::OrderIntent;
using tradegate::domain::OrderStatus;
using tradegate::domain::PlaceOrderRequest;
using tradegate::domain::PositionSide;
using tradegate::domain::RiskRejection;
using tradegate::domain::Side;

namespace {

constexpr std::int64_t kNoon =
    19675 * tradegate::kMillisPerDay + 12 * tradegate::kMillisPerHour;

PlaceOrderRequest openRequest(const std::string& symbol, double price,
                              double qty,
                              PositionSide side = PositionSide::Long) {
  PlaceOrderRequest r;
  r.symbol = symbol;
  r.intent = OrderIntent::Open;
  r.position_side = side;
  r.price = price;
  r.quantity = qty;
  return r;
}

PlaceOrderRequest closeRequest(const std::string& symbol, double price) {
  PlaceOrderRequest r;
  r.symbol = symbol;
  r.intent = OrderIntent::Close;
  r.price = price;
  r.reason = "overbought_macd_cross";
  return r;
}

}  // namespace

// =============================================================================
// Fixture: capital 1000, default limits and executor policy.
// =============================================================================
class OrderExecutorTest : public ::testing::Test {
 protected:
  void SetUp() override { rebuild(); }

  void rebuild() {
    executor.reset();
    risk = std::make_unique<tradegate::RiskManager>(1000.0, limits, clock);
    executor = std::make_unique<tradegate::OrderExecutor>(
        *risk, clock, ids, config, &metrics);
  }

  // Places and fills an open at the requested price.
  tradegate::domain::OrderId openFilled(const std::string& symbol,
                                        double price, double qty) {
    auto placed = executor->placeOrder(openRequest(symbol, price, qty));
    EXPECT_TRUE(placed.accepted()) << placed.decision.detail;
    EXPECT_TRUE(executor->handleFill(placed.order_id, price, qty));
    return placed.order_id;
  }

  tradegate::SimulationTimeProvider clock{kNoon};
  tradegate::domain::RiskLimits limits;
  tradegate::ExecutorConfig config;
  tradegate::OrderIdGenerator ids;
  tradegate::InMemoryMetrics metrics;
  std::unique_ptr<tradegate::RiskManager> risk;
  std::unique_ptr<tradegate::OrderExecutor> executor;
};

// -----------------------------------------------------------------------------
// 1. An allowed open becomes a Pending Buy order with id 1.
// Why: The position must not exist until the fill arrives.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, AcceptedOpenIsPending) {
  auto placed = executor->placeOrder(openRequest("SOL", 100.0, 1.0));
  ASSERT_TRUE(placed.accepted());
  EXPECT_EQ(placed.order_id, 1u);

  auto order = executor->order(placed.order_id);
  ASSERT_TRUE(order.has_value());
  EXPECT_EQ(order->status, OrderStatus::Pending);
  EXPECT_EQ(order->side, Side::Buy);
  EXPECT_EQ(order->created_ms, kNoon);
  EXPECT_FALSE(risk->position("SOL").has_value());
  EXPECT_EQ(executor->pendingOrders().size(), 1u);
  EXPECT_DOUBLE_EQ(metrics.counter(tradegate::metric::kOrdersPlaced), 1.0);
}

// -----------------------------------------------------------------------------
// 2. A risk rejection creates no order and carries the reason.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, RiskRejectionCreatesNoOrder) {
  auto placed = executor->placeOrder(openRequest("SOL", 100.0, 5.0));
  EXPECT_FALSE(placed.accepted());
  EXPECT_EQ(placed.decision.rejection, RiskRejection::PositionTooLarge);
  EXPECT_EQ(placed.order_id, 0u);
  EXPECT_TRUE(executor->pendingOrders().empty());
  EXPECT_DOUBLE_EQ(metrics.counter(tradegate::metric::kOrdersRejected), 1.0);
}

// -----------------------------------------------------------------------------
// 3. A second order on a symbol with a Pending order is refused.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, PendingOrderBlocksSameSymbol) {
  ASSERT_TRUE(executor->placeOrder(openRequest("SOL", 100.0, 1.0)).accepted());
  auto second = executor->placeOrder(openRequest("SOL", 100.0, 0.5));
  EXPECT_EQ(second.decision.rejection, RiskRejection::PendingOrder);

  EXPECT_TRUE(executor->placeOrder(openRequest("ETH", 100.0, 0.5)).accepted());
}

// -----------------------------------------------------------------------------
// 4. Orders on a symbol are spaced by min_order_interval_s; a close takes
//    its side and size from the open position.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, ThrottleThenCloseFromPosition) {
  openFilled("SOL", 100.0, 0.8);

  auto early = executor->placeOrder(closeRequest("SOL", 105.0));
  EXPECT_EQ(early.decision.rejection, RiskRejection::OrderThrottled);

  clock.advance_by(60 * tradegate::kMillisPerSecond);
  auto placed = executor->placeOrder(closeRequest("SOL", 105.0));
  ASSERT_TRUE(placed.accepted()) << placed.decision.detail;

  auto order = executor->order(placed.order_id);
  ASSERT_TRUE(order.has_value());
  EXPECT_EQ(order->side, Side::Sell);
  EXPECT_DOUBLE_EQ(order->quantity, 0.8);
  EXPECT_EQ(order->position_side, PositionSide::Long);
}

// -----------------------------------------------------------------------------
// 5. An open fill creates the position with its protective levels.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, OpenFillCreatesPosition) {
  PlaceOrderRequest req = openRequest("SOL", 100.0, 1.0);
  req.stop_loss = 96.0;
  req.take_profit = 106.0;
  auto placed = executor->placeOrder(req);
  ASSERT_TRUE(placed.accepted());

  ASSERT_TRUE(executor->handleFill(placed.order_id, 100.0, 1.0));
  auto order = executor->order(placed.order_id);
  EXPECT_EQ(order->status, OrderStatus::Filled);
  EXPECT_DOUBLE_EQ(order->filled_price, 100.0);
  EXPECT_DOUBLE_EQ(order->filled_quantity, 1.0);

  auto pos = risk->position("SOL");
  ASSERT_TRUE(pos.has_value());
  EXPECT_EQ(pos->stop_loss, 96.0);
  EXPECT_EQ(pos->take_profit, 106.0);
  EXPECT_DOUBLE_EQ(metrics.counter(tradegate::metric::kOrdersFilled), 1.0);
}

// -----------------------------------------------------------------------------
// 6. Fills for unknown or already-filled orders are ignored.
// Why: Duplicate fill notices must never open a second position.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, DuplicateAndUnknownFillsIgnored) {
  auto id = openFilled("SOL", 100.0, 1.0);
  EXPECT_FALSE(executor->handleFill(id, 100.0, 1.0));
  EXPECT_FALSE(executor->handleFill(999, 100.0, 1.0));
  EXPECT_EQ(risk->positions().size(), 1u);
}

// -----------------------------------------------------------------------------
// 7. A close fill books the trade with the order's reason.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, CloseFillBooksTrade) {
  openFilled("SOL", 100.0, 1.0);
  clock.advance_by(60 * tradegate::kMillisPerSecond);

  auto placed = executor->placeOrder(closeRequest("SOL", 110.0));
  ASSERT_TRUE(placed.accepted());
  ASSERT_TRUE(executor->handleFill(placed.order_id, 110.0, 1.0));

  ASSERT_EQ(risk->closedTrades().size(), 1u);
  const auto& trade = risk->closedTrades().front();
  EXPECT_DOUBLE_EQ(trade.pnl, 10.0);
  EXPECT_EQ(trade.reason, "overbought_macd_cross");
  EXPECT_DOUBLE_EQ(risk->capital().current, 1010.0);
}

// -----------------------------------------------------------------------------
// 8. Closing without a position is refused by the risk gate.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, CloseWithoutPositionRejected) {
  auto placed = executor->placeOrder(closeRequest("SOL", 100.0));
  EXPECT_EQ(placed.decision.rejection, RiskRejection::NoOpenPosition);
}

// -----------------------------------------------------------------------------
// 9. Cancel is only legal from Pending.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, CancelPendingOnly) {
  auto placed = executor->placeOrder(openRequest("SOL", 100.0, 1.0));
  ASSERT_TRUE(executor->cancelOrder(placed.order_id));
  EXPECT_EQ(executor->order(placed.order_id)->status, OrderStatus::Cancelled);
  EXPECT_FALSE(executor->cancelOrder(placed.order_id));
  EXPECT_FALSE(executor->handleFill(placed.order_id, 100.0, 1.0));
  EXPECT_FALSE(risk->position("SOL").has_value());
}

// -----------------------------------------------------------------------------
// 10. A transport failure marks the order Failed and lets the symbol be
//     retried at once.
// Why: The failed order never reached the venue; throttling its retry
//      would only delay the same trade.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, MarkFailedReleasesThrottle) {
  auto placed = executor->placeOrder(openRequest("SOL", 100.0, 1.0));
  ASSERT_TRUE(executor->markFailed(placed.order_id, "venue timeout"));

  auto order = executor->order(placed.order_id);
  EXPECT_EQ(order->status, OrderStatus::Failed);
  EXPECT_EQ(order->failure_reason, "venue timeout");
  EXPECT_DOUBLE_EQ(metrics.counter(tradegate::metric::kOrdersFailed), 1.0);

  auto retry = executor->placeOrder(openRequest("SOL", 100.0, 1.0));
  EXPECT_TRUE(retry.accepted()) << retry.decision.detail;
  EXPECT_EQ(retry.order_id, 2u);
}

// -----------------------------------------------------------------------------
// 11. Slippage beyond max_slippage is counted but the fill still applies.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, SlippageIsAdvisory) {
  auto placed = executor->placeOrder(openRequest("SOL", 100.0, 0.9));
  ASSERT_TRUE(executor->handleFill(placed.order_id, 101.0, 0.9));

  EXPECT_DOUBLE_EQ(metrics.counter(tradegate::metric::kSlippageWarnings), 1.0);
  EXPECT_DOUBLE_EQ(risk->position("SOL")->entry_price, 101.0);
}

// -----------------------------------------------------------------------------
// 12. fee_rate × fill notional is charged on each fill.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, FeeChargedOnFill) {
  config.fee_rate = 0.001;
  rebuild();
  openFilled("SOL", 100.0, 1.0);
  EXPECT_NEAR(risk->capital().current, 999.9, 1e-9);
}

// -----------------------------------------------------------------------------
// 13. If the RiskManager refuses the fill, the order fails and the error
//     propagates.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, LedgerViolationFailsOrder) {
  auto placed = executor->placeOrder(openRequest("SOL", 100.0, 1.0));
  tradegate::OpenParams direct;
  direct.symbol = "SOL";
  direct.price = 100.0;
  direct.quantity = 0.5;
  risk->open(direct);

  EXPECT_THROW(executor->handleFill(placed.order_id, 100.0, 1.0),
               tradegate::PreconditionViolation);
  EXPECT_EQ(executor->order(placed.order_id)->status, OrderStatus::Failed);
}

// -----------------------------------------------------------------------------
// 14. Short positions open with a Sell and close with a Buy.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, ShortSides) {
  auto placed =
      executor->placeOrder(openRequest("SOL", 100.0, 1.0, PositionSide::Short));
  ASSERT_TRUE(placed.accepted());
  EXPECT_EQ(executor->order(placed.order_id)->side, Side::Sell);
  ASSERT_TRUE(executor->handleFill(placed.order_id, 100.0, 1.0));

  clock.advance_by(60 * tradegate::kMillisPerSecond);
  auto close = executor->placeOrder(closeRequest("SOL", 95.0));
  ASSERT_TRUE(close.accepted());
  EXPECT_EQ(executor->order(close.order_id)->side, Side::Buy);
}

// -----------------------------------------------------------------------------
// 15. Two opens in flight on different symbols cannot together exceed the
//     exposure cap, and every fill keeps total exposure within it.
// Why: Fills land after later placements have been gated, so an unfilled
//      order must already count.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, PendingOpensReserveExposure) {
  limits.max_position_fraction = 0.3;
  limits.max_total_exposure = 0.5;
  rebuild();

  auto first = executor->placeOrder(openRequest("AAA", 100.0, 3.0));
  ASSERT_TRUE(first.accepted()) << first.decision.detail;
  auto second = executor->placeOrder(openRequest("BBB", 100.0, 3.0));
  EXPECT_EQ(second.decision.rejection, RiskRejection::ExposureLimit);

  auto smaller = executor->placeOrder(openRequest("BBB", 100.0, 2.0));
  ASSERT_TRUE(smaller.accepted()) << smaller.decision.detail;

  ASSERT_TRUE(executor->handleFill(first.order_id, 100.0, 3.0));
  EXPECT_LE(risk->riskMetrics().total_exposure, 0.5 + 1e-9);
  ASSERT_TRUE(executor->handleFill(smaller.order_id, 100.0, 2.0));
  EXPECT_LE(risk->riskMetrics().total_exposure, 0.5 + 1e-9);

  auto third = executor->placeOrder(openRequest("CCC", 10.0, 1.0));
  EXPECT_EQ(third.decision.rejection, RiskRejection::ExposureLimit);
}

// -----------------------------------------------------------------------------
// 16. Unfilled opens count against max_daily_trades.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, PendingOpensCountAsDailyTrades) {
  limits.max_daily_trades = 2;
  rebuild();

  ASSERT_TRUE(executor->placeOrder(openRequest("AAA", 100.0, 0.5)).accepted());
  ASSERT_TRUE(executor->placeOrder(openRequest("BBB", 100.0, 0.5)).accepted());
  auto third = executor->placeOrder(openRequest("CCC", 100.0, 0.5));
  EXPECT_EQ(third.decision.rejection, RiskRejection::DailyTradeLimit);

  // A cancelled open gives its slot back.
  ASSERT_TRUE(executor->cancelOrder(1));
  EXPECT_TRUE(executor->placeOrder(openRequest("CCC", 100.0, 0.5)).accepted());
}

// -----------------------------------------------------------------------------
// 17. An order whose fill never arrives is failed after pending_timeout_s,
//     freeing the symbol; a fill arriving later is ignored.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, StalePendingOrderExpires) {
  auto placed = executor->placeOrder(openRequest("SOL", 100.0, 1.0));
  ASSERT_TRUE(placed.accepted());

  clock.advance_by(120 * tradegate::kMillisPerSecond);
  EXPECT_EQ(executor->expireStale(), 0u);
  EXPECT_EQ(executor->placeOrder(openRequest("SOL", 100.0, 1.0))
                .decision.rejection,
            RiskRejection::PendingOrder);

  clock.advance_by(181 * tradegate::kMillisPerSecond);
  auto retry = executor->placeOrder(openRequest("SOL", 100.0, 1.0));
  ASSERT_TRUE(retry.accepted()) << retry.decision.detail;

  auto stale = executor->order(placed.order_id);
  EXPECT_EQ(stale->status, OrderStatus::Failed);
  EXPECT_EQ(stale->failure_reason, "no fill within pending timeout");
  EXPECT_FALSE(executor->handleFill(placed.order_id, 100.0, 1.0));
  EXPECT_EQ(executor->pendingOrders().size(), 1u);
}

// -----------------------------------------------------------------------------
// 18. Only Pending may move, and only to a terminal state.
// -----------------------------------------------------------------------------
TEST(OrderExecutorTransitions, StateMachine) {
  using tradegate::OrderExecutor;
  EXPECT_TRUE(OrderExecutor::transitionStatus(OrderStatus::Pending,
                                              OrderStatus::Filled));
  EXPECT_TRUE(OrderExecutor::transitionStatus(OrderStatus::Pending,
                                              OrderStatus::Cancelled));
  EXPECT_TRUE(OrderExecutor::transitionStatus(OrderStatus::Pending,
                                              OrderStatus::Failed));
  EXPECT_FALSE(OrderExecutor::transitionStatus(OrderStatus::Pending,
                                               OrderStatus::Pending));
  EXPECT_FALSE(OrderExecutor::transitionStatus(OrderStatus::Filled,
                                               OrderStatus::Cancelled));
  EXPECT_FALSE(OrderExecutor::transitionStatus(OrderStatus::Cancelled,
                                               OrderStatus::Filled));
  EXPECT_FALSE(OrderExecutor::transitionStatus(OrderStatus::Failed,
                                               OrderStatus::Pending));
}
