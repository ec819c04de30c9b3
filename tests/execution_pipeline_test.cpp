// =============================================================================
// execution_pipeline_test.cpp
// =============================================================================
// Integration tests for the order path:
//   TradeProcessor → ExecutionHandler → OrderExecutor → IOrderTransport
//     → FillWatcher → FillNotice → TradeProcessor → OrderExecutor
//
// Validates:
//   - A paper fill opens, and later closes, a position in the RiskManager
//   - A transport that throws marks the order failed, and the processor's
//     single retry places a fresh order that fails the same way
//   - A rejected fill report marks the order failed without a position
//   - A cancel request cancels an order whose fill never arrives
//   - A fill arriving while the circuit breaker is open still opens the
//     position
//   - FillWatcher turns a broken future into a failed FillNotice
//
// Threading model:
//   Processor and watcher run their own threads. Tests wait on the
//   processor's atomic counters, stop the pipeline, and only then inspect
//   the executor and risk manager, which belong to the processor thread.
// =============================================================================

#include "tradegate/concurrent/order_id_generator.hpp"
#include "tradegate/execution/execution_handler.hpp"
#include "tradegate/execution/fill_watcher.hpp"
#include "tradegate/execution/order_executor.hpp"
#include "tradegate/execution/paper_transport.hpp"
#include "tradegate/metrics/in_memory_metrics.hpp"
#include "tradegate/metrics/metric_names.hpp"
#include "tradegate/processor/trade_processor.hpp"
#include "tradegate/risk/risk_manager.hpp"
#include "tradegate/time/simulation_time_provider.hpp"
#include "tradegate/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using tradegate::IOrderTransport;
using tradegate::OrderHandle;
using tradegate::Quote;
using tradegate::TradeRequest;
using tradegate::domain::OrderIntent;
using tradegate::domain::OrderStatus;
using tradegate::domain::PlaceOrderRequest;
using tradegate::domain::PositionSide;

namespace {

constexpr std::int64_t kNoon =
    19675 * tradegate::kMillisPerDay + 12 * tradegate::kMillisPerHour;

bool waitUntil(const std::function<bool()>& pred) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return pred();
}

PlaceOrderRequest openLong(double price, double qty) {
  PlaceOrderRequest r;
  r.symbol = "SOL";
  r.intent = OrderIntent::Open;
  r.position_side = PositionSide::Long;
  r.price = price;
  r.quantity = qty;
  return r;
}

PlaceOrderRequest closeAt(double price) {
  PlaceOrderRequest r;
  r.symbol = "SOL";
  r.intent = OrderIntent::Close;
  r.price = price;
  r.reason = "take_profit";
  return r;
}

Quote quoteFor(const tradegate::domain::Order& order) {
  Quote q;
  q.order_id = order.id;
  q.symbol = order.symbol;
  q.side = order.side;
  q.price = order.price;
  q.quantity = order.quantity;
  return q;
}

// Quotes fine, then fails every submission.
class DownTransport final : public IOrderTransport {
 public:
  Quote getQuote(const tradegate::domain::Order& order) override {
    return quoteFor(order);
  }
  OrderHandle submit(const Quote&) override {
    submissions.fetch_add(1);
    throw std::runtime_error("venue unreachable");
  }
  std::atomic<int> submissions{0};
};

// Resolves every submission with a rejected report.
class RejectingTransport final : public IOrderTransport {
 public:
  Quote getQuote(const tradegate::domain::Order& order) override {
    return quoteFor(order);
  }
  OrderHandle submit(const Quote& quote) override {
    last_id.store(quote.order_id);
    std::promise<tradegate::FillReport> promise;
    tradegate::FillReport report;
    report.order_id = quote.order_id;
    report.filled = false;
    report.error = "insufficient margin";
    promise.set_value(report);
    return OrderHandle{quote.order_id, promise.get_future()};
  }
  std::atomic<tradegate::domain::OrderId> last_id{0};
};

// Accepts every submission and never reports back.
class SilentTransport final : public IOrderTransport {
 public:
  Quote getQuote(const tradegate::domain::Order& order) override {
    return quoteFor(order);
  }
  OrderHandle submit(const Quote& quote) override {
    last_id.store(quote.order_id);
    promises.emplace_back();
    return OrderHandle{quote.order_id, promises.back().get_future()};
  }
  std::atomic<tradegate::domain::OrderId> last_id{0};
  std::vector<std::promise<tradegate::FillReport>> promises;
};

// Holds SOL orders open until the test releases them; fails ETH outright.
class HeldTransport final : public IOrderTransport {
 public:
  Quote getQuote(const tradegate::domain::Order& order) override {
    return quoteFor(order);
  }
  OrderHandle submit(const Quote& quote) override {
    if (quote.symbol == "ETH") {
      throw std::runtime_error("venue unreachable");
    }
    std::lock_guard lock(mutex);
    held_id = quote.order_id;
    held_price = quote.price;
    held_quantity = quote.quantity;
    return OrderHandle{quote.order_id, held.get_future()};
  }

  void release() {
    std::lock_guard lock(mutex);
    tradegate::FillReport report;
    report.order_id = held_id;
    report.filled = true;
    report.price = held_price;
    report.quantity = held_quantity;
    held.set_value(report);
  }

  std::mutex mutex;
  std::promise<tradegate::FillReport> held;
  tradegate::domain::OrderId held_id{0};
  double held_price{0.0};
  double held_quantity{0.0};
};

tradegate::ProcessorConfig fastProcessor() {
  tradegate::ProcessorConfig c;
  c.retry_backoff_ms = 10;
  c.rate_limit_wait_ms = 5;
  c.rate_per_second = 1000.0;
  c.burst = 1000.0;
  return c;
}

// -----------------------------------------------------------------------------
// Pipeline: the live wiring, minus the gateway and telemetry.
// -----------------------------------------------------------------------------
struct Pipeline {
  Pipeline(IOrderTransport& transport, tradegate::SimulationTimeProvider& clock,
           const tradegate::ProcessorConfig& processor_config = fastProcessor())
      : risk(1000.0, limits, clock),
        executor(risk, clock, ids, executor_config, &metrics),
        processor(processor_config, clock, &metrics),
        watcher([this](TradeRequest r) { processor.submit(std::move(r)); }),
        handler(executor, transport, watcher) {
    handler.registerWith(processor);
    watcher.start();
    processor.start();
  }

  ~Pipeline() { stop(); }

  void stop() {
    processor.stop();
    watcher.stop();
  }

  tradegate::domain::RiskLimits limits;
  tradegate::ExecutorConfig executor_config;
  tradegate::InMemoryMetrics metrics;
  tradegate::OrderIdGenerator ids;
  tradegate::RiskManager risk;
  tradegate::OrderExecutor executor;
  tradegate::TradeProcessor processor;
  tradegate::FillWatcher watcher;
  tradegate::ExecutionHandler handler;
};

}  // namespace

// -----------------------------------------------------------------------------
// 1. Open and close through paper fills. The paper venue fills buys above
//    the requested price by the configured slippage.
// -----------------------------------------------------------------------------
TEST(ExecutionPipelineTest, PaperRoundTrip) {
  tradegate::SimulationTimeProvider clock{kNoon};
  tradegate::PaperTransport transport(clock, 0.0005);
  Pipeline p(transport, clock);

  p.processor.submit(openLong(100.0, 1.0));
  ASSERT_TRUE(waitUntil([&] { return p.processor.processedCount() == 2; }));

  // Past the per-symbol order interval.
  clock.advance_by(61'000);
  p.processor.submit(closeAt(110.0));
  ASSERT_TRUE(waitUntil([&] { return p.processor.processedCount() == 4; }));
  p.stop();

  EXPECT_FALSE(p.risk.position("SOL").has_value());
  ASSERT_EQ(p.risk.closedTrades().size(), 1u);
  const auto& trade = p.risk.closedTrades().front();
  EXPECT_DOUBLE_EQ(trade.entry_price, 100.0 + 100.0 * 0.0005);
  EXPECT_DOUBLE_EQ(trade.exit_price, 110.0 - 110.0 * 0.0005);
  EXPECT_EQ(trade.reason, "take_profit");
  EXPECT_TRUE(p.executor.pendingOrders().empty());
  EXPECT_DOUBLE_EQ(p.metrics.counter(tradegate::metric::kOrdersFilled), 2.0);
}

// -----------------------------------------------------------------------------
// 2. Submission errors fail the order and propagate to the processor.
// Why: markFailed() releases the throttle stamp, so the retry is accepted
//      as a new order rather than refused by the order interval.
// -----------------------------------------------------------------------------
TEST(ExecutionPipelineTest, TransportErrorFailsAndRetries) {
  tradegate::SimulationTimeProvider clock{kNoon};
  DownTransport transport;
  Pipeline p(transport, clock);

  p.processor.submit(openLong(100.0, 1.0));
  ASSERT_TRUE(waitUntil([&] { return p.processor.droppedCount() == 1; }));
  p.stop();

  EXPECT_EQ(transport.submissions.load(), 2);
  EXPECT_EQ(p.processor.failedCount(), 2u);
  EXPECT_FALSE(p.risk.position("SOL").has_value());
  EXPECT_TRUE(p.executor.pendingOrders().empty());
  EXPECT_DOUBLE_EQ(p.metrics.counter(tradegate::metric::kOrdersFailed), 2.0);
}

// -----------------------------------------------------------------------------
// 3. A rejected fill report fails the order and opens nothing.
// -----------------------------------------------------------------------------
TEST(ExecutionPipelineTest, RejectedFillMarksFailed) {
  tradegate::SimulationTimeProvider clock{kNoon};
  RejectingTransport transport;
  Pipeline p(transport, clock);

  p.processor.submit(openLong(100.0, 1.0));
  ASSERT_TRUE(waitUntil([&] { return p.processor.processedCount() == 2; }));
  p.stop();

  auto order = p.executor.order(transport.last_id.load());
  ASSERT_TRUE(order.has_value());
  EXPECT_EQ(order->status, OrderStatus::Failed);
  EXPECT_EQ(order->failure_reason, "insufficient margin");
  EXPECT_FALSE(p.risk.position("SOL").has_value());
}

// -----------------------------------------------------------------------------
// 4. A cancel request settles an order the venue never answers.
// -----------------------------------------------------------------------------
TEST(ExecutionPipelineTest, CancelPendingOrder) {
  tradegate::SimulationTimeProvider clock{kNoon};
  SilentTransport transport;
  Pipeline p(transport, clock);

  p.processor.submit(openLong(100.0, 1.0));
  ASSERT_TRUE(waitUntil([&] { return p.processor.processedCount() == 1; }));
  EXPECT_EQ(p.watcher.inFlight(), 1u);

  tradegate::domain::OrderId id = transport.last_id.load();
  p.processor.submit(tradegate::domain::CancelRequest{id});
  ASSERT_TRUE(waitUntil([&] { return p.processor.processedCount() == 2; }));
  p.stop();

  auto order = p.executor.order(id);
  ASSERT_TRUE(order.has_value());
  EXPECT_EQ(order->status, OrderStatus::Cancelled);
  EXPECT_TRUE(p.executor.pendingOrders().empty());
}

// -----------------------------------------------------------------------------
// 5. The breaker opens on a transport failure while a SOL order is still at
//    the venue. Its fill arrives afterwards and must still reach the ledger.
// Why: A rejected fill would strand the order as Pending and hide a position
//      the venue holds.
// -----------------------------------------------------------------------------
TEST(ExecutionPipelineTest, FillSettlesWhileBreakerOpen) {
  tradegate::SimulationTimeProvider clock{kNoon};
  HeldTransport transport;
  tradegate::ProcessorConfig config = fastProcessor();
  config.failure_threshold = 1;
  Pipeline p(transport, clock, config);

  p.processor.submit(openLong(100.0, 1.0));
  ASSERT_TRUE(waitUntil([&] { return p.watcher.inFlight() == 1u; }));

  PlaceOrderRequest eth = openLong(50.0, 1.0);
  eth.symbol = "ETH";
  p.processor.submit(eth);
  ASSERT_TRUE(waitUntil([&] { return p.processor.rejectedCount() == 1; }));
  EXPECT_TRUE(p.processor.breakerState().open);

  transport.release();
  ASSERT_TRUE(waitUntil([&] { return p.processor.processedCount() == 2; }));
  p.stop();

  auto order = p.executor.order(transport.held_id);
  ASSERT_TRUE(order.has_value());
  EXPECT_EQ(order->status, OrderStatus::Filled);
  ASSERT_TRUE(p.risk.position("SOL").has_value());
  EXPECT_FALSE(p.risk.position("ETH").has_value());
  EXPECT_TRUE(p.executor.pendingOrders().empty());
}

// -----------------------------------------------------------------------------
// 6. A future that holds an exception becomes a failed FillNotice carrying
//    the exception text.
// -----------------------------------------------------------------------------
TEST(FillWatcherTest, BrokenFutureReportsFailure) {
  std::mutex mutex;
  std::vector<tradegate::domain::FillNotice> notices;
  tradegate::FillWatcher watcher([&](TradeRequest r) {
    std::lock_guard lock(mutex);
    notices.push_back(std::get<tradegate::domain::FillNotice>(r));
  });
  watcher.start();

  std::promise<tradegate::FillReport> promise;
  watcher.watch(OrderHandle{42, promise.get_future()});
  promise.set_exception(
      std::make_exception_ptr(std::runtime_error("connection reset")));

  ASSERT_TRUE(waitUntil([&] { return watcher.inFlight() == 0; }));
  watcher.stop();

  ASSERT_EQ(notices.size(), 1u);
  EXPECT_EQ(notices[0].order_id, 42u);
  EXPECT_FALSE(notices[0].filled);
  EXPECT_EQ(notices[0].error, "connection reset");
}
