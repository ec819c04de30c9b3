// =============================================================================
// trade_processor_test.cpp
// =============================================================================
// Unit tests for tradegate::TradeProcessor.
//
// Validates:
//   - Requests are handled on the consumer thread, in submission order,
//     by every handler in registration order
//   - Typed handlers see only their request kind
//   - A failed request is retried once after the backoff, then dropped
//   - The circuit breaker rejects new work while open and half-closes after
//     the cooldown of the injected clock
//   - Fill notices and cancels still run while the breaker is open
//   - The token bucket holds requests back until the clock refills it
//   - stop() leaves unhandled requests in the queue
//
// Threading model:
//   The processor owns its consumer thread. Tests poll counters with a
//   bounded wait instead of sleeping a fixed time. The limiter and breaker
//   read a SimulationTimeProvider so the tests control their time.
// =============================================================================

#include "tradegate/metrics/in_memory_metrics.hpp"
#include "tradegate/metrics/metric_names.hpp"
#include "tradegate/processor/trade_processor.hpp"
#include "tradegate/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using tradegate::TradeRequest;
using tradegate::domain::CancelRequest;
using tradegate::domain::FillNotice;
using tradegate::domain::PlaceOrderRequest;

namespace {

// Polls pred every millisecond for up to two seconds.
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

TradeRequest cancel(tradegate::domain::OrderId id) {
  return CancelRequest{id};
}

TradeRequest place(const std::string& symbol) {
  PlaceOrderRequest r;
  r.symbol = symbol;
  r.price = 100.0;
  r.quantity = 1.0;
  return r;
}

}  // namespace

// =============================================================================
// Fixture: fast retries, generous limits unless a test narrows them.
// =============================================================================
class TradeProcessorTest : public ::testing::Test {
 protected:
  TradeProcessorTest() {
    config.retry_backoff_ms = 10;
    config.rate_limit_wait_ms = 5;
    config.rate_per_second = 1000.0;
    config.burst = 1000.0;
  }

  tradegate::SimulationTimeProvider clock{10'000'000};
  tradegate::ProcessorConfig config;
  tradegate::InMemoryMetrics metrics;
};

// -----------------------------------------------------------------------------
// 1. Every handler runs for every request, in registration order, and
//    requests are handled in submission order.
// -----------------------------------------------------------------------------
TEST_F(TradeProcessorTest, HandlersRunInOrder) {
  tradegate::TradeProcessor processor(config, clock, &metrics);
  std::mutex mutex;
  std::vector<std::string> calls;

  processor.registerHandler<CancelRequest>(
      "first", [&](const CancelRequest& r) {
        std::lock_guard lock(mutex);
        calls.push_back("first:" + std::to_string(r.order_id));
      });
  processor.registerHandler("second", [&](const TradeRequest& r) {
    std::lock_guard lock(mutex);
    calls.push_back(std::string("second:") + tradegate::requestKind(r));
  });

  processor.start();
  processor.submit(cancel(1));
  processor.submit(cancel(2));
  ASSERT_TRUE(waitUntil([&] { return processor.processedCount() == 2; }));
  processor.stop();

  std::vector<std::string> expected{"first:1", "second:cancel", "first:2",
                                    "second:cancel"};
  EXPECT_EQ(calls, expected);
  EXPECT_DOUBLE_EQ(metrics.counter(tradegate::metric::kRequestsProcessed), 2.0);
}

// -----------------------------------------------------------------------------
// 2. A typed handler ignores other request kinds.
// -----------------------------------------------------------------------------
TEST_F(TradeProcessorTest, TypedHandlerFiltersKind) {
  tradegate::TradeProcessor processor(config, clock);
  std::atomic<int> fills{0};
  processor.registerHandler<FillNotice>(
      "fills", [&](const FillNotice&) { fills.fetch_add(1); });

  processor.start();
  processor.submit(cancel(1));
  processor.submit(FillNotice{7, 100.0, 1.0, true, ""});
  ASSERT_TRUE(waitUntil([&] { return processor.processedCount() == 2; }));
  processor.stop();

  EXPECT_EQ(fills.load(), 1);
}

// -----------------------------------------------------------------------------
// 3. A request whose handler throws once succeeds on its single retry.
// -----------------------------------------------------------------------------
TEST_F(TradeProcessorTest, FailureRetriedOnce) {
  tradegate::TradeProcessor processor(config, clock, &metrics);
  std::atomic<int> attempts{0};
  processor.registerHandler("flaky", [&](const TradeRequest&) {
    if (attempts.fetch_add(1) == 0) {
      throw std::runtime_error("transient");
    }
  });

  processor.start();
  processor.submit(cancel(1));
  ASSERT_TRUE(waitUntil([&] { return processor.processedCount() == 1; }));
  processor.stop();

  EXPECT_EQ(attempts.load(), 2);
  EXPECT_EQ(processor.failedCount(), 1u);
  EXPECT_EQ(processor.droppedCount(), 0u);
  EXPECT_DOUBLE_EQ(metrics.counter(tradegate::metric::kRequestsRequeued), 1.0);
}

// -----------------------------------------------------------------------------
// 4. A request that fails twice is dropped.
// -----------------------------------------------------------------------------
TEST_F(TradeProcessorTest, SecondFailureDrops) {
  tradegate::TradeProcessor processor(config, clock, &metrics);
  std::atomic<int> attempts{0};
  processor.registerHandler("broken", [&](const TradeRequest&) {
    attempts.fetch_add(1);
    throw std::runtime_error("permanent");
  });

  processor.start();
  processor.submit(cancel(1));
  ASSERT_TRUE(waitUntil([&] { return processor.droppedCount() == 1; }));
  processor.stop();

  EXPECT_EQ(attempts.load(), 2);
  EXPECT_EQ(processor.failedCount(), 2u);
  EXPECT_EQ(processor.processedCount(), 0u);
  EXPECT_DOUBLE_EQ(metrics.counter(tradegate::metric::kRequestsDropped), 1.0);
}

// -----------------------------------------------------------------------------
// 5. After threshold failures the breaker rejects work (the retries here)
//    until reset_timeout of the injected clock has passed.
// Why: A failing downstream should not be hammered with retries.
// -----------------------------------------------------------------------------
TEST_F(TradeProcessorTest, CircuitBreakerRejectsUntilCooldown) {
  config.failure_threshold = 2;
  config.reset_timeout_s = 60.0;
  tradegate::TradeProcessor processor(config, clock, &metrics);
  std::atomic<bool> failing{true};
  std::atomic<int> calls{0};
  processor.registerHandler("gate", [&](const TradeRequest&) {
    calls.fetch_add(1);
    if (failing.load()) {
      throw std::runtime_error("down");
    }
  });

  processor.start();
  processor.submit(place("SOL"));
  processor.submit(place("ETH"));
  ASSERT_TRUE(waitUntil([&] { return processor.rejectedCount() == 2; }));

  EXPECT_TRUE(processor.breakerState().open);
  EXPECT_EQ(processor.failedCount(), 2u);
  EXPECT_EQ(calls.load(), 2);
  EXPECT_DOUBLE_EQ(metrics.counter(tradegate::metric::kBreakerTrips), 1.0);

  failing.store(false);
  clock.advance_by(60'001);
  processor.submit(place("BTC"));
  ASSERT_TRUE(waitUntil([&] { return processor.processedCount() == 1; }));
  processor.stop();

  EXPECT_FALSE(processor.breakerState().open);
  EXPECT_EQ(processor.breakerState().consecutive_failures, 0);
}

// -----------------------------------------------------------------------------
// 6. An open breaker still lets fills and cancels through.
// Why: They settle orders the venue already has. Rejecting a fill would
//      leave its order Pending and the position missing from the ledger.
// -----------------------------------------------------------------------------
TEST_F(TradeProcessorTest, OpenBreakerPassesSettlements) {
  config.failure_threshold = 1;
  config.reset_timeout_s = 60.0;
  tradegate::TradeProcessor processor(config, clock, &metrics);
  std::atomic<int> fills{0};
  processor.registerHandler<PlaceOrderRequest>(
      "venue", [](const PlaceOrderRequest&) {
        throw std::runtime_error("venue unreachable");
      });
  processor.registerHandler<FillNotice>(
      "fills", [&](const FillNotice&) { fills.fetch_add(1); });

  processor.start();
  processor.submit(place("SOL"));
  ASSERT_TRUE(waitUntil([&] { return processor.breakerState().open; }));

  processor.submit(FillNotice{7, 100.0, 1.0, true, ""});
  processor.submit(cancel(8));
  ASSERT_TRUE(waitUntil([&] {
    return processor.processedCount() == 2 && processor.rejectedCount() == 1;
  }));
  processor.stop();

  EXPECT_EQ(fills.load(), 1);
  EXPECT_EQ(processor.failedCount(), 1u);
  EXPECT_TRUE(processor.breakerState().open);
}

// -----------------------------------------------------------------------------
// 7. With an empty bucket the next request waits for the clock to refill.
// -----------------------------------------------------------------------------
TEST_F(TradeProcessorTest, RateLimitHoldsRequests) {
  config.rate_per_second = 1.0;
  config.burst = 2.0;
  tradegate::TradeProcessor processor(config, clock);
  processor.registerHandler("noop", [](const TradeRequest&) {});

  processor.start();
  for (int i = 1; i <= 3; ++i) {
    processor.submit(cancel(i));
  }
  ASSERT_TRUE(waitUntil([&] { return processor.processedCount() == 2; }));

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(processor.processedCount(), 2u);

  clock.advance_by(1000);
  ASSERT_TRUE(waitUntil([&] { return processor.processedCount() == 3; }));
  processor.stop();
}

// -----------------------------------------------------------------------------
// 8. stop() joins promptly and leaves unhandled requests queued.
// -----------------------------------------------------------------------------
TEST_F(TradeProcessorTest, StopLeavesBacklog) {
  config.rate_per_second = 1.0;
  config.burst = 1.0;
  tradegate::TradeProcessor processor(config, clock);
  processor.registerHandler("noop", [](const TradeRequest&) {});

  processor.start();
  EXPECT_TRUE(processor.isRunning());
  for (int i = 1; i <= 3; ++i) {
    processor.submit(cancel(i));
  }
  ASSERT_TRUE(waitUntil([&] { return processor.processedCount() == 1; }));

  processor.stop();
  EXPECT_FALSE(processor.isRunning());
  EXPECT_EQ(processor.queueSize(), 2u);
}

// -----------------------------------------------------------------------------
// 9. start()/stop() are idempotent and the destructor stops a running
//    processor.
// -----------------------------------------------------------------------------
TEST_F(TradeProcessorTest, IdempotentLifecycle) {
  {
    tradegate::TradeProcessor processor(config, clock);
    processor.start();
    processor.start();
    processor.stop();
    processor.stop();
  }
  {
    tradegate::TradeProcessor processor(config, clock);
    processor.start();
  }
  SUCCEED();
}
