#pragma once

#include "tradegate/concurrent/thread_safe_queue.hpp"
#include "tradegate/metrics/i_metrics_sink.hpp"
#include "tradegate/processor/circuit_breaker.hpp"
#include "tradegate/processor/processor_config.hpp"
#include "tradegate/processor/rate_limiter.hpp"
#include "tradegate/processor/trade_request.hpp"
#include "tradegate/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace tradegate {

// -----------------------------------------------------------------------------
// TradeProcessor — throttled, failure-isolated request pipeline
// -----------------------------------------------------------------------------
//
// @brief  Multi-producer / single-consumer queue of TradeRequest values,
//         drained by one worker thread that runs every registered handler
//         on each request.
//
// @details
// Per request, on the consumer thread:
//   1) CircuitBreaker::canExecute() — open: the request is rejected and
//      counted, never re-queued. Fill notices and cancels skip this gate:
//      they settle orders already sent, and rejecting them would leave
//      those orders Pending.
//   2) RateLimiter::tryAcquire() — no token: sleep rate_limit_wait_ms and
//      try again for the same request. Requests are never dropped for
//      lack of tokens.
//   3) Handlers run in registration order. The first one that throws a
//      std::exception fails the attempt; later handlers are skipped.
//   4) Success resets the breaker's consecutive count. Failure is recorded
//      on the breaker; a first failure schedules one retry after
//      retry_backoff_ms, a second failure drops the request.
//
// Retries wait in a deferred list owned by the consumer thread and are
// appended to the back of the queue when due, so the consumer never blocks
// on a backoff and the queue is FIFO apart from retried requests.
//
// Because every handler runs on this one thread, the components they touch
// (OrderExecutor, RiskManager) need no locking.
//
// Thread model:
//   submit() from any thread. registerHandler() only before start().
//   start()/stop() from the owning thread.
//
// Ownership:
//   Owned by TradingEngine (or a test). Clock and metrics sink are borrowed.
// -----------------------------------------------------------------------------
class TradeProcessor {
 public:
  using Handler = std::function<void(const TradeRequest&)>;

  TradeProcessor(const ProcessorConfig& config,
                 const ITimeProvider& time_provider,
                 IMetricsSink* metrics = nullptr);
  ~TradeProcessor();

  TradeProcessor(const TradeProcessor&) = delete;
  TradeProcessor& operator=(const TradeProcessor&) = delete;

  void registerHandler(std::string name, Handler handler);

  // Typed registration: the handler only sees requests holding T.
  template <typename T>
  void registerHandler(std::string name, std::function<void(const T&)> handler);

  void submit(TradeRequest request);

  void start();
  void stop();
  bool isRunning() const { return running_.load(); }

  std::size_t queueSize() const { return queue_.size(); }
  std::uint64_t processedCount() const { return processed_.load(); }
  std::uint64_t failedCount() const { return failed_.load(); }
  std::uint64_t rejectedCount() const { return rejected_.load(); }
  std::uint64_t droppedCount() const { return dropped_.load(); }

  CircuitBreakerState breakerState() const { return breaker_.state(); }

 private:
  struct Entry {
    TradeRequest request;
    int attempt{0};
  };

  struct Deferred {
    std::chrono::steady_clock::time_point due;
    Entry entry;
  };

  void run();
  void process(Entry entry);
  bool dispatch(const TradeRequest& request);
  void promoteDueRetries();
  bool waitForStop(std::chrono::milliseconds timeout);
  void count(const char* name);

  ProcessorConfig config_;
  IMetricsSink* metrics_;
  RateLimiter rate_limiter_;
  CircuitBreaker breaker_;

  ThreadSafeQueue<Entry> queue_;
  std::vector<std::pair<std::string, Handler>> handlers_;
  std::vector<Deferred> deferred_;  // Consumer thread only

  std::atomic<bool> running_{false};
  std::thread thread_;
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;

  std::atomic<std::uint64_t> processed_{0};
  std::atomic<std::uint64_t> failed_{0};
  std::atomic<std::uint64_t> rejected_{0};
  std::atomic<std::uint64_t> dropped_{0};
};

// -----------------------------------------------------------------------------
// Template implementation: typed registerHandler
// -----------------------------------------------------------------------------
// Wraps the typed callback in a generic one that checks the variant with
// std::get_if and ignores other alternatives.
// -----------------------------------------------------------------------------
template <typename T>
void TradeProcessor::registerHandler(std::string name,
                                     std::function<void(const T&)> handler) {
  Handler wrapped = [cb = std::move(handler)](const TradeRequest& request) {
    if (const auto* ptr = std::get_if<T>(&request)) {
      cb(*ptr);
    }
  };
  registerHandler(std::move(name), std::move(wrapped));
}

}  // namespace tradegate
