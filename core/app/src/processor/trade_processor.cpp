#include "tradegate/processor/trade_processor.hpp"
#include "tradegate/metrics/metric_names.hpp"
#include "tradegate/time/time_utils.hpp"

#include <algorithm>
#include <iostream>

namespace tradegate {

namespace {

// How long the consumer waits on an empty queue before re-checking the stop
// flag and the deferred retries.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

// A request is attempted at most this many times.
constexpr int kMaxAttempts = 2;

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
TradeProcessor::TradeProcessor(const ProcessorConfig& config,
                               const ITimeProvider& time_provider,
                               IMetricsSink* metrics)
    : config_(config),
      metrics_(metrics),
      rate_limiter_(config.rate_per_second, config.burst, time_provider),
      breaker_(config.failure_threshold, seconds_to_ms(config.reset_timeout_s),
               time_provider) {}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
TradeProcessor::~TradeProcessor() { stop(); }

// -----------------------------------------------------------------------------
// registerHandler()
// -----------------------------------------------------------------------------
void TradeProcessor::registerHandler(std::string name, Handler handler) {
  std::cout << "[TradeProcessor] registered handler: " << name << "\n";
  handlers_.emplace_back(std::move(name), std::move(handler));
}

// -----------------------------------------------------------------------------
// submit(): any thread
// -----------------------------------------------------------------------------
void TradeProcessor::submit(TradeRequest request) {
  queue_.push(Entry{std::move(request), 0});
  if (metrics_ != nullptr) {
    metrics_->setGauge(metric::kQueueSize,
                       static_cast<double>(queue_.size()));
  }
}

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TradeProcessor::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
  std::cout << "[TradeProcessor] started with " << handlers_.size()
            << " handler(s).\n";
}

// -----------------------------------------------------------------------------
// stop(): cooperative, between requests
// -----------------------------------------------------------------------------
void TradeProcessor::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  stop_cv_.notify_all();
  thread_.join();

  std::size_t abandoned = queue_.size() + deferred_.size();
  std::cout << "[TradeProcessor] stopped. processed=" << processed_.load()
            << " failed=" << failed_.load()
            << " rejected=" << rejected_.load();
  if (abandoned > 0) {
    std::cout << " abandoned=" << abandoned;
  }
  std::cout << "\n";
}

// -----------------------------------------------------------------------------
// run() — consumer loop
// -----------------------------------------------------------------------------
void TradeProcessor::run() {
  while (running_.load()) {
    promoteDueRetries();

    std::optional<Entry> entry = queue_.try_pop();
    if (entry) {
      if (metrics_ != nullptr) {
        metrics_->setGauge(metric::kQueueSize,
                           static_cast<double>(queue_.size()));
      }
      process(std::move(*entry));
      continue;
    }

    waitForStop(kIdleWaitTimeout);
  }
}

// -----------------------------------------------------------------------------
// process(): breaker → rate limit → handlers → retry policy
// -----------------------------------------------------------------------------
void TradeProcessor::process(Entry entry) {
  // --- 1) Circuit breaker ---------------------------------------------------
  if (!settlesOrder(entry.request) && !breaker_.canExecute()) {
    rejected_.fetch_add(1);
    count(metric::kRequestsRejected);
    std::cerr << "[TradeProcessor] circuit breaker open, rejecting "
              << requestKind(entry.request) << " request.\n";
    return;
  }

  // --- 2) Rate limit: hold this request until a token is free ---------------
  while (!rate_limiter_.tryAcquire()) {
    if (waitForStop(std::chrono::milliseconds(config_.rate_limit_wait_ms))) {
      // Stopping: put it back so the abandoned count is honest.
      queue_.push(std::move(entry));
      return;
    }
  }

  // --- 3) Handlers ----------------------------------------------------------
  if (dispatch(entry.request)) {
    breaker_.recordSuccess();
    processed_.fetch_add(1);
    count(metric::kRequestsProcessed);
    return;
  }

  // --- 4) Failure: breaker, then retry once ---------------------------------
  failed_.fetch_add(1);
  count(metric::kRequestsFailed);
  if (breaker_.recordFailure()) {
    count(metric::kBreakerTrips);
  }

  ++entry.attempt;
  if (entry.attempt < kMaxAttempts) {
    auto due = std::chrono::steady_clock::now() +
               std::chrono::milliseconds(config_.retry_backoff_ms);
    deferred_.push_back(Deferred{due, std::move(entry)});
    count(metric::kRequestsRequeued);
  } else {
    dropped_.fetch_add(1);
    count(metric::kRequestsDropped);
    std::cerr << "[TradeProcessor] dropping " << requestKind(entry.request)
              << " request after " << entry.attempt << " attempts.\n";
  }
}

// -----------------------------------------------------------------------------
// dispatch(): run handlers in order; false on the first exception
// -----------------------------------------------------------------------------
bool TradeProcessor::dispatch(const TradeRequest& request) {
  for (const auto& [name, handler] : handlers_) {
    try {
      handler(request);
    } catch (const std::exception& e) {
      std::cerr << "[TradeProcessor] handler " << name << " failed on "
                << requestKind(request) << ": " << e.what() << "\n";
      return false;
    }
  }
  return true;
}

// -----------------------------------------------------------------------------
// promoteDueRetries(): move due retries to the back of the queue
// -----------------------------------------------------------------------------
void TradeProcessor::promoteDueRetries() {
  if (deferred_.empty()) {
    return;
  }
  auto now = std::chrono::steady_clock::now();
  auto due_end = std::stable_partition(
      deferred_.begin(), deferred_.end(),
      [now](const Deferred& d) { return d.due <= now; });
  for (auto it = deferred_.begin(); it != due_end; ++it) {
    queue_.push(std::move(it->entry));
  }
  deferred_.erase(deferred_.begin(), due_end);
}

// -----------------------------------------------------------------------------
// waitForStop(): timed wait that returns true once stop() was requested
// -----------------------------------------------------------------------------
bool TradeProcessor::waitForStop(std::chrono::milliseconds timeout) {
  std::unique_lock lock(stop_mutex_);
  stop_cv_.wait_for(lock, timeout, [this] { return !running_.load(); });
  return !running_.load();
}

void TradeProcessor::count(const char* name) {
  if (metrics_ != nullptr) {
    metrics_->incrementCounter(name, 1.0);
  }
}

}  // namespace tradegate
