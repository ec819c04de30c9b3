#pragma once

#include "tradegate/execution/i_order_transport.hpp"
#include "tradegate/processor/trade_request.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace tradegate {

// -----------------------------------------------------------------------------
// FillWatcher — awaits fill futures and feeds them back to the processor
// -----------------------------------------------------------------------------
//
// @brief  Owns OrderHandles after submission. A worker thread polls their
//         futures and, as each resolves, pushes a FillNotice through the
//         sink (normally TradeProcessor::submit).
//
// @details
// Fills therefore re-enter the same queue every other request goes
// through, and are applied on the processor's consumer thread. Nothing but
// the sink is called from the watcher thread.
//
// Thread model:
//   watch() may be called from any thread (the processor thread in
//   practice). The worker runs between start() and stop().
//
// Ownership:
//   Owned by TradingEngine. Handles still unresolved at stop() are
//   abandoned with a warning; their orders stay Pending.
// -----------------------------------------------------------------------------
class FillWatcher {
 public:
  using Sink = std::function<void(TradeRequest)>;

  explicit FillWatcher(Sink sink);
  ~FillWatcher();

  FillWatcher(const FillWatcher&) = delete;
  FillWatcher& operator=(const FillWatcher&) = delete;

  void start();
  void stop();

  void watch(OrderHandle handle);

  // Handles not yet resolved.
  std::size_t inFlight() const;

 private:
  void run();
  void pollOnce();

  Sink sink_;
  mutable std::mutex mutex_;  // Guards handles_
  std::condition_variable wake_;
  std::vector<OrderHandle> handles_;
  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace tradegate
