#include "tradegate/execution/fill_watcher.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace tradegate {

namespace {

// Poll period for outstanding futures.
constexpr auto kPollInterval = std::chrono::milliseconds(5);

}  // namespace

FillWatcher::FillWatcher(Sink sink) : sink_(std::move(sink)) {}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
FillWatcher::~FillWatcher() { stop(); }

void FillWatcher::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void FillWatcher::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  wake_.notify_all();
  thread_.join();

  std::size_t left = inFlight();
  if (left > 0) {
    std::cerr << "[FillWatcher] WARNING: stopped with " << left
              << " unresolved order handle(s).\n";
  }
}

// -----------------------------------------------------------------------------
// watch(): take ownership of a submitted order's handle
// -----------------------------------------------------------------------------
void FillWatcher::watch(OrderHandle handle) {
  {
    std::lock_guard lock(mutex_);
    handles_.push_back(std::move(handle));
  }
  wake_.notify_all();
}

std::size_t FillWatcher::inFlight() const {
  std::lock_guard lock(mutex_);
  return handles_.size();
}

// -----------------------------------------------------------------------------
// run() — worker loop
// -----------------------------------------------------------------------------
void FillWatcher::run() {
  while (running_.load()) {
    pollOnce();

    std::unique_lock lock(mutex_);
    wake_.wait_for(lock, kPollInterval, [this] { return !running_.load(); });
  }
}

// -----------------------------------------------------------------------------
// pollOnce(): collect resolved handles, then report them outside the lock
// -----------------------------------------------------------------------------
void FillWatcher::pollOnce() {
  std::vector<OrderHandle> resolved;
  {
    std::lock_guard lock(mutex_);
    auto it = handles_.begin();
    while (it != handles_.end()) {
      if (it->fill.valid() &&
          it->fill.wait_for(std::chrono::seconds(0)) ==
              std::future_status::ready) {
        resolved.push_back(std::move(*it));
        it = handles_.erase(it);
      } else {
        ++it;
      }
    }
  }

  for (auto& handle : resolved) {
    domain::FillNotice notice;
    notice.order_id = handle.order_id;
    try {
      FillReport report = handle.fill.get();
      notice.filled = report.filled;
      notice.price = report.price;
      notice.quantity = report.quantity;
      notice.error = report.error;
    } catch (const std::exception& e) {
      notice.filled = false;
      notice.error = e.what();
    }
    sink_(std::move(notice));
  }
}

}  // namespace tradegate
