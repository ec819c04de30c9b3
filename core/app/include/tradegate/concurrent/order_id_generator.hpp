#pragma once

#include <atomic>
#include <cstdint>

namespace tradegate {

// -----------------------------------------------------------------------------
// OrderIdGenerator — thread-safe, monotonically increasing order id source
// -----------------------------------------------------------------------------
//
// @brief  Hands out order ids from an atomic counter. Id 0 is never issued
//         and serves as the "unset" sentinel in domain::Order.
//
// @details
// Ids are opaque to every consumer: they are only compared and used as map
// keys by the OrderExecutor and the FillWatcher. Relaxed ordering suffices
// because uniqueness is the only requirement.
//
// Ownership:
//   Owned by TradingEngine as a value member and injected into the
//   OrderExecutor by reference. Tests own their own instance.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  OrderIdGenerator() = default;

  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  // Returns 1, 2, 3, ... across all threads.
  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace tradegate
