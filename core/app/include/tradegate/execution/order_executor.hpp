#pragma once

#include "tradegate/concurrent/order_id_generator.hpp"
#include "tradegate/domain/order.hpp"
#include "tradegate/domain/requests.hpp"
#include "tradegate/domain/risk_decision.hpp"
#include "tradegate/execution/executor_config.hpp"
#include "tradegate/metrics/i_metrics_sink.hpp"
#include "tradegate/risk/i_risk_manager.hpp"
#include "tradegate/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tradegate {

// -----------------------------------------------------------------------------
// PlacementResult — outcome of OrderExecutor::placeOrder()
// -----------------------------------------------------------------------------
struct PlacementResult {
  domain::RiskDecision decision;
  domain::OrderId order_id{0};  // 0 unless accepted

  bool accepted() const { return decision.allowed(); }
};

// -----------------------------------------------------------------------------
// OrderExecutor — order lifecycle on top of the risk ledger
// -----------------------------------------------------------------------------
//
// @brief  Turns risk-approved requests into Pending orders, applies fills to
//         the IRiskManager, and enforces the per-symbol order throttle.
//
// @details
// placeOrder() first fails every order Pending for longer than
// pending_timeout_s (expireStale()), then gates in this order:
//   1) a Pending order already exists for the symbol  → PendingOrder
//   2) last order on the symbol is younger than
//      min_order_interval_s                           → OrderThrottled
//   3) IRiskManager::canOpen() / canClose()           → its rejection
// Opens are checked with the notional and count of the other Pending opens,
// so orders in flight reserve exposure and daily trades.
// Only when all pass is an Order created (status Pending) and the symbol's
// last-order time stamped.
//
// handleFill() compares the fill price with the requested one; a difference
// above max_slippage is logged and counted but the fill is still applied.
// An opening fill calls IRiskManager::open() (attaching the order's stop and
// target); a closing fill calls close() with the order's reason.
//
// Unknown order ids and illegal transitions are logged and reported as
// false, never thrown: fills arrive asynchronously and a duplicate or late
// notice must not take the processor down.
//
// Thread model: not synchronized. Runs on the TradeProcessor consumer
// thread, like the IRiskManager it drives.
//
// Ownership: borrows the risk manager, clock, id generator and metrics sink.
// -----------------------------------------------------------------------------
class OrderExecutor {
 public:
  OrderExecutor(IRiskManager& risk, const ITimeProvider& time_provider,
                OrderIdGenerator& id_gen, const ExecutorConfig& config,
                IMetricsSink* metrics = nullptr);

  OrderExecutor(const OrderExecutor&) = delete;
  OrderExecutor& operator=(const OrderExecutor&) = delete;

  PlacementResult placeOrder(const domain::PlaceOrderRequest& request);

  // -------------------------------------------------------------------------
  // handleFill(order_id, price, quantity)
  // -------------------------------------------------------------------------
  // @brief  Applies a fill and moves the order Pending → Filled.
  //
  // @return false for an unknown id or an order no longer Pending.
  //
  // @throws PreconditionViolation  propagated from the IRiskManager when the
  //         ledger refuses the mutation; the order is marked Failed first.
  // -------------------------------------------------------------------------
  bool handleFill(domain::OrderId order_id, double price, double quantity);

  // Pending → Cancelled. false if unknown or not Pending.
  bool cancelOrder(domain::OrderId order_id);

  // -------------------------------------------------------------------------
  // markFailed(order_id, reason)
  // -------------------------------------------------------------------------
  // @brief  Pending → Failed, for orders the transport could not execute.
  //
  // @details
  // An order that never reached the market does not count against the
  // symbol's order interval, so the stamp it set is released and a retry
  // can go through.
  // -------------------------------------------------------------------------
  bool markFailed(domain::OrderId order_id, const std::string& reason);

  // Fails every Pending order older than pending_timeout_s. Returns how
  // many were failed.
  std::size_t expireStale();

  std::optional<domain::Order> order(domain::OrderId order_id) const;
  std::vector<domain::Order> pendingOrders() const;

  // -------------------------------------------------------------------------
  // transitionStatus(current, next)
  // -------------------------------------------------------------------------
  // @brief  The legal order state graph: Pending → {Filled, Cancelled,
  //         Failed}. Terminal states go nowhere.
  // -------------------------------------------------------------------------
  static bool transitionStatus(domain::OrderStatus current,
                               domain::OrderStatus next);

 private:
  domain::Order* findPending(domain::OrderId order_id,
                             domain::OrderStatus next, const char* action);
  bool hasPendingOrder(const std::string& symbol) const;
  PendingOpens pendingOpens() const;
  void count(const char* name);

  IRiskManager& risk_;
  const ITimeProvider& time_;
  OrderIdGenerator& id_gen_;
  ExecutorConfig config_;
  IMetricsSink* metrics_;

  std::map<domain::OrderId, domain::Order> orders_;
  std::map<std::string, std::int64_t> last_order_ms_;
};

}  // namespace tradegate
