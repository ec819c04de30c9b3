#include "tradegate/execution/order_executor.hpp"
#include "tradegate/domain/errors.hpp"
#include "tradegate/metrics/metric_names.hpp"
#include "tradegate/time/time_utils.hpp"

#include <cmath>
#include <iostream>
#include <sstream>

namespace tradegate {

using domain::OrderIntent;
using domain::OrderStatus;
using domain::RiskDecision;
using domain::RiskRejection;

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
OrderExecutor::OrderExecutor(IRiskManager& risk,
                             const ITimeProvider& time_provider,
                             OrderIdGenerator& id_gen,
                             const ExecutorConfig& config,
                             IMetricsSink* metrics)
    : risk_(risk),
      time_(time_provider),
      id_gen_(id_gen),
      config_(config),
      metrics_(metrics) {}

// -----------------------------------------------------------------------------
// placeOrder: throttle, risk gate, then create a Pending order
// -----------------------------------------------------------------------------
PlacementResult OrderExecutor::placeOrder(
    const domain::PlaceOrderRequest& request) {
  PlacementResult result;
  std::int64_t now = time_.now_ms();
  expireStale();

  // --- Per-symbol throttle --------------------------------------------------
  if (hasPendingOrder(request.symbol)) {
    result.decision = RiskDecision::reject(
        RiskRejection::PendingOrder,
        "order already pending for " + request.symbol);
  } else if (auto it = last_order_ms_.find(request.symbol);
             it != last_order_ms_.end() &&
             now - it->second < seconds_to_ms(config_.min_order_interval_s)) {
    std::ostringstream os;
    os << "last order on " << request.symbol << " was " << (now - it->second)
       << " ms ago";
    result.decision =
        RiskDecision::reject(RiskRejection::OrderThrottled, os.str());
  }

  // --- Risk gate ------------------------------------------------------------
  std::optional<domain::Position> open_position;
  if (result.decision.allowed()) {
    if (request.intent == OrderIntent::Open) {
      result.decision = risk_.canOpen(request.symbol, request.price,
                                      request.quantity, pendingOpens());
    } else {
      result.decision = risk_.canClose(request.symbol);
      open_position = risk_.position(request.symbol);
    }
  }

  if (!result.decision.allowed()) {
    count(metric::kOrdersRejected);
    std::cerr << "[OrderExecutor] rejected " << domain::toString(request.intent)
              << " " << request.symbol << ": "
              << domain::toString(result.decision.rejection) << " ("
              << result.decision.detail << ")\n";
    return result;
  }

  // --- Create the order -----------------------------------------------------
  domain::Order order;
  order.id = id_gen_.next_id();
  order.symbol = request.symbol;
  order.intent = request.intent;
  order.price = request.price;
  order.created_ms = now;
  order.reason = request.reason;
  if (open_position) {
    order.position_side = open_position->side;
    order.quantity = open_position->quantity;
  } else {
    order.position_side = request.position_side;
    order.quantity = request.quantity;
    order.stop_loss = request.stop_loss;
    order.take_profit = request.take_profit;
  }
  order.side = domain::sideFor(order.intent, order.position_side);

  orders_.emplace(order.id, order);
  last_order_ms_[order.symbol] = now;
  result.order_id = order.id;
  count(metric::kOrdersPlaced);

  std::cout << "[OrderExecutor] order " << order.id << " pending: "
            << domain::toString(order.side) << " " << order.quantity << " "
            << order.symbol << " @ " << order.price << " ("
            << domain::toString(order.intent) << ")\n";
  return result;
}

// -----------------------------------------------------------------------------
// handleFill
// -----------------------------------------------------------------------------
bool OrderExecutor::handleFill(domain::OrderId order_id, double price,
                               double quantity) {
  domain::Order* order = findPending(order_id, OrderStatus::Filled, "fill");
  if (order == nullptr) {
    return false;
  }

  // --- Slippage is advisory -------------------------------------------------
  if (order->price > 0.0) {
    double slippage = std::abs(price - order->price) / order->price;
    if (slippage > config_.max_slippage) {
      count(metric::kSlippageWarnings);
      std::cerr << "[OrderExecutor] WARNING: slippage " << slippage
                << " above " << config_.max_slippage << " on order "
                << order_id << " (requested " << order->price << ", filled "
                << price << "). Applying fill.\n";
    }
  }

  double fee = config_.fee_rate * price * quantity;

  try {
    if (order->intent == OrderIntent::Open) {
      OpenParams params;
      params.symbol = order->symbol;
      params.side = order->position_side;
      params.price = price;
      params.quantity = quantity;
      params.timestamp_ms = time_.now_ms();
      params.stop_loss = order->stop_loss;
      params.take_profit = order->take_profit;
      params.entry_fee = fee;
      risk_.open(params);
    } else {
      risk_.close(order->symbol, price, time_.now_ms(), fee, order->reason);
    }
  } catch (const PreconditionViolation& e) {
    order->status = OrderStatus::Failed;
    order->failure_reason = e.what();
    count(metric::kOrdersFailed);
    throw;
  }

  order->status = OrderStatus::Filled;
  order->filled_price = price;
  order->filled_quantity = quantity;
  count(metric::kOrdersFilled);

  std::cout << "[OrderExecutor] order " << order_id << " filled: "
            << quantity << " @ " << price << "\n";
  return true;
}

// -----------------------------------------------------------------------------
// cancelOrder
// -----------------------------------------------------------------------------
bool OrderExecutor::cancelOrder(domain::OrderId order_id) {
  domain::Order* order = findPending(order_id, OrderStatus::Cancelled, "cancel");
  if (order == nullptr) {
    return false;
  }
  order->status = OrderStatus::Cancelled;
  count(metric::kOrdersCancelled);
  std::cout << "[OrderExecutor] order " << order_id << " cancelled.\n";
  return true;
}

// -----------------------------------------------------------------------------
// markFailed
// -----------------------------------------------------------------------------
bool OrderExecutor::markFailed(domain::OrderId order_id,
                               const std::string& reason) {
  domain::Order* order = findPending(order_id, OrderStatus::Failed, "fail");
  if (order == nullptr) {
    return false;
  }
  order->status = OrderStatus::Failed;
  order->failure_reason = reason;
  count(metric::kOrdersFailed);

  // Release the interval stamp if this order set it.
  auto it = last_order_ms_.find(order->symbol);
  if (it != last_order_ms_.end() && it->second == order->created_ms) {
    last_order_ms_.erase(it);
  }

  std::cerr << "[OrderExecutor] order " << order_id << " failed: " << reason
            << "\n";
  return true;
}

// -----------------------------------------------------------------------------
// expireStale: a fill that never came fails the order
// -----------------------------------------------------------------------------
std::size_t OrderExecutor::expireStale() {
  std::int64_t now = time_.now_ms();
  std::int64_t timeout = seconds_to_ms(config_.pending_timeout_s);
  std::vector<domain::OrderId> stale;
  for (const auto& [id, order] : orders_) {
    if (order.status == OrderStatus::Pending &&
        now - order.created_ms > timeout) {
      stale.push_back(id);
    }
  }
  for (domain::OrderId id : stale) {
    markFailed(id, "no fill within pending timeout");
  }
  return stale.size();
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::optional<domain::Order> OrderExecutor::order(
    domain::OrderId order_id) const {
  auto it = orders_.find(order_id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Order> OrderExecutor::pendingOrders() const {
  std::vector<domain::Order> out;
  for (const auto& [id, order] : orders_) {
    if (order.status == OrderStatus::Pending) {
      out.push_back(order);
    }
  }
  return out;
}

// -----------------------------------------------------------------------------
// transitionStatus: Pending is the only non-terminal state
// -----------------------------------------------------------------------------
bool OrderExecutor::transitionStatus(OrderStatus current, OrderStatus next) {
  switch (current) {
    case OrderStatus::Pending:
      return next == OrderStatus::Filled ||
             next == OrderStatus::Cancelled ||
             next == OrderStatus::Failed;

    case OrderStatus::Filled:
    case OrderStatus::Cancelled:
    case OrderStatus::Failed:
      return false;
  }
  return false;
}

// -----------------------------------------------------------------------------
// findPending: lookup plus transition check, logged on failure
// -----------------------------------------------------------------------------
domain::Order* OrderExecutor::findPending(domain::OrderId order_id,
                                          OrderStatus next,
                                          const char* action) {
  auto it = orders_.find(order_id);
  if (it == orders_.end()) {
    std::cerr << "[OrderExecutor] WARNING: " << action
              << " for unknown order_id=" << order_id << ". Skipping.\n";
    return nullptr;
  }
  if (!transitionStatus(it->second.status, next)) {
    std::cerr << "[OrderExecutor] WARNING: " << action << " for order_id="
              << order_id << " in terminal state "
              << domain::toString(it->second.status) << ". Skipping.\n";
    return nullptr;
  }
  return &it->second;
}

bool OrderExecutor::hasPendingOrder(const std::string& symbol) const {
  for (const auto& [id, order] : orders_) {
    if (order.symbol == symbol && order.status == OrderStatus::Pending) {
      return true;
    }
  }
  return false;
}

PendingOpens OrderExecutor::pendingOpens() const {
  PendingOpens pending;
  for (const auto& [id, order] : orders_) {
    if (order.status == OrderStatus::Pending &&
        order.intent == OrderIntent::Open) {
      pending.notional += order.price * order.quantity;
      ++pending.count;
    }
  }
  return pending;
}

void OrderExecutor::count(const char* name) {
  if (metrics_ != nullptr) {
    metrics_->incrementCounter(name, 1.0);
  }
}

}  // namespace tradegate
