#pragma once

namespace tradegate {
namespace metric {

// Counters
constexpr const char* kOrdersPlaced = "orders_placed_total";
constexpr const char* kOrdersFilled = "orders_filled_total";
constexpr const char* kOrdersCancelled = "orders_cancelled_total";
constexpr const char* kOrdersFailed = "orders_failed_total";
constexpr const char* kOrdersRejected = "orders_rejected_total";
constexpr const char* kSlippageWarnings = "slippage_warnings_total";
constexpr const char* kTradesClosed = "trades_closed_total";
constexpr const char* kRequestsProcessed = "processed_trades_total";
constexpr const char* kRequestsFailed = "failed_trades_total";
constexpr const char* kRequestsRejected = "rejected_trades_total";
constexpr const char* kRequestsRequeued = "requeued_trades_total";
constexpr const char* kRequestsDropped = "dropped_trades_total";
constexpr const char* kBreakerTrips = "circuit_breaker_trips";

// Gauges
constexpr const char* kQueueSize = "trade_queue_size";
constexpr const char* kCapital = "capital";
constexpr const char* kDrawdown = "drawdown";
constexpr const char* kOpenPositions = "open_positions";
constexpr const char* kUnrealizedPnl = "unrealized_pnl";

}  // namespace metric
}  // namespace tradegate
