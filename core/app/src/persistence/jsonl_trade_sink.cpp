#include "tradegate/persistence/jsonl_trade_sink.hpp"

#include <iostream>
#include <stdexcept>

namespace tradegate {

// -----------------------------------------------------------------------------
// Constructor: open the journal for appending
// -----------------------------------------------------------------------------
JsonlTradeSink::JsonlTradeSink(const std::string& path)
    : path_(path), out_(path, std::ios::out | std::ios::app) {
  if (!out_.is_open()) {
    throw std::runtime_error("cannot open trade journal: " + path);
  }
  std::cout << "[JsonlTradeSink] journaling closed trades to " << path_
            << "\n";
}

// -----------------------------------------------------------------------------
// recordTrade(): one line per trade, flushed
// -----------------------------------------------------------------------------
void JsonlTradeSink::recordTrade(const domain::ClosedTrade& trade) {
  std::string line = toJson(trade).dump();

  std::lock_guard lock(mutex_);
  out_ << line << '\n';
  out_.flush();
  if (!out_) {
    std::cerr << "[JsonlTradeSink] WARNING: write to " << path_
              << " failed. Trade for " << trade.symbol << " not journaled.\n";
    out_.clear();
  }
}

// -----------------------------------------------------------------------------
// toJson()
// -----------------------------------------------------------------------------
nlohmann::json JsonlTradeSink::toJson(const domain::ClosedTrade& trade) {
  nlohmann::json j;
  j["symbol"] = trade.symbol;
  j["side"] = domain::toString(trade.side);
  j["entry_price"] = trade.entry_price;
  j["exit_price"] = trade.exit_price;
  j["quantity"] = trade.quantity;
  j["entry_ms"] = trade.entry_ms;
  j["exit_ms"] = trade.exit_ms;
  j["pnl"] = trade.pnl;
  j["fees"] = trade.fees;
  j["reason"] = trade.reason;
  return j;
}

}  // namespace tradegate
