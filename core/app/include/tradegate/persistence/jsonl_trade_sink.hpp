#pragma once

#include "tradegate/persistence/i_trade_sink.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <mutex>
#include <string>

namespace tradegate {

// -----------------------------------------------------------------------------
// JsonlTradeSink — append-only JSON-lines trade journal
// -----------------------------------------------------------------------------
//
// @brief  Writes one JSON object per ClosedTrade to a file, one per line.
//
// @details
// Opens the file in append mode on construction; throws std::runtime_error
// if it cannot be opened, so a misconfigured journal path stops start-up
// instead of silently losing trades. Write failures after that are logged to
// stderr and dropped. Each line is flushed so a crash loses at most the
// trade being written.
//
// Ownership: owned by TradingEngine; borrowed by the live RiskManager.
// -----------------------------------------------------------------------------
class JsonlTradeSink final : public ITradeSink {
 public:
  explicit JsonlTradeSink(const std::string& path);

  JsonlTradeSink(const JsonlTradeSink&) = delete;
  JsonlTradeSink& operator=(const JsonlTradeSink&) = delete;

  void recordTrade(const domain::ClosedTrade& trade) override;

  // JSON form of a trade, shared with the backtest report.
  static nlohmann::json toJson(const domain::ClosedTrade& trade);

 private:
  std::string path_;
  std::mutex mutex_;
  std::ofstream out_;
};

}  // namespace tradegate
