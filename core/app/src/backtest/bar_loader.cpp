#include "tradegate/backtest/bar_loader.hpp"
#include "tradegate/domain/errors.hpp"
#include "tradegate/strategy/snapshot_json.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace tradegate {

// -----------------------------------------------------------------------------
// loadBarsFromFile()
// -----------------------------------------------------------------------------
std::vector<domain::SignalSnapshot> loadBarsFromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw BacktestDataError("cannot open bar file: " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return parseBars(buffer.str());
}

// -----------------------------------------------------------------------------
// parseBars()
// -----------------------------------------------------------------------------
std::vector<domain::SignalSnapshot> parseBars(const std::string& json_text) {
  std::vector<domain::SignalSnapshot> bars;
  try {
    auto root = nlohmann::json::parse(json_text);

    std::string symbol;
    const nlohmann::json* array = &root;
    if (root.is_object()) {
      symbol = root.value("symbol", std::string());
      array = &root.at("bars");
    }
    if (!array->is_array()) {
      throw BacktestDataError("bar data must be a JSON array");
    }

    bars.reserve(array->size());
    for (const auto& item : *array) {
      bars.push_back(snapshotFromJson(item, symbol));
    }
  } catch (const nlohmann::json::exception& e) {
    throw BacktestDataError(std::string("malformed bar data: ") + e.what());
  }
  return bars;
}

}  // namespace tradegate
