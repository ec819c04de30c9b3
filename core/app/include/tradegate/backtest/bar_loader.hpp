#pragma once

#include "tradegate/domain/signal_snapshot.hpp"

#include <string>
#include <vector>

namespace tradegate {

// -----------------------------------------------------------------------------
// Bar loading
// -----------------------------------------------------------------------------
// Reads a bar series for the BacktestEngine from JSON, either a bare array of
// snapshot objects or {"symbol": "SOL", "bars": [ ... ]}. Each element uses
// the format documented in snapshot_json.hpp; bars without a "symbol" take
// the top-level one.
//
// Throws BacktestDataError for an unreadable file, malformed JSON or a bar
// missing its required fields. Ordering and price checks are left to the
// BacktestEngine.
// -----------------------------------------------------------------------------
std::vector<domain::SignalSnapshot> loadBarsFromFile(const std::string& path);

std::vector<domain::SignalSnapshot> parseBars(const std::string& json_text);

}  // namespace tradegate
