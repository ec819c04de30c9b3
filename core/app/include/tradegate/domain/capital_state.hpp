#pragma once

namespace tradegate {
namespace domain {

// -----------------------------------------------------------------------------
// CapitalState — current and peak capital
// -----------------------------------------------------------------------------
// Invariant: peak >= current, and peak never decreases. Drawdown is derived
// on demand and never stored.
// -----------------------------------------------------------------------------
struct CapitalState {
  double current{0.0};
  double peak{0.0};

  double drawdown() const {
    if (peak <= 0.0) {
      return 0.0;
    }
    return (peak - current) / peak;
  }
};

}  // namespace domain
}  // namespace tradegate
