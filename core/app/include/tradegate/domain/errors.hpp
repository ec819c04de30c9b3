#pragma once

#include <stdexcept>
#include <string>

namespace tradegate {

// -----------------------------------------------------------------------------
// Error types
// -----------------------------------------------------------------------------
// Risk rejections are values (domain::RiskDecision). Exceptions are reserved
// for conditions the caller must not continue past:
//
//   PreconditionViolation — a ledger mutation attempted without the check
//                           that should have preceded it (opening a duplicate
//                           symbol, closing a symbol with nothing open,
//                           non-positive price or size). Programming error;
//                           the core never catches it.
//   BacktestDataError     — the input series cannot be replayed. Aborts the
//                           whole run.
//   ConfigError           — unreadable config file or validation errors.
// -----------------------------------------------------------------------------
class PreconditionViolation : public std::logic_error {
 public:
  explicit PreconditionViolation(const std::string& what)
      : std::logic_error(what) {}
};

class BacktestDataError : public std::runtime_error {
 public:
  explicit BacktestDataError(const std::string& what)
      : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what)
      : std::runtime_error(what) {}
};

}  // namespace tradegate
