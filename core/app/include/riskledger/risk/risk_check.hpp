#pragma once

#include "riskledger/domain/money.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace riskledger {

// -----------------------------------------------------------------------------
// RiskCheck — the eight pre-trade checks, in evaluation order
// -----------------------------------------------------------------------------
enum class RiskCheck {
  EmergencyStop,
  Basic,
  Cash,
  Position,
  Concentration,
  Frequency,
  Drawdown,
  DailyLoss,
};

inline const char* riskCheckToString(RiskCheck check) {
  switch (check) {
    case RiskCheck::EmergencyStop: return "emergency_stop";
    case RiskCheck::Basic:         return "basic";
    case RiskCheck::Cash:          return "cash";
    case RiskCheck::Position:      return "position";
    case RiskCheck::Concentration: return "concentration";
    case RiskCheck::Frequency:     return "frequency";
    case RiskCheck::Drawdown:      return "drawdown";
    case RiskCheck::DailyLoss:     return "daily_loss";
  }
  return "unknown";
}

// Result of one check. observed/limit are the compared quantities (currency
// amounts converted to double for reporting, ratios as fractions, counts as
// counts) when the check compares something.
struct CheckOutcome {
  RiskCheck check{RiskCheck::Basic};
  bool passed{true};
  std::string message;
  std::optional<double> observed;
  std::optional<double> limit;
};

struct EmergencyStopDetail {
  std::string reason;
  std::int64_t stop_time_ms{0};
  std::int64_t duration_ms{0};
};

// -----------------------------------------------------------------------------
// RiskCheckDetail — structured explanation of a check() call
// -----------------------------------------------------------------------------
//
// checks lists every check that ran, in order, up to and including the first
// failure. When the emergency stop is active, emergency_stop is true, stop
// is populated and checks holds only the EmergencyStop outcome.
// -----------------------------------------------------------------------------
struct RiskCheckDetail {
  bool emergency_stop{false};
  std::optional<EmergencyStopDetail> stop;
  std::optional<RiskCheck> failed_check;
  std::optional<domain::Money> valuation_price;
  domain::Money trade_value;
  domain::Money estimated_commission;
  std::vector<CheckOutcome> checks;
};

struct RiskCheckResult {
  bool allowed{false};
  std::string reason;
  RiskCheckDetail detail;
};

}  // namespace riskledger
