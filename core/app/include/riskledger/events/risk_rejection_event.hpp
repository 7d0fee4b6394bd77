#pragma once

#include "riskledger/domain/order.hpp"

#include <cstdint>
#include <string>

namespace riskledger {

// -----------------------------------------------------------------------------
// RiskRejectionEvent — a signal refused by RiskGate
// -----------------------------------------------------------------------------
//
// check names the failing check ("emergency_stop", "basic", "cash",
// "position", "concentration", "frequency", "drawdown", "daily_loss").
// observed/limit carry the compared values when the check has them
// (currency amounts as plain numbers, ratios as fractions).
// -----------------------------------------------------------------------------
struct RiskRejectionEvent {
  domain::OrderId order_id{0};
  std::string signal_id;
  std::string symbol;
  std::string check;
  std::string reason;
  double observed{0.0};
  double limit{0.0};
  std::int64_t timestamp_ms{0};
};

}  // namespace riskledger
