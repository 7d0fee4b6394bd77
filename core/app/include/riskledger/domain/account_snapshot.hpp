#pragma once

#include "riskledger/domain/money.hpp"

#include <cstdint>

namespace riskledger {
namespace domain {

// Recomputed by ExecutionLedger after every fill and revaluation.
// equity is the single source of truth for drawdown tracking.
struct AccountSnapshot {
  Money initial_cash;
  Money cash;
  Money market_value;       // Sum of position market values
  Money equity;             // cash + market_value
  Money buying_power;       // cash (no margin)
  Money total_commission;   // Commission paid since the last reset
  std::int64_t updated_ms{0};
};

}  // namespace domain
}  // namespace riskledger
