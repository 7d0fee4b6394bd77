#pragma once

#include "riskledger/domain/money.hpp"

namespace riskledger {
namespace domain {

// -----------------------------------------------------------------------------
// CommissionSchedule — proportional commission with a floor
// -----------------------------------------------------------------------------
//
// commission = max(trade_value * rate, minimum), rounded half up to the
// smallest Money unit. Shared by RiskGate (pre-trade cash estimate) and
// ExecutionLedger (actual charge) so both see the same number.
// -----------------------------------------------------------------------------
struct CommissionSchedule {
  double rate{0.001};
  Money minimum{Money::fromUnits(10)};

  Money commissionFor(Money trade_value) const {
    return Money::max(trade_value.applyRate(rate, Rounding::HalfUp), minimum);
  }
};

}  // namespace domain
}  // namespace riskledger
