#pragma once

#include "riskledger/domain/money.hpp"

#include <cstdint>

namespace riskledger {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLimits — pre-trade risk thresholds for one account
// -----------------------------------------------------------------------------
//
// @brief  Immutable collection of the bounds RiskGate checks every signal
//         against.
//
// @details
// Loaded from the "risk_limits" section of the JSON configuration
// (config_loader.hpp) and passed by value into RiskGate. RiskGate may swap
// the whole record (updateLimits, emergency-stop restore) but never edits a
// field in place.
//
// Money limits are absolute currency amounts. Ratios are fractions
// (0.3 == 30%). Comparisons are strict: a value equal to its limit passes.
//
// The defaults mirror a paper account of 1,000,000:
//
//   min_cash_reserve           10,000   cash that must remain after a buy
//   max_trade_value           100,000   per-trade notional cap (both sides)
//   max_daily_loss             50,000   realized loss floor per trading day
//   max_position_value        500,000   post-trade value per symbol
//   max_position_ratio           0.30   post-trade value / equity
//   max_sector_concentration     0.50   trade value / portfolio value
//   max_daily_trades              100   fills per trading day
//   max_order_frequency            10   fills per symbol per trading day
//   max_drawdown                 0.15   (peak - equity) / peak
//
// Thread model: plain value type; copied into RiskGate.
// -----------------------------------------------------------------------------
struct RiskLimits {
  Money min_cash_reserve{Money::fromUnits(10'000)};
  Money max_trade_value{Money::fromUnits(100'000)};
  Money max_daily_loss{Money::fromUnits(50'000)};
  Money max_position_value{Money::fromUnits(500'000)};
  double max_position_ratio{0.3};
  double max_sector_concentration{0.5};
  std::int64_t max_daily_trades{100};
  std::int64_t max_order_frequency{10};
  double max_drawdown{0.15};
};

inline bool operator==(const RiskLimits& a, const RiskLimits& b) {
  return a.min_cash_reserve == b.min_cash_reserve &&
         a.max_trade_value == b.max_trade_value &&
         a.max_daily_loss == b.max_daily_loss &&
         a.max_position_value == b.max_position_value &&
         a.max_position_ratio == b.max_position_ratio &&
         a.max_sector_concentration == b.max_sector_concentration &&
         a.max_daily_trades == b.max_daily_trades &&
         a.max_order_frequency == b.max_order_frequency &&
         a.max_drawdown == b.max_drawdown;
}

inline bool operator!=(const RiskLimits& a, const RiskLimits& b) {
  return !(a == b);
}

}  // namespace domain
}  // namespace riskledger
