#pragma once

#include "riskledger/domain/money.hpp"
#include "riskledger/domain/signal.hpp"

#include <string>

namespace riskledger {
namespace domain {

// -----------------------------------------------------------------------------
// Position — per-symbol long holding
// -----------------------------------------------------------------------------
//
// @brief  Quantity held, what it cost, and what it is worth now.
//
// @details
// Long-only: quantity never goes negative. Selling more than is held is
// refused by RiskGate and again by ExecutionLedger.
//
// cost_basis is the exact amount paid for the units still held, commission
// included. average_cost is derived from it (cost_basis / quantity, rounded
// half up) so that repeated buys never accumulate rounding drift in the
// basis itself. When quantity returns to 0 both are reset to 0.
//
// market_value = quantity * current_price
// unrealized_pnl = market_value - cost_basis
// realized_pnl accumulates (fill_price - average_cost) * qty on every sell.
//
// Thread model:
//   Value type. The authoritative copy lives inside ExecutionLedger; every
//   accessor hands out copies.
// -----------------------------------------------------------------------------
struct Position {
  std::string symbol;
  Quantity quantity{0};
  Money average_cost;
  Money cost_basis;
  Money current_price;
  Money market_value;
  Money unrealized_pnl;
  Money realized_pnl;
};

}  // namespace domain
}  // namespace riskledger
