#pragma once

namespace riskledger {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus — order lifecycle state machine
// -----------------------------------------------------------------------------
//
// @brief  Every state a simulated order can occupy.
//
// @details
// Orders are created Submitted by ExecutionLedger::createOrder() and move to
// exactly one terminal state:
//
//   Submitted ──> Filled      (ledger applied the fill)
//       │
//       ├──────> Rejected    (risk gate refused it, or the ledger could not
//       │                     fill it: no quote, insufficient funds/position)
//       │
//       └──────> Cancelled   (operator or caller withdrew it before fill)
//
// Terminal states: Filled, Rejected, Cancelled. The legal transition graph
// is enforced by order_lifecycle::transitionStatus(), an exhaustive switch
// over this enum.
//
// Thread model: plain enum, value type.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Submitted,  // Registered with the ledger, not yet resolved
  Filled,     // Fully filled — terminal state
  Rejected,   // Refused by risk or by the ledger — terminal state
  Cancelled,  // Withdrawn before fill — terminal state
};

}  // namespace domain
}  // namespace riskledger
