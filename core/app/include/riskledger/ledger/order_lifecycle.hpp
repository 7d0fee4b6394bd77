#pragma once

#include "riskledger/domain/order_status.hpp"

namespace riskledger {

// -----------------------------------------------------------------------------
// transitionStatus(current, next)
// -----------------------------------------------------------------------------
// @brief  Validates an order status change against the lifecycle graph.
//
// @return true if the transition is permitted, false otherwise.
//
// @details
// Legal transitions:
//   Submitted  → Filled, Rejected, Cancelled
//   Filled     → (none — terminal)
//   Rejected   → (none — terminal)
//   Cancelled  → (none — terminal)
//
// Thread model: Pure function, safe to call from any context.
// -----------------------------------------------------------------------------
bool transitionStatus(domain::OrderStatus current, domain::OrderStatus next);

// True for Filled, Rejected and Cancelled.
bool isTerminal(domain::OrderStatus status);

}  // namespace riskledger
