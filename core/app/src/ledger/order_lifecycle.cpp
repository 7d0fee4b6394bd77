#include "riskledger/ledger/order_lifecycle.hpp"

namespace riskledger {

// -----------------------------------------------------------------------------
// transitionStatus: validate state machine transitions
// -----------------------------------------------------------------------------
bool transitionStatus(domain::OrderStatus current, domain::OrderStatus next) {
  using S = domain::OrderStatus;

  switch (current) {
    case S::Submitted:
      return next == S::Filled ||
             next == S::Rejected ||
             next == S::Cancelled;

    case S::Filled:
    case S::Rejected:
    case S::Cancelled:
      return false;
  }

  return false;
}

// -----------------------------------------------------------------------------
// isTerminal: check if a status is a final (non-mutable) state
// -----------------------------------------------------------------------------
bool isTerminal(domain::OrderStatus status) {
  using S = domain::OrderStatus;

  switch (status) {
    case S::Submitted:
      return false;
    case S::Filled:
    case S::Rejected:
    case S::Cancelled:
      return true;
  }

  return false;
}

}  // namespace riskledger
