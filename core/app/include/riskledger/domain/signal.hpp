#pragma once

#include "riskledger/domain/money.hpp"
#include "riskledger/domain/side.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace riskledger {
namespace domain {

using Quantity = std::int64_t;

// -----------------------------------------------------------------------------
// Signal — a strategy's request to trade
// -----------------------------------------------------------------------------
//
// @brief  Immutable trade intent produced by a strategy and handed to the
//         ExecutionController.
//
// @details
// A Signal carries no order id and no status; the ledger derives an Order
// from it. A signal with a limit_price becomes a Limit order filled at that
// price; one without becomes a Market order filled at the current quote.
//
// Nothing here is validated on construction. RiskGate's basic check rejects
// an empty symbol, a non-positive quantity or a non-positive limit price.
// -----------------------------------------------------------------------------
struct Signal {
  std::string id;                     // Caller-assigned signal identifier
  std::string symbol;                 // Instrument, e.g. "0700.HK"
  Side side{Side::Buy};
  Quantity quantity{0};               // Units; must be > 0
  std::optional<Money> limit_price;   // Present => Limit order
  std::string strategy;               // Strategy tag used for attribution
  std::int64_t timestamp_ms{0};       // When the strategy emitted it
};

}  // namespace domain
}  // namespace riskledger
