#pragma once

#include "riskledger/domain/money.hpp"
#include "riskledger/domain/order.hpp"
#include "riskledger/domain/side.hpp"

#include <cstdint>
#include <string>

namespace riskledger {
namespace domain {

// Immutable record of one applied fill. Appended by ExecutionLedger and never
// edited afterwards.
struct TradeRecord {
  std::uint64_t trade_id{0};
  OrderId order_id{0};
  std::string signal_id;
  std::string strategy;
  std::string symbol;
  Side side{Side::Buy};
  Quantity quantity{0};
  Money price;
  Money trade_value;
  Money commission;
  Money realized_pnl;       // Zero for buys
  Money cash_after;
  std::int64_t timestamp_ms{0};
};

}  // namespace domain
}  // namespace riskledger
