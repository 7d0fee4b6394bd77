#pragma once

#include "riskledger/domain/money.hpp"
#include "riskledger/domain/order_status.hpp"
#include "riskledger/domain/side.hpp"
#include "riskledger/domain/signal.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace riskledger {
namespace domain {

using OrderId = std::uint64_t;

enum class OrderType {
  Market,
  Limit,
};

inline const char* orderTypeToString(OrderType type) {
  switch (type) {
    case OrderType::Market: return "market";
    case OrderType::Limit:  return "limit";
  }
  return "unknown";
}

inline const char* orderStatusToString(OrderStatus status) {
  switch (status) {
    case OrderStatus::Submitted: return "submitted";
    case OrderStatus::Filled:    return "filled";
    case OrderStatus::Rejected:  return "rejected";
    case OrderStatus::Cancelled: return "cancelled";
  }
  return "unknown";
}

inline std::optional<OrderStatus> parseOrderStatus(const std::string& text) {
  if (text == "submitted") return OrderStatus::Submitted;
  if (text == "filled")    return OrderStatus::Filled;
  if (text == "rejected")  return OrderStatus::Rejected;
  if (text == "cancelled") return OrderStatus::Cancelled;
  return std::nullopt;
}

struct Order {
  OrderId id{};                   // Ledger-assigned, monotonically from 1
  std::string signal_id;          // Signal this order was derived from
  std::string strategy;           // Strategy tag carried from the signal
  std::string symbol;
  Side side{Side::Buy};
  OrderType type{OrderType::Market};
  Quantity quantity{0};
  std::optional<Money> limit_price;
  OrderStatus status{OrderStatus::Submitted};
  Quantity filled_quantity{0};
  Money average_fill_price;       // Zero until filled
  Money commission;               // Zero until filled
  std::string reject_reason;      // Set only when status == Rejected
  std::int64_t created_ms{0};
  std::int64_t updated_ms{0};
};

}  // namespace domain
}  // namespace riskledger
