#pragma once

#include "riskledger/domain/order.hpp"
#include "riskledger/domain/order_status.hpp"

#include <cstdint>

namespace riskledger {

// Order snapshot after a lifecycle change. previous_status equals
// order.status for the initial Submitted notification.
struct OrderUpdateEvent {
  domain::Order order;
  domain::OrderStatus previous_status{domain::OrderStatus::Submitted};
  std::int64_t timestamp_ms{0};
};

}  // namespace riskledger
