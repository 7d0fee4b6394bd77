#pragma once

#include "riskledger/events/event_types.hpp"
#include "riskledger/events/order_update_event.hpp"
#include "riskledger/events/position_update_event.hpp"
#include "riskledger/events/risk_rejection_event.hpp"

#include <variant>

namespace riskledger {

// Closed set of everything that travels over an EventBus or the IPC
// telemetry queue.
using Event = std::variant<
    MarketDataEvent,
    OrderUpdateEvent,
    PositionUpdateEvent,
    RiskRejectionEvent,
    EmergencyStopEvent>;

}  // namespace riskledger
