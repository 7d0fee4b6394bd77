#pragma once

#include "riskledger/domain/account_snapshot.hpp"
#include "riskledger/domain/order.hpp"
#include "riskledger/domain/position.hpp"
#include "riskledger/domain/signal.hpp"
#include "riskledger/domain/trade_record.hpp"
#include "riskledger/events/event.hpp"
#include "riskledger/ledger/execution_ledger.hpp"
#include "riskledger/risk/risk_check.hpp"
#include "riskledger/risk/risk_state.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace riskledger {

// -----------------------------------------------------------------------------
// JSON codec for the IPC surface
// -----------------------------------------------------------------------------
//
// @brief  Converts ledger / risk records to nlohmann::json for command
//         responses and PUB telemetry, and decodes signals for SUBMIT.
//
// @details
// Money is written as a JSON number (Money::toDouble()). Timestamps are
// epoch milliseconds. Enums are written as their lowercase names.
//
// Thread model: pure functions.
// -----------------------------------------------------------------------------

nlohmann::json toJson(const domain::Order& order);
nlohmann::json toJson(const domain::Position& position);
nlohmann::json toJson(const domain::AccountSnapshot& account);
nlohmann::json toJson(const domain::TradeRecord& trade);
nlohmann::json toJson(const FillReport& fill);
nlohmann::json toJson(const ExecutionFailure& failure);
nlohmann::json toJson(const PerformanceSummary& performance);
nlohmann::json toJson(const RiskStatus& status);
nlohmann::json toJson(const RiskCheckDetail& detail);

// Telemetry envelope: {"type": "...", ...}. std::nullopt for event types
// that are not broadcast (MarketDataEvent).
std::optional<nlohmann::json> telemetryJson(const Event& event);

// -------------------------------------------------------------------------
// signalFromJson(j)
// -------------------------------------------------------------------------
// @brief  Decodes {"id", "symbol", "side", "quantity", "limit_price"?,
//         "strategy"?, "timestamp_ms"?}.
//
// @details
// limit_price may be a number or a decimal string ("300.25"). Throws
// nlohmann::json::exception for missing keys or wrong types, and
// std::invalid_argument for an unknown side or malformed price string, and
// std::overflow_error for a numeric price out of Money range.
// -------------------------------------------------------------------------
domain::Signal signalFromJson(const nlohmann::json& j);

}  // namespace riskledger
