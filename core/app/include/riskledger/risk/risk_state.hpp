#pragma once

#include "riskledger/domain/money.hpp"
#include "riskledger/domain/risk_limits.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace riskledger {

// -----------------------------------------------------------------------------
// Emergency-stop state machine: Running ⇄ Stopped
// -----------------------------------------------------------------------------
//
// Stopped carries everything needed to leave the state again: the limits
// that were active when the stop was triggered (restored verbatim on
// resume), plus the trigger time and reason. Running carries nothing, so a
// resumed gate cannot keep stale stop metadata around.
// -----------------------------------------------------------------------------
struct Running {};

struct Stopped {
  std::string reason;
  std::int64_t stop_time_ms{0};
  domain::RiskLimits limits_backup;
};

using EmergencyStopState = std::variant<Running, Stopped>;

// -----------------------------------------------------------------------------
// RiskState — mutable risk bookkeeping owned by RiskGate
// -----------------------------------------------------------------------------
//
// Daily fields (daily_pnl, daily_trade_count, trades_by_symbol) belong to the
// trading day last_reset_day and are cleared when the clock moves to a new
// day. peak_equity / current_drawdown track the whole session.
// emergency_stop survives day changes.
// -----------------------------------------------------------------------------
struct RiskState {
  domain::Money daily_pnl;
  std::int64_t daily_trade_count{0};
  std::map<std::string, std::int64_t> trades_by_symbol;
  domain::Money peak_equity;
  double current_drawdown{0.0};
  std::int64_t last_reset_day{0};
  EmergencyStopState emergency_stop{Running{}};
};

// Read-only copy returned by RiskGate::getStatus().
struct RiskStatus {
  bool emergency_stop_active{false};
  std::string emergency_stop_reason;
  std::optional<std::int64_t> emergency_stop_time_ms;
  std::optional<std::int64_t> emergency_stop_duration_ms;
  bool has_limits_backup{false};
  domain::Money daily_pnl;
  std::int64_t daily_trade_count{0};
  std::map<std::string, std::int64_t> trades_by_symbol;
  domain::Money peak_equity;
  double current_drawdown{0.0};
  domain::RiskLimits limits;
  std::int64_t last_reset_day{0};
};

}  // namespace riskledger
