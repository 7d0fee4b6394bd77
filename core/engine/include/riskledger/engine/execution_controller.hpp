#pragma once

#include "riskledger/domain/money.hpp"
#include "riskledger/domain/order.hpp"
#include "riskledger/domain/signal.hpp"
#include "riskledger/eventbus/event_bus.hpp"
#include "riskledger/ledger/execution_ledger.hpp"
#include "riskledger/market/i_market_data_provider.hpp"
#include "riskledger/risk/risk_check.hpp"
#include "riskledger/risk/risk_gate.hpp"
#include "riskledger/time/i_time_provider.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace riskledger {

enum class SubmissionStatus {
  Filled,
  RiskRejected,        // a limit check failed (or the emergency stop is on)
  ValidationRejected,  // the signal itself is malformed
  ExecutionFailed,     // passed the gate, but the ledger could not fill it
};

inline const char* submissionStatusToString(SubmissionStatus status) {
  switch (status) {
    case SubmissionStatus::Filled:             return "filled";
    case SubmissionStatus::RiskRejected:       return "risk_rejected";
    case SubmissionStatus::ValidationRejected: return "validation_rejected";
    case SubmissionStatus::ExecutionFailed:    return "execution_failed";
  }
  return "unknown";
}

struct SubmissionResult {
  SubmissionStatus status{SubmissionStatus::ValidationRejected};
  domain::Order order;                     // Final state of the order
  std::optional<FillReport> fill;          // Set when status == Filled
  std::optional<ExecutionFailure> failure; // Set when status == ExecutionFailed
  std::string reason;                      // Empty when filled
  RiskCheckDetail risk;                    // Gate evaluation for this signal

  bool filled() const { return status == SubmissionStatus::Filled; }
};

// Running totals of the fills each strategy tag produced.
struct StrategyAttribution {
  std::string strategy;
  std::size_t trades{0};
  std::size_t buys{0};
  std::size_t sells{0};
  domain::Money turnover;       // Sum of trade values, both sides
  domain::Money commission;
  domain::Money realized_pnl;
};

// -----------------------------------------------------------------------------
// ExecutionController — per-account risk-gated execution pipeline
// -----------------------------------------------------------------------------
//
// @brief  Turns strategy signals into ledger fills:
//           markToMarket -> createOrder -> RiskGate::check
//             -> ExecutionLedger::execute -> RiskGate::recordTrade
//             -> strategy attribution
//
// @details
// One controller per account. The whole pipeline for a signal runs under
// submit_mutex_, so two concurrent submissions can never both pass the cash
// check against the same pre-trade snapshot. Reporting reads (account,
// positions, orders, risk status) go straight to the ledger and the gate,
// which hand out consistent copies under their own shared locks.
//
// The symbol's quote is read once per signal. RiskGate values the trade at
// it and a market order fills at it, so feed ticks cannot move the fill
// away from the price the limits were checked against.
//
// Events are collected while the lock is held and published on the EventBus
// after it is released, in pipeline order:
//   rejected : RiskRejectionEvent, OrderUpdateEvent
//   filled   : OrderUpdateEvent, PositionUpdateEvent
//   failed   : OrderUpdateEvent
// Operator stop/resume publishes EmergencyStopEvent when the state changes.
//
// Thread model:
//   submit(), emergencyStop(), resume(), resetRisk() and executeCommand()
//   are safe from any thread. EventBus callbacks run on the calling thread.
//
// Ownership:
//   Owns the RiskGate and the ExecutionLedger. Holds references to the
//   market data provider, the event bus and the clock; all three must
//   outlive the controller.
// -----------------------------------------------------------------------------
class ExecutionController {
 public:
  ExecutionController(std::string account_id,
                      std::unique_ptr<RiskGate> risk_gate,
                      std::unique_ptr<ExecutionLedger> ledger,
                      const IMarketDataProvider& market_data,
                      EventBus& event_bus, const ITimeProvider& clock);

  ExecutionController(const ExecutionController&) = delete;
  ExecutionController& operator=(const ExecutionController&) = delete;
  ExecutionController(ExecutionController&&) = delete;
  ExecutionController& operator=(ExecutionController&&) = delete;

  // -------------------------------------------------------------------------
  // submit(signal)
  // -------------------------------------------------------------------------
  // @brief  Runs one signal through the full pipeline.
  //
  // @details
  // Every submission creates exactly one order in the ledger, whatever the
  // outcome, so ORDERS shows rejected signals too. A gate rejection whose
  // failing check is the basic validation is reported as
  // ValidationRejected; any other gate rejection as RiskRejected.
  //
  // Never throws for business outcomes.
  // -------------------------------------------------------------------------
  SubmissionResult submit(const domain::Signal& signal);

  // Operator controls. Both return the gate's answer (true, idempotent).
  bool emergencyStop(const std::string& reason);
  bool resume();

  // Clears daily counters, drawdown tracking and any active stop.
  void resetRisk();

  // Refreshes held positions from market data. Returns positions updated.
  std::size_t markToMarket();

  std::vector<StrategyAttribution> attribution() const;

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  // @brief  Text command surface for the IPC server's REP socket.
  //
  // @details
  // "VERB [argument]". Verbs: PING, STATUS, ACCOUNT, POSITIONS,
  // ORDERS [status], TRADES, PERFORMANCE, ATTRIBUTION, HALT <reason>,
  // RESUME, RESET_RISK, SUBMIT <signal-json>, MARK.
  //
  // @return JSON text with "status": "ok" | "error". Malformed arguments
  //         produce an error response rather than an exception.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  const std::string& accountId() const { return account_id_; }
  const RiskGate& riskGate() const { return *risk_gate_; }
  const ExecutionLedger& ledger() const { return *ledger_; }

 private:
  void recordAttributionLocked(const std::string& strategy,
                               const FillReport& fill);

  const std::string account_id_;
  std::unique_ptr<RiskGate> risk_gate_;
  std::unique_ptr<ExecutionLedger> ledger_;
  const IMarketDataProvider& market_data_;
  EventBus& event_bus_;
  const ITimeProvider& clock_;

  // Serializes check -> execute -> recordTrade, and operator controls.
  std::mutex submit_mutex_;

  mutable std::mutex attribution_mutex_;
  std::map<std::string, StrategyAttribution> attribution_;
};

}  // namespace riskledger
