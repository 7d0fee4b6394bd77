#pragma once

#include "riskledger/domain/account_snapshot.hpp"
#include "riskledger/domain/commission_schedule.hpp"
#include "riskledger/domain/position.hpp"
#include "riskledger/domain/risk_limits.hpp"
#include "riskledger/domain/signal.hpp"
#include "riskledger/risk/risk_check.hpp"
#include "riskledger/risk/risk_state.hpp"
#include "riskledger/time/i_time_provider.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace riskledger {

// -----------------------------------------------------------------------------
// RiskGate
// -----------------------------------------------------------------------------
//
// @brief  Stateful pre-trade validator. Decides whether a Signal may become
//         a fill, and owns the daily counters and emergency stop.
//
// @details
// check() runs eight checks in a fixed order and stops at the first
// failure:
//
//   1. Emergency stop   reject everything while Stopped
//   2. Basic            symbol, quantity, price, valuation price present
//   3. Cash             buy affordability incl. reserve; max_trade_value
//   4. Position         sell <= holdings; post-trade value and ratio
//   5. Concentration    trade value / portfolio value (skipped when empty)
//   6. Frequency        daily trade count and per-symbol count
//   7. Drawdown         (peak - equity) / peak
//   8. Daily loss       projected realized loss of a sell
//
// Rejections are values (RiskCheckResult), never exceptions. A quantity
// large enough to overflow Money fails the basic check.
//
// check() mutates only the equity high-water mark and the day rollover.
// recordTrade() is the only mutator of daily_pnl and the trade counters, and
// is called by ExecutionController after a successful fill.
//
// Day rollover:
//   check() and recordTrade() compare tradingDay(clock.now_ms()) against
//   last_reset_day and clear the daily fields when they differ. While the
//   emergency stop is active the rollover is deferred, so counters from the
//   stopped day are cleared on the first call after resume.
//
// Emergency stop:
//   Running -> Stopped snapshots the active limits; Stopped -> Running
//   restores them verbatim. Both directions are idempotent no-ops when the
//   gate is already in the target state.
//
// Thread model:
//   Every public method is safe from any thread. Mutators take the unique
//   lock; getStatus(), limits() and isEmergencyStopActive() take the shared
//   lock. ExecutionController additionally serializes check/recordTrade
//   per account so counters advance in fill order.
//
// Ownership:
//   Owned by one ExecutionController through std::unique_ptr. Holds a
//   reference to the clock, which must outlive it.
// -----------------------------------------------------------------------------
class RiskGate {
 public:
  RiskGate(const ITimeProvider& clock, domain::RiskLimits limits,
           domain::CommissionSchedule commission = {});

  RiskGate(const RiskGate&) = delete;
  RiskGate& operator=(const RiskGate&) = delete;
  RiskGate(RiskGate&&) = delete;
  RiskGate& operator=(RiskGate&&) = delete;

  // -------------------------------------------------------------------------
  // check(signal, account, positions, market_price)
  // -------------------------------------------------------------------------
  //
  // @brief  Runs the ordered checks against a snapshot of the account.
  //
  // @param  signal        The trade intent.
  // @param  account       Current AccountSnapshot (cash, equity).
  // @param  positions     Current open positions.
  // @param  market_price  Latest quote for signal.symbol, if the caller has
  //                       one.
  //
  // @return allowed + human-readable reason + per-check detail.
  //
  // @details
  // The valuation price is, in order: the signal's limit price, then
  // market_price, then the held position's current price. With none of
  // them the basic check fails.
  //
  // Side-effects: may raise peak_equity / current_drawdown; may roll the
  //               daily counters over.
  // -------------------------------------------------------------------------
  RiskCheckResult check(const domain::Signal& signal,
                        const domain::AccountSnapshot& account,
                        const std::vector<domain::Position>& positions,
                        std::optional<domain::Money> market_price = std::nullopt);

  // -------------------------------------------------------------------------
  // recordTrade(symbol, side, quantity, price, realized_pnl)
  // -------------------------------------------------------------------------
  //
  // @brief  Counts a completed fill against today's limits.
  //
  // @details
  // Increments daily_trade_count and trades_by_symbol[symbol], and adds
  // realized_pnl (zero for buys) to daily_pnl.
  // -------------------------------------------------------------------------
  void recordTrade(const std::string& symbol, domain::Side side,
                   domain::Quantity quantity, domain::Money price,
                   domain::Money realized_pnl);

  // Running -> Stopped. Returns true on success, including the repeated
  // call while already stopped (which keeps the first reason and time).
  bool emergencyStop(const std::string& reason);

  // Stopped -> Running, restoring the limits captured by emergencyStop().
  // Returns true on success, including the no-op call while running.
  bool resumeFromEmergencyStop();

  bool isEmergencyStopActive() const;

  RiskStatus getStatus() const;

  // Replaces the active limits. While stopped, the backup taken at stop
  // time is still what resume restores.
  void updateLimits(const domain::RiskLimits& limits);

  domain::RiskLimits limits() const;

  // Clears counters, high-water mark and drawdown. An active emergency stop
  // is dropped together with its limits backup; the active limits stay.
  void resetRiskState();

 private:
  // *Locked helpers require mutex_ held exclusively; the other helpers only
  // read limits_ / state_ and require it held in either mode.
  void rolloverIfNewDayLocked(std::int64_t now_ms);

  CheckOutcome checkCash(const domain::Signal& signal,
                         const domain::AccountSnapshot& account,
                         domain::Money trade_value,
                         domain::Money required_cash) const;
  CheckOutcome checkPosition(const domain::Signal& signal,
                             const domain::AccountSnapshot& account,
                             const domain::Position* held,
                             domain::Money price) const;
  CheckOutcome checkConcentration(const domain::Signal& signal,
                                  const std::vector<domain::Position>& positions,
                                  domain::Money trade_value) const;
  CheckOutcome checkFrequency(const domain::Signal& signal) const;
  CheckOutcome checkDrawdownLocked(const domain::AccountSnapshot& account);
  CheckOutcome checkDailyLoss(const domain::Signal& signal,
                              const domain::Position* held,
                              domain::Money price) const;

  const ITimeProvider& clock_;
  const domain::CommissionSchedule commission_;

  mutable std::shared_mutex mutex_;  // guards limits_ and state_
  domain::RiskLimits limits_;
  RiskState state_;
};

}  // namespace riskledger
