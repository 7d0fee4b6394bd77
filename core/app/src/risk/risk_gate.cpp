#include "riskledger/risk/risk_gate.hpp"

#include "riskledger/time/time_utils.hpp"

#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace riskledger {

namespace {

using domain::Money;
using domain::Side;

std::string percent(double fraction) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << fraction * 100.0 << "%";
  return out.str();
}

CheckOutcome pass(RiskCheck check, std::string message) {
  CheckOutcome outcome;
  outcome.check = check;
  outcome.passed = true;
  outcome.message = std::move(message);
  return outcome;
}

CheckOutcome fail(RiskCheck check, std::string message, double observed,
                  double limit) {
  CheckOutcome outcome;
  outcome.check = check;
  outcome.passed = false;
  outcome.message = std::move(message);
  outcome.observed = observed;
  outcome.limit = limit;
  return outcome;
}

const domain::Position* findPosition(
    const std::vector<domain::Position>& positions, const std::string& symbol) {
  for (const auto& position : positions) {
    if (position.symbol == symbol) {
      return &position;
    }
  }
  return nullptr;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: counters start on the clock's current trading day
// -----------------------------------------------------------------------------
RiskGate::RiskGate(const ITimeProvider& clock, domain::RiskLimits limits,
                   domain::CommissionSchedule commission)
    : clock_(clock), commission_(commission), limits_(std::move(limits)) {
  state_.last_reset_day = tradingDay(clock_.now_ms());
}

// -----------------------------------------------------------------------------
// check: eight ordered checks, short-circuit on the first failure
// -----------------------------------------------------------------------------
RiskCheckResult RiskGate::check(const domain::Signal& signal,
                                const domain::AccountSnapshot& account,
                                const std::vector<domain::Position>& positions,
                                std::optional<Money> market_price) {
  std::unique_lock lock(mutex_);
  const std::int64_t now = clock_.now_ms();

  RiskCheckResult result;
  RiskCheckDetail& detail = result.detail;

  // Appends the outcome; on failure fills in the verdict and logs it.
  auto record = [&](CheckOutcome outcome) {
    const bool passed = outcome.passed;
    if (!passed) {
      detail.failed_check = outcome.check;
      result.allowed = false;
      result.reason = outcome.message;
      std::cerr << "[RiskGate] REJECTED signal " << signal.id << " ("
                << signal.symbol << ", " << domain::sideToString(signal.side)
                << " " << signal.quantity << ") at "
                << riskCheckToString(outcome.check)
                << " check: " << outcome.message << "\n";
    }
    detail.checks.push_back(std::move(outcome));
    return passed;
  };

  // --- 1. Emergency stop ------------------------------------------------------
  if (const auto* stopped = std::get_if<Stopped>(&state_.emergency_stop)) {
    detail.emergency_stop = true;
    detail.stop = EmergencyStopDetail{stopped->reason, stopped->stop_time_ms,
                                      now - stopped->stop_time_ms};
    CheckOutcome outcome;
    outcome.check = RiskCheck::EmergencyStop;
    outcome.passed = false;
    outcome.message = "emergency stop active: " + stopped->reason;
    record(std::move(outcome));
    return result;
  }
  record(pass(RiskCheck::EmergencyStop, "trading enabled"));

  rolloverIfNewDayLocked(now);

  // --- 2. Basic validation ----------------------------------------------------
  const domain::Position* held = findPosition(positions, signal.symbol);

  std::optional<Money> price = signal.limit_price;
  if (!price) {
    price = market_price;
  }
  if (!price && held != nullptr && held->current_price.isPositive()) {
    price = held->current_price;
  }
  detail.valuation_price = price;

  if (signal.symbol.empty()) {
    record(fail(RiskCheck::Basic, "symbol is empty", 0.0, 0.0));
    return result;
  }
  if (signal.quantity <= 0) {
    record(fail(RiskCheck::Basic,
                "quantity must be positive, got " +
                    std::to_string(signal.quantity),
                static_cast<double>(signal.quantity), 0.0));
    return result;
  }
  if (price && !price->isPositive()) {
    record(fail(RiskCheck::Basic,
                "price must be positive, got " + price->toString(),
                price->toDouble(), 0.0));
    return result;
  }
  if (!price) {
    CheckOutcome outcome;
    outcome.check = RiskCheck::Basic;
    outcome.passed = false;
    outcome.message = "no price available to value " + signal.symbol;
    record(std::move(outcome));
    return result;
  }

  Money trade_value;
  Money commission;
  Money required_cash;
  try {
    trade_value = *price * signal.quantity;
    commission = commission_.commissionFor(trade_value);
    required_cash = trade_value + commission + limits_.min_cash_reserve;
  } catch (const std::overflow_error& e) {
    CheckOutcome outcome;
    outcome.check = RiskCheck::Basic;
    outcome.passed = false;
    outcome.message = std::string("trade value out of range: ") + e.what();
    record(std::move(outcome));
    return result;
  }
  detail.trade_value = trade_value;
  detail.estimated_commission = commission;
  record(pass(RiskCheck::Basic, "trade value " + trade_value.toString()));

  // --- 3..8 -------------------------------------------------------------------
  if (!record(checkCash(signal, account, trade_value, required_cash)) ||
      !record(checkPosition(signal, account, held, *price)) ||
      !record(checkConcentration(signal, positions, trade_value)) ||
      !record(checkFrequency(signal)) ||
      !record(checkDrawdownLocked(account)) ||
      !record(checkDailyLoss(signal, held, *price))) {
    return result;
  }

  result.allowed = true;
  result.reason = "all risk checks passed";
  return result;
}

// ---- checkCash: buy affordability and per-trade notional cap ----
CheckOutcome RiskGate::checkCash(const domain::Signal& signal,
                                 const domain::AccountSnapshot& account,
                                 Money trade_value, Money required_cash) const {
  if (signal.side == Side::Buy && account.cash < required_cash) {
    return fail(RiskCheck::Cash,
                "insufficient cash: required " + required_cash.toString() +
                    " (incl. reserve " + limits_.min_cash_reserve.toString() +
                    "), available " + account.cash.toString(),
                account.cash.toDouble(), required_cash.toDouble());
  }
  if (trade_value > limits_.max_trade_value) {
    return fail(RiskCheck::Cash,
                "trade value " + trade_value.toString() +
                    " exceeds max_trade_value " +
                    limits_.max_trade_value.toString(),
                trade_value.toDouble(), limits_.max_trade_value.toDouble());
  }
  return pass(RiskCheck::Cash, "cash sufficient");
}

// ---- checkPosition: holdings, post-trade value and equity ratio ----
CheckOutcome RiskGate::checkPosition(const domain::Signal& signal,
                                     const domain::AccountSnapshot& account,
                                     const domain::Position* held,
                                     Money price) const {
  const domain::Quantity held_qty = held != nullptr ? held->quantity : 0;

  if (signal.side == Side::Sell && signal.quantity > held_qty) {
    return fail(RiskCheck::Position,
                "sell quantity " + std::to_string(signal.quantity) +
                    " exceeds holdings " + std::to_string(held_qty) + " of " +
                    signal.symbol,
                static_cast<double>(signal.quantity),
                static_cast<double>(held_qty));
  }

  const domain::Quantity post_qty = signal.side == Side::Buy
                                        ? held_qty + signal.quantity
                                        : held_qty - signal.quantity;
  const Money post_value = price * post_qty;

  if (post_value > limits_.max_position_value) {
    return fail(RiskCheck::Position,
                "post-trade position value " + post_value.toString() +
                    " exceeds max_position_value " +
                    limits_.max_position_value.toString(),
                post_value.toDouble(), limits_.max_position_value.toDouble());
  }

  if (account.equity.isPositive()) {
    const double ratio = Money::ratio(post_value, account.equity);
    if (ratio > limits_.max_position_ratio) {
      return fail(RiskCheck::Position,
                  "post-trade position ratio " + percent(ratio) +
                      " exceeds max_position_ratio " +
                      percent(limits_.max_position_ratio),
                  ratio, limits_.max_position_ratio);
    }
  }
  return pass(RiskCheck::Position,
              "post-trade position value " + post_value.toString());
}

// ---- checkConcentration: trade value against the whole portfolio ----
CheckOutcome RiskGate::checkConcentration(
    const domain::Signal& signal,
    const std::vector<domain::Position>& positions, Money trade_value) const {
  Money total;
  for (const auto& position : positions) {
    total += position.market_value;
  }
  // An empty book has nothing to concentrate against.
  if (total.isZero()) {
    return pass(RiskCheck::Concentration,
                "skipped: portfolio has no market value");
  }
  if (signal.side == Side::Buy) {
    total += trade_value;
  }

  const double ratio = Money::ratio(trade_value, total);
  if (ratio > limits_.max_sector_concentration) {
    return fail(RiskCheck::Concentration,
                "trade is " + percent(ratio) +
                    " of portfolio value, above max_sector_concentration " +
                    percent(limits_.max_sector_concentration),
                ratio, limits_.max_sector_concentration);
  }
  return pass(RiskCheck::Concentration, "concentration " + percent(ratio));
}

// ---- checkFrequency: daily and per-symbol trade counters ----
CheckOutcome RiskGate::checkFrequency(const domain::Signal& signal) const {
  if (state_.daily_trade_count >= limits_.max_daily_trades) {
    return fail(RiskCheck::Frequency,
                "daily trade count " + std::to_string(state_.daily_trade_count) +
                    " reached max_daily_trades " +
                    std::to_string(limits_.max_daily_trades),
                static_cast<double>(state_.daily_trade_count),
                static_cast<double>(limits_.max_daily_trades));
  }

  std::int64_t symbol_count = 0;
  auto it = state_.trades_by_symbol.find(signal.symbol);
  if (it != state_.trades_by_symbol.end()) {
    symbol_count = it->second;
  }
  if (symbol_count >= limits_.max_order_frequency) {
    return fail(RiskCheck::Frequency,
                signal.symbol + " traded " + std::to_string(symbol_count) +
                    " times today, max_order_frequency is " +
                    std::to_string(limits_.max_order_frequency),
                static_cast<double>(symbol_count),
                static_cast<double>(limits_.max_order_frequency));
  }
  return pass(RiskCheck::Frequency,
              std::to_string(state_.daily_trade_count) + " trades today");
}

// ---- checkDrawdownLocked: raise the high-water mark, then compare ----
CheckOutcome RiskGate::checkDrawdownLocked(
    const domain::AccountSnapshot& account) {
  state_.peak_equity = Money::max(state_.peak_equity, account.equity);
  if (!state_.peak_equity.isPositive()) {
    return pass(RiskCheck::Drawdown, "no equity peak yet");
  }

  state_.current_drawdown =
      Money::ratio(state_.peak_equity - account.equity, state_.peak_equity);
  if (state_.current_drawdown > limits_.max_drawdown) {
    return fail(RiskCheck::Drawdown,
                "drawdown " + percent(state_.current_drawdown) +
                    " exceeds max_drawdown " + percent(limits_.max_drawdown),
                state_.current_drawdown, limits_.max_drawdown);
  }
  return pass(RiskCheck::Drawdown,
              "drawdown " + percent(state_.current_drawdown));
}

// ---- checkDailyLoss: projected realized loss of a sell ----
CheckOutcome RiskGate::checkDailyLoss(const domain::Signal& signal,
                                      const domain::Position* held,
                                      Money price) const {
  if (signal.side == Side::Buy) {
    return pass(RiskCheck::DailyLoss, "buy realizes no PnL");
  }

  const Money average_cost = held != nullptr ? held->average_cost : Money();
  const Money projected = (price - average_cost) * signal.quantity;
  const Money projected_daily = state_.daily_pnl + projected;

  if (projected_daily.isNegative() &&
      projected_daily.abs() > limits_.max_daily_loss) {
    return fail(RiskCheck::DailyLoss,
                "projected daily loss " + projected_daily.abs().toString() +
                    " exceeds max_daily_loss " +
                    limits_.max_daily_loss.toString(),
                projected_daily.abs().toDouble(),
                limits_.max_daily_loss.toDouble());
  }
  return pass(RiskCheck::DailyLoss,
              "projected daily PnL " + projected_daily.toString());
}

// -----------------------------------------------------------------------------
// recordTrade: the only mutator of the daily counters
// -----------------------------------------------------------------------------
void RiskGate::recordTrade(const std::string& symbol, Side side,
                           domain::Quantity /*quantity*/, Money /*price*/,
                           Money realized_pnl) {
  std::lock_guard lock(mutex_);
  rolloverIfNewDayLocked(clock_.now_ms());

  ++state_.daily_trade_count;
  ++state_.trades_by_symbol[symbol];
  if (side == Side::Sell) {
    state_.daily_pnl += realized_pnl;
  }
}

// -----------------------------------------------------------------------------
// Emergency stop transitions
// -----------------------------------------------------------------------------
bool RiskGate::emergencyStop(const std::string& reason) {
  std::lock_guard lock(mutex_);
  if (const auto* stopped = std::get_if<Stopped>(&state_.emergency_stop)) {
    std::cerr << "[RiskGate] WARNING: emergency stop already active since "
              << formatTimestamp(stopped->stop_time_ms) << " ("
              << stopped->reason << "); ignoring new trigger: " << reason
              << "\n";
    return true;
  }

  Stopped stopped;
  stopped.reason = reason;
  stopped.stop_time_ms = clock_.now_ms();
  stopped.limits_backup = limits_;

  std::cerr << "[RiskGate] CRITICAL: EMERGENCY STOP at "
            << formatTimestamp(stopped.stop_time_ms) << ": " << reason
            << ". Limits backed up (max_daily_trades="
            << limits_.max_daily_trades
            << ", max_trade_value=" << limits_.max_trade_value.toString()
            << ", max_position_value="
            << limits_.max_position_value.toString()
            << ", max_drawdown=" << percent(limits_.max_drawdown)
            << "). ALL TRADING HALTED.\n";

  state_.emergency_stop = std::move(stopped);
  return true;
}

bool RiskGate::resumeFromEmergencyStop() {
  std::lock_guard lock(mutex_);
  auto* stopped = std::get_if<Stopped>(&state_.emergency_stop);
  if (stopped == nullptr) {
    std::cerr << "[RiskGate] WARNING: resume requested but no emergency stop "
                 "is active\n";
    return true;
  }

  const std::int64_t duration = clock_.now_ms() - stopped->stop_time_ms;
  limits_ = stopped->limits_backup;
  std::cout << "[RiskGate] Emergency stop cleared after " << duration
            << " ms (reason was: " << stopped->reason
            << "). Limits restored.\n";
  state_.emergency_stop = Running{};
  return true;
}

bool RiskGate::isEmergencyStopActive() const {
  std::shared_lock lock(mutex_);
  return std::holds_alternative<Stopped>(state_.emergency_stop);
}

// -----------------------------------------------------------------------------
// getStatus: consistent copy under the shared lock
// -----------------------------------------------------------------------------
RiskStatus RiskGate::getStatus() const {
  std::shared_lock lock(mutex_);

  RiskStatus status;
  if (const auto* stopped = std::get_if<Stopped>(&state_.emergency_stop)) {
    status.emergency_stop_active = true;
    status.emergency_stop_reason = stopped->reason;
    status.emergency_stop_time_ms = stopped->stop_time_ms;
    status.emergency_stop_duration_ms = clock_.now_ms() - stopped->stop_time_ms;
    status.has_limits_backup = true;
  }
  status.daily_pnl = state_.daily_pnl;
  status.daily_trade_count = state_.daily_trade_count;
  status.trades_by_symbol = state_.trades_by_symbol;
  status.peak_equity = state_.peak_equity;
  status.current_drawdown = state_.current_drawdown;
  status.limits = limits_;
  status.last_reset_day = state_.last_reset_day;
  return status;
}

void RiskGate::updateLimits(const domain::RiskLimits& limits) {
  std::lock_guard lock(mutex_);
  limits_ = limits;
  std::cout << "[RiskGate] Risk limits updated\n";
}

domain::RiskLimits RiskGate::limits() const {
  std::shared_lock lock(mutex_);
  return limits_;
}

void RiskGate::resetRiskState() {
  std::lock_guard lock(mutex_);
  state_ = RiskState{};
  state_.last_reset_day = tradingDay(clock_.now_ms());
  std::cout << "[RiskGate] Risk state reset\n";
}

// ---- rolloverIfNewDayLocked: deferred while the emergency stop is active ----
void RiskGate::rolloverIfNewDayLocked(std::int64_t now_ms) {
  if (std::holds_alternative<Stopped>(state_.emergency_stop)) {
    return;
  }
  const std::int64_t today = tradingDay(now_ms);
  if (today == state_.last_reset_day) {
    return;
  }

  std::cout << "[RiskGate] New trading day " << formatDay(today)
            << ": resetting daily counters (" << state_.daily_trade_count
            << " trades, PnL " << state_.daily_pnl.toString() << " on "
            << formatDay(state_.last_reset_day) << ")\n";
  state_.daily_pnl = Money();
  state_.daily_trade_count = 0;
  state_.trades_by_symbol.clear();
  state_.last_reset_day = today;
}

}  // namespace riskledger
