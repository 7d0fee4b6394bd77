#include "riskledger/ledger/execution_ledger.hpp"

#include "riskledger/ledger/order_lifecycle.hpp"

#include <iostream>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace riskledger {

using domain::Money;
using domain::Rounding;
using domain::Side;

// -----------------------------------------------------------------------------
// Constructor: account starts flat at initial_cash
// -----------------------------------------------------------------------------
ExecutionLedger::ExecutionLedger(const IMarketDataProvider& market_data,
                                 const ITimeProvider& clock,
                                 LedgerConfig config)
    : market_data_(market_data), clock_(clock), config_(std::move(config)) {
  account_.initial_cash = config_.initial_cash;
  account_.cash = config_.initial_cash;
  recomputeAccountLocked(clock_.now_ms());
}

// -----------------------------------------------------------------------------
// createOrder: register a Submitted order derived from the signal
// -----------------------------------------------------------------------------
domain::Order ExecutionLedger::createOrder(const domain::Signal& signal) {
  const std::int64_t now = clock_.now_ms();

  domain::Order order;
  order.id = order_ids_.next_id();
  order.signal_id = signal.id;
  order.strategy = signal.strategy;
  order.symbol = signal.symbol;
  order.side = signal.side;
  order.type = signal.limit_price ? domain::OrderType::Limit
                                  : domain::OrderType::Market;
  order.quantity = signal.quantity;
  order.limit_price = signal.limit_price;
  order.status = domain::OrderStatus::Submitted;
  order.created_ms = now;
  order.updated_ms = now;

  std::unique_lock lock(mutex_);
  orders_[order.id] = order;
  return order;
}

// -----------------------------------------------------------------------------
// rejectOrder: Submitted -> Rejected
// -----------------------------------------------------------------------------
std::optional<domain::Order> ExecutionLedger::rejectOrder(
    domain::OrderId id, const std::string& reason) {
  std::unique_lock lock(mutex_);
  auto it = orders_.find(id);
  if (it == orders_.end() ||
      !transitionStatus(it->second.status, domain::OrderStatus::Rejected)) {
    return std::nullopt;
  }
  it->second.status = domain::OrderStatus::Rejected;
  it->second.reject_reason = reason;
  it->second.updated_ms = clock_.now_ms();
  return it->second;
}

// -----------------------------------------------------------------------------
// execute: quote lookup unlocked, then fill at that quote
// -----------------------------------------------------------------------------
ExecutionResult ExecutionLedger::execute(domain::OrderId id) {
  domain::Order order;
  {
    std::shared_lock lock(mutex_);
    auto it = orders_.find(id);
    if (it == orders_.end()) {
      return ExecutionFailure{ExecutionFailureKind::OrderNotFound,
                              "order " + std::to_string(id) + " not found"};
    }
    order = it->second;
  }

  // Collaborator I/O, no lock held.
  std::optional<Money> quote;
  if (order.type == domain::OrderType::Market) {
    quote = market_data_.getCurrentPrice(order.symbol);
  }
  return execute(id, quote);
}

// -----------------------------------------------------------------------------
// execute(id, quote): the whole mutation under one lock
// -----------------------------------------------------------------------------
ExecutionResult ExecutionLedger::execute(domain::OrderId id,
                                         std::optional<Money> quote) {
  const std::int64_t now = clock_.now_ms();
  std::unique_lock lock(mutex_);

  auto it = orders_.find(id);
  if (it == orders_.end()) {
    return ExecutionFailure{ExecutionFailureKind::OrderNotFound,
                            "order " + std::to_string(id) + " not found"};
  }
  domain::Order& live = it->second;
  if (live.status != domain::OrderStatus::Submitted) {
    return ExecutionFailure{
        ExecutionFailureKind::NotSubmitted,
        "order " + std::to_string(id) + " is " +
            domain::orderStatusToString(live.status)};
  }

  // --- Step 1: fill price ------------------------------------------------------
  const std::optional<Money> price =
      live.type == domain::OrderType::Limit ? live.limit_price : quote;

  if (!price) {
    return failLocked(live, ExecutionFailureKind::MarketDataUnavailable,
                      "no market price available for " + live.symbol, now);
  }
  if (!price->isPositive() || live.quantity <= 0) {
    return failLocked(live, ExecutionFailureKind::InvalidOrder,
                      "non-positive price or quantity", now);
  }

  // --- Step 2: trade value and commission -------------------------------------
  Money trade_value;
  Money commission;
  try {
    trade_value = *price * live.quantity;
    commission = config_.commission.commissionFor(trade_value);
  } catch (const std::overflow_error& e) {
    return failLocked(live, ExecutionFailureKind::InvalidOrder,
                      std::string("trade value out of range: ") + e.what(),
                      now);
  }

  // The position entry is created only once a buy is known to fill.
  auto pos_it = positions_.find(live.symbol);

  Money realized;
  if (live.side == Side::Buy) {
    // --- Step 3: buy ---------------------------------------------------------
    const Money cost = trade_value + commission;
    if (account_.cash < cost) {
      std::cerr << "[ExecutionLedger] WARNING: insufficient funds for order "
                << id << " (needs " << cost.toString() << ", cash "
                << account_.cash.toString()
                << "). Risk check ran on a stale snapshot.\n";
      return failLocked(live, ExecutionFailureKind::InsufficientFunds,
                        "insufficient funds: needs " + cost.toString() +
                            ", cash " + account_.cash.toString(),
                        now);
    }
    if (pos_it == positions_.end()) {
      pos_it = positions_.emplace(live.symbol, domain::Position{}).first;
      pos_it->second.symbol = live.symbol;
    }
    domain::Position& pos = pos_it->second;
    account_.cash -= cost;
    pos.quantity += live.quantity;
    pos.cost_basis += cost;
    pos.average_cost = pos.cost_basis.divide(pos.quantity, Rounding::HalfUp);
  } else {
    // --- Step 4: sell --------------------------------------------------------
    const domain::Quantity held =
        pos_it == positions_.end() ? 0 : pos_it->second.quantity;
    if (live.quantity > held) {
      std::cerr << "[ExecutionLedger] WARNING: insufficient position for "
                   "order " << id << " (selling " << live.quantity
                << " " << live.symbol << ", holding " << held
                << "). Risk check ran on a stale snapshot.\n";
      return failLocked(live, ExecutionFailureKind::InsufficientPosition,
                        "insufficient position: selling " +
                            std::to_string(live.quantity) + ", holding " +
                            std::to_string(held),
                        now);
    }
    domain::Position& pos = pos_it->second;
    realized = (*price - pos.average_cost) * live.quantity;
    account_.cash += trade_value - commission;

    const Money released =
        pos.cost_basis.mulDiv(live.quantity, pos.quantity, Rounding::HalfUp);
    pos.quantity -= live.quantity;
    if (pos.quantity == 0) {
      pos.cost_basis = Money();
      pos.average_cost = Money();
    } else {
      pos.cost_basis -= released;
      pos.average_cost = pos.cost_basis.divide(pos.quantity, Rounding::HalfUp);
    }
    pos.realized_pnl += realized;
  }

  // --- Step 5: revalue at the fill price --------------------------------------
  pos_it->second.current_price = *price;
  account_.total_commission += commission;
  recomputeAccountLocked(now);

  live.status = domain::OrderStatus::Filled;
  live.filled_quantity = live.quantity;
  live.average_fill_price = *price;
  live.commission = commission;
  live.updated_ms = now;

  // --- Step 6: append the trade record ----------------------------------------
  domain::TradeRecord record;
  record.trade_id = trade_ids_.next_id();
  record.order_id = live.id;
  record.signal_id = live.signal_id;
  record.strategy = live.strategy;
  record.symbol = live.symbol;
  record.side = live.side;
  record.quantity = live.quantity;
  record.price = *price;
  record.trade_value = trade_value;
  record.commission = commission;
  record.realized_pnl = realized;
  record.cash_after = account_.cash;
  record.timestamp_ms = now;
  trades_.push_back(record);
  while (trades_.size() > config_.max_trade_history) {
    trades_.pop_front();
  }

  std::cout << "[ExecutionLedger] FILLED order " << live.id << ": "
            << domain::sideToString(live.side) << " " << live.quantity << " "
            << live.symbol << " @ " << price->toString() << " (value "
            << trade_value.toString() << ", commission "
            << commission.toString() << ", cash "
            << account_.cash.toString() << ")\n";

  FillReport report;
  report.order_id = live.id;
  report.trade_id = record.trade_id;
  report.symbol = live.symbol;
  report.side = live.side;
  report.filled_price = *price;
  report.filled_quantity = live.quantity;
  report.trade_value = trade_value;
  report.commission = commission;
  report.realized_pnl = realized;
  report.cash_after = account_.cash;
  report.timestamp_ms = now;
  return report;
}

// ---- failLocked: the order leaves Submitted with the failure reason ----
ExecutionFailure ExecutionLedger::failLocked(domain::Order& order,
                                             ExecutionFailureKind kind,
                                             std::string reason,
                                             std::int64_t now_ms) {
  order.status = domain::OrderStatus::Rejected;
  order.reject_reason = reason;
  order.updated_ms = now_ms;
  return ExecutionFailure{kind, std::move(reason)};
}

// -----------------------------------------------------------------------------
// Cancellation
// -----------------------------------------------------------------------------
bool ExecutionLedger::cancelOrder(domain::OrderId id) {
  std::unique_lock lock(mutex_);
  auto it = orders_.find(id);
  if (it == orders_.end() ||
      !transitionStatus(it->second.status, domain::OrderStatus::Cancelled)) {
    return false;
  }
  it->second.status = domain::OrderStatus::Cancelled;
  it->second.updated_ms = clock_.now_ms();
  return true;
}

std::size_t ExecutionLedger::cancelAllOrders() {
  std::unique_lock lock(mutex_);
  const std::int64_t now = clock_.now_ms();
  std::size_t cancelled = 0;
  for (auto& [id, order] : orders_) {
    if (transitionStatus(order.status, domain::OrderStatus::Cancelled)) {
      order.status = domain::OrderStatus::Cancelled;
      order.updated_ms = now;
      ++cancelled;
    }
  }
  if (cancelled > 0) {
    std::cout << "[ExecutionLedger] Cancelled " << cancelled
              << " open order(s)\n";
  }
  return cancelled;
}

// -----------------------------------------------------------------------------
// markToMarket: quotes fetched unlocked, applied under the lock
// -----------------------------------------------------------------------------
std::size_t ExecutionLedger::markToMarket() {
  std::vector<std::string> symbols;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [symbol, pos] : positions_) {
      if (pos.quantity > 0) {
        symbols.push_back(symbol);
      }
    }
  }

  std::map<std::string, Money> quotes;
  for (const auto& symbol : symbols) {
    if (auto price = market_data_.getCurrentPrice(symbol)) {
      quotes[symbol] = *price;
    }
  }

  std::unique_lock lock(mutex_);
  std::size_t revalued = 0;
  for (const auto& [symbol, price] : quotes) {
    auto it = positions_.find(symbol);
    if (it != positions_.end() && it->second.quantity > 0) {
      it->second.current_price = price;
      ++revalued;
    }
  }
  recomputeAccountLocked(clock_.now_ms());
  return revalued;
}

// ---- recomputeAccountLocked: position valuations and the account snapshot ----
void ExecutionLedger::recomputeAccountLocked(std::int64_t now_ms) {
  Money market_value;
  for (auto& [symbol, pos] : positions_) {
    pos.market_value = pos.current_price * pos.quantity;
    pos.unrealized_pnl = pos.market_value - pos.cost_basis;
    market_value += pos.market_value;
  }
  account_.market_value = market_value;
  account_.equity = account_.cash + market_value;
  account_.buying_power = account_.cash;
  account_.updated_ms = now_ms;
}

// -----------------------------------------------------------------------------
// Read-only accessors
// -----------------------------------------------------------------------------
domain::AccountSnapshot ExecutionLedger::getAccountInfo() const {
  std::shared_lock lock(mutex_);
  return account_;
}

std::vector<domain::Position> ExecutionLedger::getPositions() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Position> result;
  result.reserve(positions_.size());
  for (const auto& [symbol, pos] : positions_) {
    if (pos.quantity > 0) {
      result.push_back(pos);
    }
  }
  return result;
}

std::optional<domain::Position> ExecutionLedger::getPosition(
    const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  auto it = positions_.find(symbol);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Order> ExecutionLedger::getOrders(
    std::optional<domain::OrderStatus> status) const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Order> result;
  for (const auto& [id, order] : orders_) {
    if (!status || order.status == *status) {
      result.push_back(order);
    }
  }
  return result;
}

std::optional<domain::Order> ExecutionLedger::getOrder(
    domain::OrderId id) const {
  std::shared_lock lock(mutex_);
  auto it = orders_.find(id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::TradeRecord> ExecutionLedger::getTrades() const {
  std::shared_lock lock(mutex_);
  return {trades_.begin(), trades_.end()};
}

// -----------------------------------------------------------------------------
// getPerformance: account-level return plus sell win/loss statistics
// -----------------------------------------------------------------------------
PerformanceSummary ExecutionLedger::getPerformance() const {
  std::shared_lock lock(mutex_);

  PerformanceSummary summary;
  summary.initial_cash = account_.initial_cash;
  summary.equity = account_.equity;
  summary.total_return = account_.equity - account_.initial_cash;
  summary.return_rate =
      Money::ratio(summary.total_return, account_.initial_cash);
  summary.total_commission = account_.total_commission;
  summary.trade_count = trades_.size();

  for (const auto& [symbol, pos] : positions_) {
    summary.realized_pnl += pos.realized_pnl;
    summary.unrealized_pnl += pos.unrealized_pnl;
  }
  for (const auto& trade : trades_) {
    if (trade.side != Side::Sell) {
      continue;
    }
    if (trade.realized_pnl.isPositive()) {
      ++summary.winning_trades;
    } else if (trade.realized_pnl.isNegative()) {
      ++summary.losing_trades;
    }
  }
  const std::size_t decided = summary.winning_trades + summary.losing_trades;
  if (decided > 0) {
    summary.win_rate = static_cast<double>(summary.winning_trades) /
                       static_cast<double>(decided);
  }
  return summary;
}

// -----------------------------------------------------------------------------
// reset: back to a flat account
// -----------------------------------------------------------------------------
void ExecutionLedger::reset() {
  std::unique_lock lock(mutex_);
  positions_.clear();
  orders_.clear();
  trades_.clear();
  order_ids_.reset();
  trade_ids_.reset();

  account_ = domain::AccountSnapshot{};
  account_.initial_cash = config_.initial_cash;
  account_.cash = config_.initial_cash;
  recomputeAccountLocked(clock_.now_ms());
  std::cout << "[ExecutionLedger] Reset to initial cash "
            << config_.initial_cash.toString() << "\n";
}

}  // namespace riskledger
