#pragma once

#include "riskledger/concurrent/order_id_generator.hpp"
#include "riskledger/domain/account_snapshot.hpp"
#include "riskledger/domain/commission_schedule.hpp"
#include "riskledger/domain/order.hpp"
#include "riskledger/domain/position.hpp"
#include "riskledger/domain/signal.hpp"
#include "riskledger/domain/trade_record.hpp"
#include "riskledger/market/i_market_data_provider.hpp"
#include "riskledger/time/i_time_provider.hpp"

#include <cstddef>
#include <deque>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <variant>
#include <vector>

namespace riskledger {

struct LedgerConfig {
  domain::Money initial_cash{domain::Money::fromUnits(1'000'000)};
  domain::CommissionSchedule commission;
  std::size_t max_trade_history{1000};  // Oldest records dropped beyond this
};

// Outcome of a successful execute().
struct FillReport {
  domain::OrderId order_id{0};
  std::uint64_t trade_id{0};
  std::string symbol;
  domain::Side side{domain::Side::Buy};
  domain::Money filled_price;
  domain::Quantity filled_quantity{0};
  domain::Money trade_value;
  domain::Money commission;
  domain::Money realized_pnl;  // Zero for buys
  domain::Money cash_after;
  std::int64_t timestamp_ms{0};
};

enum class ExecutionFailureKind {
  MarketDataUnavailable,
  InsufficientFunds,
  InsufficientPosition,
  InvalidOrder,
  OrderNotFound,
  NotSubmitted,
};

inline const char* executionFailureKindToString(ExecutionFailureKind kind) {
  switch (kind) {
    case ExecutionFailureKind::MarketDataUnavailable: return "market_data_unavailable";
    case ExecutionFailureKind::InsufficientFunds:     return "insufficient_funds";
    case ExecutionFailureKind::InsufficientPosition:  return "insufficient_position";
    case ExecutionFailureKind::InvalidOrder:          return "invalid_order";
    case ExecutionFailureKind::OrderNotFound:         return "order_not_found";
    case ExecutionFailureKind::NotSubmitted:          return "not_submitted";
  }
  return "unknown";
}

struct ExecutionFailure {
  ExecutionFailureKind kind{ExecutionFailureKind::InvalidOrder};
  std::string reason;
};

using ExecutionResult = std::variant<FillReport, ExecutionFailure>;

struct PerformanceSummary {
  domain::Money initial_cash;
  domain::Money equity;
  domain::Money total_return;       // equity - initial_cash
  double return_rate{0.0};          // total_return / initial_cash
  domain::Money realized_pnl;       // Sum over all positions
  domain::Money unrealized_pnl;     // Sum over open positions
  domain::Money total_commission;
  std::size_t trade_count{0};       // Fills currently in the history
  std::size_t winning_trades{0};    // Sells with realized_pnl > 0
  std::size_t losing_trades{0};     // Sells with realized_pnl < 0
  std::optional<double> win_rate;   // Empty when no sell closed with PnL
};

// -----------------------------------------------------------------------------
// ExecutionLedger — virtual account: cash, positions, orders, trades
// -----------------------------------------------------------------------------
//
// @brief  Simulates fills against market data and applies each one to the
//         account atomically.
//
// @details
// execute() steps:
//
//   1. Price. Limit orders fill at their limit price; market orders at
//      the quote passed in, or IMarketDataProvider::getCurrentPrice() when
//      none is. No quote => the order is Rejected (MarketDataUnavailable),
//      never left Submitted.
//   2. Commission via CommissionSchedule (same schedule as RiskGate).
//   3. Buy:  cash >= trade_value + commission, else InsufficientFunds.
//            cash -= trade_value + commission
//            cost_basis += trade_value + commission
//            average_cost = cost_basis / quantity (HalfUp)
//   4. Sell: quantity <= held, else InsufficientPosition.
//            realized = (fill_price - average_cost) * quantity
//            cash += trade_value - commission
//            cost_basis -= cost_basis * sold / held (HalfUp)
//            quantity 0 => cost_basis = average_cost = 0
//   5. Revalue the symbol at the fill price, recompute the AccountSnapshot.
//   6. Append a TradeRecord (history capped at max_trade_history).
//
// Every execution failure after the order was found leaves it Rejected with
// the failure reason. InsufficientFunds / InsufficientPosition indicate the
// caller gated on a stale snapshot and are logged as warnings.
//
// Thread model:
//   The quote lookup in step 1 runs without any ledger lock. A position
//   entry is created only when a buy fills. Steps 2-6 run
//   under the unique lock, so readers (which take the shared lock and get
//   copies) never observe a half-applied fill.
//
// Ownership:
//   Owned by ExecutionController through std::unique_ptr. Holds references
//   to the market-data provider and clock; both must outlive it.
// -----------------------------------------------------------------------------
class ExecutionLedger {
 public:
  ExecutionLedger(const IMarketDataProvider& market_data,
                  const ITimeProvider& clock, LedgerConfig config = {});

  ExecutionLedger(const ExecutionLedger&) = delete;
  ExecutionLedger& operator=(const ExecutionLedger&) = delete;
  ExecutionLedger(ExecutionLedger&&) = delete;
  ExecutionLedger& operator=(ExecutionLedger&&) = delete;

  // -------------------------------------------------------------------------
  // createOrder(signal)
  // -------------------------------------------------------------------------
  // @brief  Registers a Submitted order derived from the signal.
  //
  // @details
  // The order is Limit iff the signal carries a limit price. No validation
  // happens here; RiskGate owns that.
  // -------------------------------------------------------------------------
  domain::Order createOrder(const domain::Signal& signal);

  // Submitted -> Rejected. Returns the updated order, or std::nullopt when
  // the id is unknown or the order is already terminal.
  std::optional<domain::Order> rejectOrder(domain::OrderId id,
                                           const std::string& reason);

  // Market orders fill at getCurrentPrice(), fetched without the lock.
  ExecutionResult execute(domain::OrderId id);

  // Market orders fill at `quote`, the price the caller already gated on;
  // std::nullopt fails the order with MarketDataUnavailable. Limit orders
  // ignore `quote` and fill at their limit price.
  ExecutionResult execute(domain::OrderId id,
                          std::optional<domain::Money> quote);

  // Submitted -> Cancelled. Returns false for unknown or terminal orders.
  bool cancelOrder(domain::OrderId id);

  // Cancels every Submitted order; returns how many were cancelled.
  std::size_t cancelAllOrders();

  // -------------------------------------------------------------------------
  // markToMarket()
  // -------------------------------------------------------------------------
  // @brief  Refreshes current_price of every open position from market
  //         data and recomputes the AccountSnapshot.
  //
  // @return Number of positions revalued. Symbols without a quote keep
  //         their previous price.
  // -------------------------------------------------------------------------
  std::size_t markToMarket();

  // --- Read-only accessors: shared lock, copies out -------------------------
  domain::AccountSnapshot getAccountInfo() const;
  std::vector<domain::Position> getPositions() const;  // quantity > 0 only
  std::optional<domain::Position> getPosition(const std::string& symbol) const;
  std::vector<domain::Order> getOrders(
      std::optional<domain::OrderStatus> status = std::nullopt) const;
  std::optional<domain::Order> getOrder(domain::OrderId id) const;
  std::vector<domain::TradeRecord> getTrades() const;
  PerformanceSummary getPerformance() const;

  const domain::CommissionSchedule& commissionSchedule() const {
    return config_.commission;
  }

  // Back to initial cash with empty books. Ids restart at 1.
  void reset();

 private:
  // Requires mutex_ held exclusively.
  void recomputeAccountLocked(std::int64_t now_ms);
  ExecutionFailure failLocked(domain::Order& order, ExecutionFailureKind kind,
                              std::string reason, std::int64_t now_ms);

  const IMarketDataProvider& market_data_;
  const ITimeProvider& clock_;
  const LedgerConfig config_;

  OrderIdGenerator order_ids_;
  OrderIdGenerator trade_ids_;

  mutable std::shared_mutex mutex_;  // guards everything below
  domain::AccountSnapshot account_;
  std::map<std::string, domain::Position> positions_;
  std::map<domain::OrderId, domain::Order> orders_;
  std::deque<domain::TradeRecord> trades_;
};

}  // namespace riskledger
