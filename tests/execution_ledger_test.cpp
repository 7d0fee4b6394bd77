// =============================================================================
// execution_ledger_test.cpp
// =============================================================================
// Unit tests for riskledger::ExecutionLedger.
//
// Validates:
//   - Buy and sell arithmetic: cash, cost basis, average cost, realized PnL
//   - Cash reconciles with the trade history after every fill
//   - A fully closed position has zero average cost and cost basis
//   - Missing quotes, insufficient funds and insufficient holdings reject
//     the order instead of leaving it Submitted
//   - Cancellation, status-filtered queries, history cap, mark-to-market,
//     performance summary and reset
//   - A market order handed a quote fills at that quote, not a fresh one
//   - Failed fills leave no position entry behind
// =============================================================================

#include "riskledger/domain/order.hpp"
#include "riskledger/domain/signal.hpp"
#include "riskledger/ledger/execution_ledger.hpp"
#include "riskledger/market/price_cache.hpp"
#include "riskledger/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <variant>

using riskledger::ExecutionFailure;
using riskledger::ExecutionFailureKind;
using riskledger::ExecutionResult;
using riskledger::FillReport;
using riskledger::domain::Money;
using riskledger::domain::OrderStatus;
using riskledger::domain::Side;
using riskledger::domain::Signal;

namespace {

Money m(const char* text) { return *Money::parse(text); }

Signal limitSignal(const std::string& symbol, Side side, std::int64_t qty,
                   const char* price) {
  Signal s;
  s.id = "sig";
  s.symbol = symbol;
  s.side = side;
  s.quantity = qty;
  s.limit_price = m(price);
  s.strategy = "unit";
  return s;
}

Signal marketSignal(const std::string& symbol, Side side, std::int64_t qty) {
  Signal s;
  s.id = "sig";
  s.symbol = symbol;
  s.side = side;
  s.quantity = qty;
  s.strategy = "unit";
  return s;
}

}  // namespace

class ExecutionLedgerTest : public ::testing::Test {
 protected:
  riskledger::SimulationTimeProvider clock{1'000};
  riskledger::PriceCache prices{clock};

  // createOrder + execute; the fill is expected to succeed.
  static FillReport fill(riskledger::ExecutionLedger& ledger,
                         const Signal& signal) {
    auto order = ledger.createOrder(signal);
    ExecutionResult result = ledger.execute(order.id);
    if (auto* failure = std::get_if<ExecutionFailure>(&result)) {
      ADD_FAILURE() << "unexpected failure: " << failure->reason;
      return FillReport{};
    }
    return std::get<FillReport>(result);
  }

  static ExecutionFailure failure(riskledger::ExecutionLedger& ledger,
                                  const Signal& signal) {
    auto order = ledger.createOrder(signal);
    ExecutionResult result = ledger.execute(order.id);
    if (std::holds_alternative<FillReport>(result)) {
      ADD_FAILURE() << "expected a failure for order " << order.id;
      return ExecutionFailure{};
    }
    return std::get<ExecutionFailure>(result);
  }

  // initial - sum(buy value + commission) + sum(sell value - commission)
  static Money cashFromHistory(const riskledger::ExecutionLedger& ledger) {
    Money cash = ledger.getAccountInfo().initial_cash;
    for (const auto& t : ledger.getTrades()) {
      if (t.side == Side::Buy) {
        cash -= t.trade_value + t.commission;
      } else {
        cash += t.trade_value - t.commission;
      }
    }
    return cash;
  }
};

// -----------------------------------------------------------------------------
// 1. Buy 100 @ 300: commission folds into cost basis.
// -----------------------------------------------------------------------------
TEST_F(ExecutionLedgerTest, BuyDebitsCashAndBuildsCostBasis) {
  riskledger::ExecutionLedger ledger(prices, clock);

  FillReport report = fill(ledger, limitSignal("X", Side::Buy, 100, "300"));

  EXPECT_EQ(report.order_id, 1u);
  EXPECT_EQ(report.trade_id, 1u);
  EXPECT_EQ(report.trade_value, m("30000"));
  EXPECT_EQ(report.commission, m("30"));
  EXPECT_TRUE(report.realized_pnl.isZero());
  EXPECT_EQ(report.cash_after, m("969970"));

  auto pos = ledger.getPosition("X");
  ASSERT_TRUE(pos.has_value());
  EXPECT_EQ(pos->quantity, 100);
  EXPECT_EQ(pos->cost_basis, m("30030"));
  EXPECT_EQ(pos->average_cost, m("300.3"));
  EXPECT_EQ(pos->market_value, m("30000"));
  EXPECT_EQ(pos->unrealized_pnl, -m("30"));

  auto account = ledger.getAccountInfo();
  EXPECT_EQ(account.cash, m("969970"));
  EXPECT_EQ(account.equity, m("999970"));
  EXPECT_EQ(account.total_commission, m("30"));

  auto order = ledger.getOrder(report.order_id);
  ASSERT_TRUE(order.has_value());
  EXPECT_EQ(order->status, OrderStatus::Filled);
  EXPECT_EQ(order->filled_quantity, 100);
  EXPECT_EQ(order->average_fill_price, m("300"));
}

// -----------------------------------------------------------------------------
// 2. Partial then full exit: realized PnL, proportional cost release,
//    and a zeroed average cost once flat.
// -----------------------------------------------------------------------------
TEST_F(ExecutionLedgerTest, SellRealizesPnlAndFlatPositionHasZeroCost) {
  riskledger::ExecutionLedger ledger(prices, clock);
  fill(ledger, limitSignal("X", Side::Buy, 100, "300"));

  FillReport partial = fill(ledger, limitSignal("X", Side::Sell, 40, "310"));
  EXPECT_EQ(partial.commission, m("12.4"));
  EXPECT_EQ(partial.realized_pnl, m("388"));
  EXPECT_EQ(partial.cash_after, m("982357.6"));

  auto pos = ledger.getPosition("X");
  ASSERT_TRUE(pos.has_value());
  EXPECT_EQ(pos->quantity, 60);
  EXPECT_EQ(pos->cost_basis, m("18018"));
  EXPECT_EQ(pos->average_cost, m("300.3"));

  FillReport closing = fill(ledger, limitSignal("X", Side::Sell, 60, "290"));
  EXPECT_EQ(closing.realized_pnl, -m("618"));
  EXPECT_EQ(closing.cash_after, m("999740.2"));

  pos = ledger.getPosition("X");
  ASSERT_TRUE(pos.has_value());
  EXPECT_EQ(pos->quantity, 0);
  EXPECT_TRUE(pos->average_cost.isZero());
  EXPECT_TRUE(pos->cost_basis.isZero());
  EXPECT_EQ(pos->realized_pnl, -m("230"));
  EXPECT_TRUE(ledger.getPositions().empty());
}

// -----------------------------------------------------------------------------
// 3. After every fill, cash equals the cash flow implied by the history,
//    and cash + cost basis accounts for every realized PnL and commission.
// Why: no money may be created or destroyed by the ledger.
// -----------------------------------------------------------------------------
TEST_F(ExecutionLedgerTest, CashReconcilesWithTradeHistory) {
  riskledger::ExecutionLedger ledger(prices, clock);
  const Signal sequence[] = {
      limitSignal("X", Side::Buy, 100, "300"),
      limitSignal("Y", Side::Buy, 50, "80"),
      limitSignal("X", Side::Sell, 40, "310"),
      limitSignal("Y", Side::Buy, 50, "90"),
      limitSignal("X", Side::Sell, 60, "290"),
      limitSignal("Y", Side::Sell, 100, "85"),
  };

  Money sell_commission;
  for (const auto& signal : sequence) {
    FillReport report = fill(ledger, signal);
    if (signal.side == Side::Sell) {
      sell_commission += report.commission;
    }

    const auto account = ledger.getAccountInfo();
    EXPECT_EQ(account.cash, cashFromHistory(ledger));
    EXPECT_EQ(account.cash, report.cash_after);

    Money cost_basis;
    Money realized;
    for (const auto& symbol : {"X", "Y"}) {
      if (auto pos = ledger.getPosition(symbol)) {
        cost_basis += pos->cost_basis;
        realized += pos->realized_pnl;
        if (pos->quantity == 0) {
          EXPECT_TRUE(pos->average_cost.isZero()) << symbol;
        }
      }
    }
    EXPECT_EQ(account.cash + cost_basis,
              account.initial_cash + realized - sell_commission);
  }
}

// -----------------------------------------------------------------------------
// 4. A market order with no quote is rejected, never left Submitted.
// -----------------------------------------------------------------------------
TEST_F(ExecutionLedgerTest, MissingQuoteRejectsOrder) {
  riskledger::ExecutionLedger ledger(prices, clock);

  auto order = ledger.createOrder(marketSignal("AAPL", Side::Buy, 10));
  ExecutionResult result = ledger.execute(order.id);

  ASSERT_TRUE(std::holds_alternative<ExecutionFailure>(result));
  EXPECT_EQ(std::get<ExecutionFailure>(result).kind,
            ExecutionFailureKind::MarketDataUnavailable);

  auto stored = ledger.getOrder(order.id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status, OrderStatus::Rejected);
  EXPECT_FALSE(stored->reject_reason.empty());
  EXPECT_EQ(ledger.getAccountInfo().cash, m("1000000"));
}

// -----------------------------------------------------------------------------
// 5. A market order fills at the current quote.
// -----------------------------------------------------------------------------
TEST_F(ExecutionLedgerTest, MarketOrderUsesCurrentQuote) {
  prices.updatePrice("AAPL", m("150.25"));
  riskledger::ExecutionLedger ledger(prices, clock);

  FillReport report = fill(ledger, marketSignal("AAPL", Side::Buy, 10));

  EXPECT_EQ(report.filled_price, m("150.25"));
  EXPECT_EQ(report.trade_value, m("1502.5"));
  EXPECT_EQ(report.commission, m("10"));
}

// -----------------------------------------------------------------------------
// 6. The ledger refuses overdrafts and short sales on its own.
// Why: second line of defence when the gate saw a stale snapshot.
// -----------------------------------------------------------------------------
TEST_F(ExecutionLedgerTest, InsufficientFundsAndPositionRejected) {
  riskledger::LedgerConfig config;
  config.initial_cash = m("1000");
  riskledger::ExecutionLedger ledger(prices, clock, config);

  auto funds = failure(ledger, limitSignal("X", Side::Buy, 10, "100"));
  EXPECT_EQ(funds.kind, ExecutionFailureKind::InsufficientFunds);

  auto holdings = failure(ledger, limitSignal("X", Side::Sell, 5, "100"));
  EXPECT_EQ(holdings.kind, ExecutionFailureKind::InsufficientPosition);

  EXPECT_EQ(ledger.getOrders(OrderStatus::Rejected).size(), 2u);
  EXPECT_EQ(ledger.getAccountInfo().cash, m("1000"));
  EXPECT_TRUE(ledger.getTrades().empty());
}

// -----------------------------------------------------------------------------
// 7. Only Submitted orders can be cancelled, rejected or executed.
// -----------------------------------------------------------------------------
TEST_F(ExecutionLedgerTest, CancellationAndTerminalStates) {
  riskledger::ExecutionLedger ledger(prices, clock);

  auto a = ledger.createOrder(limitSignal("X", Side::Buy, 1, "10"));
  auto b = ledger.createOrder(limitSignal("X", Side::Buy, 1, "10"));
  auto c = ledger.createOrder(limitSignal("X", Side::Buy, 1, "10"));
  auto d = ledger.createOrder(limitSignal("X", Side::Buy, 1, "10"));

  EXPECT_TRUE(ledger.cancelOrder(a.id));
  EXPECT_FALSE(ledger.cancelOrder(a.id));
  EXPECT_FALSE(ledger.cancelOrder(999));

  auto executed = ledger.execute(a.id);
  ASSERT_TRUE(std::holds_alternative<ExecutionFailure>(executed));
  EXPECT_EQ(std::get<ExecutionFailure>(executed).kind,
            ExecutionFailureKind::NotSubmitted);

  auto rejected = ledger.rejectOrder(b.id, "gate said no");
  ASSERT_TRUE(rejected.has_value());
  EXPECT_EQ(rejected->status, OrderStatus::Rejected);
  EXPECT_EQ(rejected->reject_reason, "gate said no");
  EXPECT_FALSE(ledger.rejectOrder(b.id, "again").has_value());

  ASSERT_TRUE(std::holds_alternative<FillReport>(ledger.execute(c.id)));

  EXPECT_EQ(ledger.cancelAllOrders(), 1u);  // only d was still open
  EXPECT_EQ(ledger.getOrder(d.id)->status, OrderStatus::Cancelled);
  EXPECT_EQ(ledger.getOrders().size(), 4u);
  EXPECT_EQ(ledger.getOrders(OrderStatus::Cancelled).size(), 2u);
  EXPECT_EQ(ledger.getOrders(OrderStatus::Filled).size(), 1u);

  auto missing = ledger.execute(12345);
  ASSERT_TRUE(std::holds_alternative<ExecutionFailure>(missing));
  EXPECT_EQ(std::get<ExecutionFailure>(missing).kind,
            ExecutionFailureKind::OrderNotFound);
}

// -----------------------------------------------------------------------------
// 8. Trade history keeps the newest max_trade_history records.
// -----------------------------------------------------------------------------
TEST_F(ExecutionLedgerTest, TradeHistoryIsCapped) {
  riskledger::LedgerConfig config;
  config.max_trade_history = 3;
  riskledger::ExecutionLedger ledger(prices, clock, config);

  for (int i = 0; i < 5; ++i) {
    fill(ledger, limitSignal("X", Side::Buy, 1, "10"));
  }

  auto trades = ledger.getTrades();
  ASSERT_EQ(trades.size(), 3u);
  EXPECT_EQ(trades.front().trade_id, 3u);
  EXPECT_EQ(trades.back().trade_id, 5u);
  EXPECT_EQ(ledger.getPosition("X")->quantity, 5);
}

// -----------------------------------------------------------------------------
// 9. markToMarket revalues held positions from the quote source.
// -----------------------------------------------------------------------------
TEST_F(ExecutionLedgerTest, MarkToMarketRevaluesHoldings) {
  riskledger::ExecutionLedger ledger(prices, clock);
  fill(ledger, limitSignal("X", Side::Buy, 100, "300"));

  EXPECT_EQ(ledger.markToMarket(), 0u);  // no quote for X yet

  prices.updatePrice("X", m("320"));
  EXPECT_EQ(ledger.markToMarket(), 1u);

  auto pos = ledger.getPosition("X");
  ASSERT_TRUE(pos.has_value());
  EXPECT_EQ(pos->current_price, m("320"));
  EXPECT_EQ(pos->market_value, m("32000"));
  EXPECT_EQ(pos->unrealized_pnl, m("1970"));
  EXPECT_EQ(ledger.getAccountInfo().equity, m("1001970"));
}

// -----------------------------------------------------------------------------
// 10. Performance summary over a round trip with one win and one loss.
// -----------------------------------------------------------------------------
TEST_F(ExecutionLedgerTest, PerformanceSummary) {
  riskledger::ExecutionLedger ledger(prices, clock);
  EXPECT_FALSE(ledger.getPerformance().win_rate.has_value());

  fill(ledger, limitSignal("X", Side::Buy, 100, "300"));
  fill(ledger, limitSignal("X", Side::Sell, 40, "310"));
  fill(ledger, limitSignal("X", Side::Sell, 60, "290"));

  auto perf = ledger.getPerformance();
  EXPECT_EQ(perf.trade_count, 3u);
  EXPECT_EQ(perf.winning_trades, 1u);
  EXPECT_EQ(perf.losing_trades, 1u);
  ASSERT_TRUE(perf.win_rate.has_value());
  EXPECT_DOUBLE_EQ(*perf.win_rate, 0.5);
  EXPECT_EQ(perf.realized_pnl, -m("230"));
  EXPECT_EQ(perf.total_commission, m("59.8"));
  EXPECT_EQ(perf.equity, m("999740.2"));
  EXPECT_EQ(perf.total_return, -m("259.8"));
  EXPECT_NEAR(perf.return_rate, -0.0002598, 1e-12);
}

// -----------------------------------------------------------------------------
// 11. reset() returns to a flat account and restarts id sequences.
// -----------------------------------------------------------------------------
TEST_F(ExecutionLedgerTest, ResetRestoresInitialState) {
  riskledger::ExecutionLedger ledger(prices, clock);
  fill(ledger, limitSignal("X", Side::Buy, 100, "300"));

  ledger.reset();

  auto account = ledger.getAccountInfo();
  EXPECT_EQ(account.cash, m("1000000"));
  EXPECT_EQ(account.equity, m("1000000"));
  EXPECT_TRUE(account.total_commission.isZero());
  EXPECT_TRUE(ledger.getPositions().empty());
  EXPECT_TRUE(ledger.getOrders().empty());
  EXPECT_TRUE(ledger.getTrades().empty());
  EXPECT_EQ(ledger.createOrder(limitSignal("X", Side::Buy, 1, "1")).id, 1u);
}

// -----------------------------------------------------------------------------
// 12. execute(id, quote) fills a market order at the quote it was given.
// Why: the caller gated on that quote; a later tick must not move the fill.
// -----------------------------------------------------------------------------
TEST_F(ExecutionLedgerTest, SuppliedQuoteOverridesLiveQuote) {
  prices.updatePrice("AAPL", m("150"));
  riskledger::ExecutionLedger ledger(prices, clock);

  auto market = ledger.createOrder(marketSignal("AAPL", Side::Buy, 10));
  ExecutionResult filled = ledger.execute(market.id, m("140"));
  ASSERT_TRUE(std::holds_alternative<FillReport>(filled));
  EXPECT_EQ(std::get<FillReport>(filled).filled_price, m("140"));
  EXPECT_EQ(std::get<FillReport>(filled).trade_value, m("1400"));

  // No quote handed over: rejected even though the cache has one.
  auto unquoted = ledger.createOrder(marketSignal("AAPL", Side::Buy, 10));
  ExecutionResult missing = ledger.execute(unquoted.id, std::nullopt);
  ASSERT_TRUE(std::holds_alternative<ExecutionFailure>(missing));
  EXPECT_EQ(std::get<ExecutionFailure>(missing).kind,
            ExecutionFailureKind::MarketDataUnavailable);

  // Limit orders keep their limit price.
  auto limit = ledger.createOrder(limitSignal("AAPL", Side::Buy, 10, "120"));
  ExecutionResult limited = ledger.execute(limit.id, m("140"));
  ASSERT_TRUE(std::holds_alternative<FillReport>(limited));
  EXPECT_EQ(std::get<FillReport>(limited).filled_price, m("120"));
}

// -----------------------------------------------------------------------------
// 13. A failed buy or sell of an unknown symbol creates no position entry.
// -----------------------------------------------------------------------------
TEST_F(ExecutionLedgerTest, FailedFillLeavesNoPositionEntry) {
  riskledger::LedgerConfig config;
  config.initial_cash = m("1000");
  riskledger::ExecutionLedger ledger(prices, clock, config);

  auto funds = failure(ledger, limitSignal("NEW", Side::Buy, 100, "100"));
  EXPECT_EQ(funds.kind, ExecutionFailureKind::InsufficientFunds);
  EXPECT_FALSE(ledger.getPosition("NEW").has_value());

  auto holdings = failure(ledger, limitSignal("GHOST", Side::Sell, 1, "10"));
  EXPECT_EQ(holdings.kind, ExecutionFailureKind::InsufficientPosition);
  EXPECT_FALSE(ledger.getPosition("GHOST").has_value());

  fill(ledger, limitSignal("NEW", Side::Buy, 1, "100"));
  ASSERT_TRUE(ledger.getPosition("NEW").has_value());
  EXPECT_EQ(ledger.getPosition("NEW")->quantity, 1);
}
