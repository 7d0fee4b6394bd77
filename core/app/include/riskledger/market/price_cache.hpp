#pragma once

#include "riskledger/domain/money.hpp"
#include "riskledger/market/i_market_data_provider.hpp"
#include "riskledger/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace riskledger {

// -----------------------------------------------------------------------------
// PriceCache — in-memory IMarketDataProvider
// -----------------------------------------------------------------------------
//
// @brief  Keeps the latest quote and a bounded price history per symbol.
//
// @details
// Written by the market data thread (MarketDataGateway's tick sink) and read
// by the ledger on whatever thread runs ExecutionController::submit(). A
// std::shared_mutex lets many readers proceed while ticks are applied one at
// a time.
//
// Staleness:
//   When max_quote_age_ms > 0, a quote older than that (measured with the
//   injected clock) is reported as unavailable. This is how a silent feed
//   turns into rejected market orders rather than fills at an old price.
//
// History:
//   Each update appends (timestamp, price) to the symbol's history, capped
//   at max_history points (oldest dropped).
//
// Ownership:
//   Owned by main() (or a test). Holds a const reference to the clock.
// -----------------------------------------------------------------------------
class PriceCache final : public IMarketDataProvider {
 public:
  struct Quote {
    domain::Money price;
    std::int64_t timestamp_ms{0};
  };

  explicit PriceCache(const ITimeProvider& clock,
                      std::int64_t max_quote_age_ms = 0,
                      std::size_t max_history = 10'000);

  PriceCache(const PriceCache&) = delete;
  PriceCache& operator=(const PriceCache&) = delete;
  PriceCache(PriceCache&&) = delete;
  PriceCache& operator=(PriceCache&&) = delete;

  // -------------------------------------------------------------------------
  // updatePrice(symbol, price, timestamp_ms)
  // -------------------------------------------------------------------------
  // @brief  Records a new quote. Non-positive prices are ignored and logged.
  //
  // Thread-safety: Safe from any thread (unique_lock).
  // -------------------------------------------------------------------------
  void updatePrice(const std::string& symbol, domain::Money price,
                   std::int64_t timestamp_ms);

  // Convenience overload stamped with the clock's now_ms().
  void updatePrice(const std::string& symbol, domain::Money price);

  // Drops the symbol entirely (quote and history).
  void remove(const std::string& symbol);

  std::optional<domain::Money> getCurrentPrice(
      const std::string& symbol) const override;

  std::vector<double> getHistoricalReturns(
      const std::string& symbol, const ReturnRange& range) const override;

  // Latest quote regardless of age.
  std::optional<Quote> lastQuote(const std::string& symbol) const;

  std::vector<std::string> symbols() const;

 private:
  struct SymbolData {
    Quote last;
    std::deque<Quote> history;
  };

  const ITimeProvider& clock_;
  const std::int64_t max_quote_age_ms_;
  const std::size_t max_history_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, SymbolData> data_;
};

}  // namespace riskledger
