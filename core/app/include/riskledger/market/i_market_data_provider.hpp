#pragma once

#include "riskledger/domain/money.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace riskledger {

// Inclusive epoch-millisecond window for historical queries.
struct ReturnRange {
  std::int64_t start_ms{0};
  std::int64_t end_ms{0};
};

// -----------------------------------------------------------------------------
// IMarketDataProvider — price source consumed by the ledger
// -----------------------------------------------------------------------------
//
// @brief  Abstract collaborator that answers "what does this symbol trade
//         at now?" and "what were its returns over this window?".
//
// @details
// ExecutionLedger calls getCurrentPrice() to resolve the fill price of a
// market order and to mark held positions to market. An empty optional
// means the quote is unavailable (unknown symbol, stale quote, feed down);
// the ledger then rejects the order instead of guessing a price.
//
// getHistoricalReturns() is used by callers that assemble inputs for
// PortfolioRiskCalculator. Returns are simple period returns
// (p[i] / p[i-1] - 1), oldest first.
//
// Implementations:
//   - PriceCache: in-memory quotes fed by MarketDataGateway (ZeroMQ) or
//     directly by tests.
//
// Thread-safety contract:
//   Both methods may be called concurrently from any thread.
// -----------------------------------------------------------------------------
class IMarketDataProvider {
 public:
  virtual ~IMarketDataProvider() = default;

  virtual std::optional<domain::Money> getCurrentPrice(
      const std::string& symbol) const = 0;

  virtual std::vector<double> getHistoricalReturns(
      const std::string& symbol, const ReturnRange& range) const = 0;
};

}  // namespace riskledger
