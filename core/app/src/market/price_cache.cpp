#include "riskledger/market/price_cache.hpp"

#include <iostream>
#include <mutex>

namespace riskledger {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
PriceCache::PriceCache(const ITimeProvider& clock,
                       std::int64_t max_quote_age_ms,
                       std::size_t max_history)
    : clock_(clock),
      max_quote_age_ms_(max_quote_age_ms),
      max_history_(max_history == 0 ? 1 : max_history) {}

// -----------------------------------------------------------------------------
// updatePrice: record quote and append to bounded history
// -----------------------------------------------------------------------------
void PriceCache::updatePrice(const std::string& symbol, domain::Money price,
                             std::int64_t timestamp_ms) {
  if (!price.isPositive()) {
    std::cerr << "[PriceCache] WARNING: ignoring non-positive price "
              << price.toString() << " for " << symbol << "\n";
    return;
  }

  std::unique_lock lock(mutex_);
  SymbolData& entry = data_[symbol];
  entry.last = Quote{price, timestamp_ms};
  entry.history.push_back(entry.last);
  while (entry.history.size() > max_history_) {
    entry.history.pop_front();
  }
}

void PriceCache::updatePrice(const std::string& symbol, domain::Money price) {
  updatePrice(symbol, price, clock_.now_ms());
}

// -----------------------------------------------------------------------------
// remove
// -----------------------------------------------------------------------------
void PriceCache::remove(const std::string& symbol) {
  std::unique_lock lock(mutex_);
  data_.erase(symbol);
}

// -----------------------------------------------------------------------------
// getCurrentPrice: latest quote unless stale
// -----------------------------------------------------------------------------
std::optional<domain::Money> PriceCache::getCurrentPrice(
    const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  auto it = data_.find(symbol);
  if (it == data_.end()) {
    return std::nullopt;
  }

  const Quote& quote = it->second.last;
  if (max_quote_age_ms_ > 0 &&
      clock_.now_ms() - quote.timestamp_ms > max_quote_age_ms_) {
    return std::nullopt;
  }
  return quote.price;
}

// -----------------------------------------------------------------------------
// getHistoricalReturns: simple returns between consecutive in-range quotes
// -----------------------------------------------------------------------------
std::vector<double> PriceCache::getHistoricalReturns(
    const std::string& symbol, const ReturnRange& range) const {
  std::vector<double> returns;

  std::shared_lock lock(mutex_);
  auto it = data_.find(symbol);
  if (it == data_.end()) {
    return returns;
  }

  const Quote* previous = nullptr;
  for (const Quote& q : it->second.history) {
    if (q.timestamp_ms < range.start_ms || q.timestamp_ms > range.end_ms) {
      continue;
    }
    if (previous != nullptr) {
      returns.push_back(domain::Money::ratio(q.price, previous->price) - 1.0);
    }
    previous = &q;
  }
  return returns;
}

// -----------------------------------------------------------------------------
// lastQuote / symbols: reporting accessors
// -----------------------------------------------------------------------------
std::optional<PriceCache::Quote> PriceCache::lastQuote(
    const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  auto it = data_.find(symbol);
  if (it == data_.end()) {
    return std::nullopt;
  }
  return it->second.last;
}

std::vector<std::string> PriceCache::symbols() const {
  std::shared_lock lock(mutex_);
  std::vector<std::string> out;
  out.reserve(data_.size());
  for (const auto& [symbol, entry] : data_) {
    out.push_back(symbol);
  }
  return out;
}

}  // namespace riskledger
