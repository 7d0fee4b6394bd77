#pragma once

#include <cstddef>
#include <optional>

namespace riskledger {
namespace domain {

enum class RiskLevel {
  Low,
  Medium,
  High,
  Critical,
};

inline const char* riskLevelToString(RiskLevel level) {
  switch (level) {
    case RiskLevel::Low:      return "low";
    case RiskLevel::Medium:   return "medium";
    case RiskLevel::High:     return "high";
    case RiskLevel::Critical: return "critical";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// RiskMetrics — computed risk/performance record for one return series
// -----------------------------------------------------------------------------
//
// @brief  Produced only by PortfolioRiskCalculator::calculateMetrics().
//
// @details
// All values are fractions of capital (0.05 == 5%). VaR and ES follow the
// lower-tail convention and are therefore negative for a losing tail.
//
// Ratios whose denominator is degenerate (zero volatility, zero drawdown,
// zero downside deviation, zero benchmark variance) are left empty instead
// of being reported as 0, so "undefined" can never be read as "no risk".
// The benchmark-relative fields are also empty when no benchmark was given.
// -----------------------------------------------------------------------------
struct RiskMetrics {
  double volatility{0.0};           // Annualized sample stdev
  double total_return{0.0};         // prod(1 + r) - 1
  double annualized_return{0.0};    // (1 + total)^(252 / n) - 1
  double max_drawdown{0.0};         // Positive fraction
  double var_95{0.0};
  double var_99{0.0};
  double expected_shortfall_95{0.0};
  double expected_shortfall_99{0.0};
  std::optional<double> sharpe_ratio;
  std::optional<double> sortino_ratio;
  std::optional<double> calmar_ratio;
  std::optional<double> beta;
  std::optional<double> tracking_error;
  std::optional<double> information_ratio;
  RiskLevel risk_level{RiskLevel::Low};
  std::size_t observations{0};
};

}  // namespace domain
}  // namespace riskledger
