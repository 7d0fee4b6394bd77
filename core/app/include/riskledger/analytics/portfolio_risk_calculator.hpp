#pragma once

#include "riskledger/analytics/computation_result.hpp"
#include "riskledger/domain/money.hpp"
#include "riskledger/domain/risk_metrics.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace riskledger {

struct CalculatorSettings {
  double risk_free_rate{0.02};          // Annual
  int trading_days{252};
  std::size_t min_observations{30};
  std::size_t mc_simulations{10'000};
  std::uint64_t mc_seed{42};
};

// One VaR/ES estimate. Both are lower-tail returns (negative for a loss).
struct VarEstimate {
  double var{0.0};
  double expected_shortfall{0.0};
  double confidence{0.95};
  int horizon{1};
  std::size_t observations{0};  // Samples the percentile was taken over
};

struct CornishFisherEstimate {
  double var{0.0};
  double expected_shortfall{0.0};  // Normal-model ES
  double confidence{0.95};
  double skewness{0.0};
  double excess_kurtosis{0.0};
  double adjusted_z{0.0};          // Cornish-Fisher quantile
};

struct PositionRisk {
  double weight{0.0};              // position_value / portfolio_value
  double volatility{0.0};          // Annualized
  double var_95{0.0};
  double var_99{0.0};
  double risk_contribution{0.0};   // volatility * weight
  double portfolio_impact{0.0};    // Annualized stdev of returns * weight
};

// Covariance-based decomposition. var is reported as a positive loss
// magnitude; component sums to var.
struct VarDecomposition {
  double portfolio_volatility{0.0};
  double var{0.0};
  double confidence{0.95};
  Eigen::VectorXd marginal;
  Eigen::VectorXd component;
};

struct StressScenario {
  std::string name;
  double factor{1.0};              // Multiplier applied to every return
};

struct StressResult {
  std::string name;
  double factor{1.0};
  double var_95{0.0};
  double var_99{0.0};
  double expected_shortfall_95{0.0};
  double max_drawdown{0.0};
  double expected_loss{0.0};       // Mean stressed return
};

struct RiskBudgetLimits {
  double max_position_weight{0.10};
  double max_concentration{0.20};
  double max_leverage{2.0};
};

struct RiskBudgetReport {
  std::map<std::string, double> position_violations;  // symbol -> weight
  double max_weight{0.0};
  double leverage{0.0};            // Sum of |weight|
  bool concentration_violated{false};
  bool leverage_violated{false};

  bool withinBudget() const {
    return position_violations.empty() && !concentration_violated &&
           !leverage_violated;
  }
};

// -----------------------------------------------------------------------------
// PortfolioRiskCalculator
// -----------------------------------------------------------------------------
//
// @brief  Stateless risk/performance maths over daily return series and
//         covariance matrices.
//
// @details
// Every operation validates its input first and returns a typed
// ComputationError instead of a placeholder number:
//
//   InsufficientSample   fewer than settings.min_observations returns
//   DimensionMismatch    series / benchmark / weights / matrix sizes differ
//   NonPositiveDefinite  covariance not symmetric PSD (eigenvalue check)
//   DegenerateVariance   zero stdev, benchmark variance, downside deviation,
//                        drawdown or portfolio variance where it divides
//   InvalidInput         NaN/inf values, confidence outside (0, 1), bad
//                        horizon or simulation count
//
// Conventions:
//   - returns are simple daily returns, oldest first;
//   - stdev is the sample standard deviation (n - 1);
//   - VaR / ES are lower-tail returns (negative), except VarDecomposition
//     which reports a positive loss magnitude;
//   - percentiles interpolate linearly between closest ranks.
//
// Monte Carlo draws are reproducible: the same seed gives the same result.
//
// Thread model:
//   No mutable state; every method is const and safe from any thread.
// -----------------------------------------------------------------------------
class PortfolioRiskCalculator {
 public:
  explicit PortfolioRiskCalculator(CalculatorSettings settings = {});

  const CalculatorSettings& settings() const { return settings_; }

  // -------------------------------------------------------------------------
  // calculateMetrics(returns, benchmark)
  // -------------------------------------------------------------------------
  // @brief  Full RiskMetrics record for one series.
  //
  // @details
  // Ratios with a degenerate denominator are left empty in the record
  // rather than failing the whole computation. A benchmark must match the
  // series length (DimensionMismatch otherwise).
  // -------------------------------------------------------------------------
  CalcResult<domain::RiskMetrics> calculateMetrics(
      const std::vector<double>& returns,
      const std::optional<std::vector<double>>& benchmark = std::nullopt) const;

  CalcResult<double> volatility(const std::vector<double>& returns) const;
  CalcResult<double> sharpeRatio(const std::vector<double>& returns) const;
  CalcResult<double> sortinoRatio(const std::vector<double>& returns) const;
  CalcResult<double> maxDrawdown(const std::vector<double>& returns) const;
  CalcResult<double> calmarRatio(const std::vector<double>& returns) const;

  // Percentile VaR. With horizon > 1 the percentile is taken over rolling
  // horizon-day sums.
  CalcResult<VarEstimate> historicalVar(const std::vector<double>& returns,
                                        double confidence = 0.95,
                                        int horizon = 1) const;

  CalcResult<double> expectedShortfall(const std::vector<double>& returns,
                                       double confidence = 0.95) const;

  // Normal model: var = mean + stdev * z(1 - c).
  CalcResult<VarEstimate> parametricVar(const std::vector<double>& returns,
                                        double confidence = 0.95) const;

  // Normal quantile corrected for sample skewness and excess kurtosis.
  CalcResult<CornishFisherEstimate> cornishFisherVar(
      const std::vector<double>& returns, double confidence = 0.95) const;

  // Simulates compounded horizon returns from N(mean, stdev). simulations
  // and seed default to the settings.
  CalcResult<VarEstimate> monteCarloVar(
      const std::vector<double>& returns, double confidence = 0.95,
      int horizon = 1, std::optional<std::size_t> simulations = std::nullopt,
      std::optional<std::uint64_t> seed = std::nullopt) const;

  CalcResult<double> beta(const std::vector<double>& returns,
                          const std::vector<double>& benchmark) const;
  CalcResult<double> trackingError(const std::vector<double>& returns,
                                   const std::vector<double>& benchmark) const;
  CalcResult<double> informationRatio(
      const std::vector<double>& returns,
      const std::vector<double>& benchmark) const;

  CalcResult<PositionRisk> positionRisk(domain::Money position_value,
                                        const std::vector<double>& returns,
                                        domain::Money portfolio_value) const;

  // One column per asset; all series must share one length.
  CalcResult<Eigen::MatrixXd> correlationMatrix(
      const std::vector<std::vector<double>>& series) const;

  // Sample covariance annualized by trading_days.
  CalcResult<Eigen::MatrixXd> covarianceMatrix(
      const std::vector<std::vector<double>>& series) const;

  // -------------------------------------------------------------------------
  // portfolioVar(weights, covariance, confidence)
  // -------------------------------------------------------------------------
  // @brief  Parametric portfolio VaR with marginal and component split.
  //
  // @details
  //   sigma_p     = sqrt(w' S w)
  //   var         = |z(1 - c)| * sigma_p
  //   marginal_i  = |z| * (S w)_i / sigma_p
  //   component_i = marginal_i * w_i        (sums to var)
  //
  // S must be square, match w, and be symmetric PSD.
  // -------------------------------------------------------------------------
  CalcResult<VarDecomposition> portfolioVar(const Eigen::VectorXd& weights,
                                            const Eigen::MatrixXd& covariance,
                                            double confidence = 0.95) const;

  CalcResult<std::vector<StressResult>> stressTest(
      const std::vector<double>& returns,
      const std::vector<StressScenario>& scenarios) const;

  CalcResult<RiskBudgetReport> checkRiskBudget(
      const std::map<std::string, double>& weights,
      const RiskBudgetLimits& limits = {}) const;

  // Scores volatility, drawdown and VaR95 on 0..3 each and buckets the sum:
  // >= 7 Critical, >= 5 High, >= 3 Medium, else Low.
  static domain::RiskLevel classifyRiskLevel(double volatility,
                                             double max_drawdown,
                                             double var_95);

 private:
  std::optional<ComputationError> validateSeries(
      const std::vector<double>& returns, const char* what) const;
  std::optional<ComputationError> validatePair(
      const std::vector<double>& returns,
      const std::vector<double>& benchmark) const;

  // Series operations on already-validated input.
  double annualizedVolatility(const std::vector<double>& returns) const;
  std::optional<double> sharpeOf(const std::vector<double>& returns) const;
  std::optional<double> sortinoOf(const std::vector<double>& returns) const;
  static double drawdownOf(const std::vector<double>& returns);

  CalculatorSettings settings_;
};

}  // namespace riskledger
