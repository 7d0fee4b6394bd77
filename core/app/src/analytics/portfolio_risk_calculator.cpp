#include "riskledger/analytics/portfolio_risk_calculator.hpp"

#include "riskledger/analytics/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <string>
#include <utility>

namespace riskledger {

namespace {

// Below this a standard deviation / drawdown is treated as zero.
constexpr double kDegenerate = 1e-12;

ComputationError makeError(ComputationErrorCode code, std::string message) {
  return ComputationError{code, std::move(message)};
}

std::optional<ComputationError> validateConfidence(double confidence) {
  if (!std::isfinite(confidence) || confidence <= 0.0 || confidence >= 1.0) {
    return makeError(ComputationErrorCode::InvalidInput,
                     "confidence must lie in (0, 1), got " +
                         std::to_string(confidence));
  }
  return std::nullopt;
}

std::vector<double> difference(const std::vector<double>& a,
                               const std::vector<double>& b) {
  std::vector<double> out(a.size());
  for (std::size_t i = 0; i < a.size(); ++i) {
    out[i] = a[i] - b[i];
  }
  return out;
}

}  // namespace

PortfolioRiskCalculator::PortfolioRiskCalculator(CalculatorSettings settings)
    : settings_(settings) {}

// -----------------------------------------------------------------------------
// Validation
// -----------------------------------------------------------------------------
std::optional<ComputationError> PortfolioRiskCalculator::validateSeries(
    const std::vector<double>& returns, const char* what) const {
  if (returns.size() < settings_.min_observations) {
    return makeError(ComputationErrorCode::InsufficientSample,
                     std::string(what) + " has " +
                         std::to_string(returns.size()) +
                         " observations, need at least " +
                         std::to_string(settings_.min_observations));
  }
  if (!stats::allFinite(returns)) {
    return makeError(ComputationErrorCode::InvalidInput,
                     std::string(what) + " contains non-finite values");
  }
  return std::nullopt;
}

std::optional<ComputationError> PortfolioRiskCalculator::validatePair(
    const std::vector<double>& returns,
    const std::vector<double>& benchmark) const {
  if (auto err = validateSeries(returns, "returns")) {
    return err;
  }
  if (benchmark.size() != returns.size()) {
    return makeError(ComputationErrorCode::DimensionMismatch,
                     "benchmark has " + std::to_string(benchmark.size()) +
                         " observations, returns have " +
                         std::to_string(returns.size()));
  }
  if (!stats::allFinite(benchmark)) {
    return makeError(ComputationErrorCode::InvalidInput,
                     "benchmark contains non-finite values");
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// Series helpers on validated input
// -----------------------------------------------------------------------------
double PortfolioRiskCalculator::annualizedVolatility(
    const std::vector<double>& returns) const {
  return stats::sampleStdDev(returns) * std::sqrt(settings_.trading_days);
}

std::optional<double> PortfolioRiskCalculator::sharpeOf(
    const std::vector<double>& returns) const {
  const double sd = stats::sampleStdDev(returns);
  if (sd < kDegenerate) {
    return std::nullopt;
  }
  const double excess =
      stats::mean(returns) - settings_.risk_free_rate / settings_.trading_days;
  return excess / sd * std::sqrt(settings_.trading_days);
}

std::optional<double> PortfolioRiskCalculator::sortinoOf(
    const std::vector<double>& returns) const {
  std::vector<double> downside;
  for (double r : returns) {
    if (r < 0.0) {
      downside.push_back(r);
    }
  }
  if (downside.size() < 2) {
    return std::nullopt;
  }
  const double downside_dev =
      stats::sampleStdDev(downside) * std::sqrt(settings_.trading_days);
  if (downside_dev < kDegenerate) {
    return std::nullopt;
  }
  const double excess =
      stats::mean(returns) - settings_.risk_free_rate / settings_.trading_days;
  return excess / downside_dev;
}

// Running peak starts at the first compounded value.
double PortfolioRiskCalculator::drawdownOf(const std::vector<double>& returns) {
  double cumulative = 1.0;
  double peak = 0.0;
  double worst = 0.0;
  bool first = true;
  for (double r : returns) {
    cumulative *= 1.0 + r;
    if (first || cumulative > peak) {
      peak = cumulative;
      first = false;
    }
    if (peak > 0.0) {
      worst = std::max(worst, (peak - cumulative) / peak);
    }
  }
  return worst;
}

// -----------------------------------------------------------------------------
// calculateMetrics
// -----------------------------------------------------------------------------
CalcResult<domain::RiskMetrics> PortfolioRiskCalculator::calculateMetrics(
    const std::vector<double>& returns,
    const std::optional<std::vector<double>>& benchmark) const {
  if (benchmark) {
    if (auto err = validatePair(returns, *benchmark)) {
      return *err;
    }
  } else if (auto err = validateSeries(returns, "returns")) {
    return *err;
  }

  const double n = static_cast<double>(returns.size());
  const double days = static_cast<double>(settings_.trading_days);

  domain::RiskMetrics m;
  m.observations = returns.size();
  m.volatility = annualizedVolatility(returns);

  double growth = 1.0;
  for (double r : returns) {
    growth *= 1.0 + r;
  }
  m.total_return = growth - 1.0;
  m.annualized_return = growth > 0.0 ? std::pow(growth, days / n) - 1.0 : -1.0;

  m.max_drawdown = drawdownOf(returns);
  m.var_95 = stats::percentile(returns, 5.0);
  m.var_99 = stats::percentile(returns, 1.0);
  m.expected_shortfall_95 = stats::tailMean(returns, m.var_95);
  m.expected_shortfall_99 = stats::tailMean(returns, m.var_99);

  m.sharpe_ratio = sharpeOf(returns);
  m.sortino_ratio = sortinoOf(returns);
  if (m.max_drawdown > kDegenerate) {
    m.calmar_ratio = stats::mean(returns) * days / m.max_drawdown;
  }

  if (benchmark) {
    const double benchmark_var = stats::populationVariance(*benchmark);
    if (benchmark_var > kDegenerate * kDegenerate) {
      m.beta = stats::sampleCovariance(returns, *benchmark) / benchmark_var;
    }
    const std::vector<double> active = difference(returns, *benchmark);
    const double te = stats::sampleStdDev(active) * std::sqrt(days);
    m.tracking_error = te;
    if (te > kDegenerate) {
      m.information_ratio = stats::mean(active) * days / te;
    }
  }

  m.risk_level = classifyRiskLevel(m.volatility, m.max_drawdown, m.var_95);
  return m;
}

// -----------------------------------------------------------------------------
// Single-figure series operations
// -----------------------------------------------------------------------------
CalcResult<double> PortfolioRiskCalculator::volatility(
    const std::vector<double>& returns) const {
  if (auto err = validateSeries(returns, "returns")) {
    return *err;
  }
  return annualizedVolatility(returns);
}

CalcResult<double> PortfolioRiskCalculator::sharpeRatio(
    const std::vector<double>& returns) const {
  if (auto err = validateSeries(returns, "returns")) {
    return *err;
  }
  if (auto sharpe = sharpeOf(returns)) {
    return *sharpe;
  }
  return makeError(ComputationErrorCode::DegenerateVariance,
                   "returns have zero standard deviation");
}

CalcResult<double> PortfolioRiskCalculator::sortinoRatio(
    const std::vector<double>& returns) const {
  if (auto err = validateSeries(returns, "returns")) {
    return *err;
  }
  if (auto sortino = sortinoOf(returns)) {
    return *sortino;
  }
  return makeError(ComputationErrorCode::DegenerateVariance,
                   "downside deviation is zero or undefined");
}

CalcResult<double> PortfolioRiskCalculator::maxDrawdown(
    const std::vector<double>& returns) const {
  if (auto err = validateSeries(returns, "returns")) {
    return *err;
  }
  return drawdownOf(returns);
}

CalcResult<double> PortfolioRiskCalculator::calmarRatio(
    const std::vector<double>& returns) const {
  if (auto err = validateSeries(returns, "returns")) {
    return *err;
  }
  const double mdd = drawdownOf(returns);
  if (mdd <= kDegenerate) {
    return makeError(ComputationErrorCode::DegenerateVariance,
                     "max drawdown is zero");
  }
  return stats::mean(returns) * settings_.trading_days / mdd;
}

// -----------------------------------------------------------------------------
// VaR family
// -----------------------------------------------------------------------------
CalcResult<VarEstimate> PortfolioRiskCalculator::historicalVar(
    const std::vector<double>& returns, double confidence, int horizon) const {
  if (auto err = validateSeries(returns, "returns")) {
    return *err;
  }
  if (auto err = validateConfidence(confidence)) {
    return *err;
  }
  if (horizon < 1) {
    return makeError(ComputationErrorCode::InvalidInput,
                     "horizon must be at least 1 day");
  }
  const auto h = static_cast<std::size_t>(horizon);
  if (h > returns.size()) {
    return makeError(ComputationErrorCode::InsufficientSample,
                     "horizon exceeds the number of observations");
  }

  std::vector<double> window_returns;
  if (h == 1) {
    window_returns = returns;
  } else {
    window_returns.reserve(returns.size() - h + 1);
    double sum = 0.0;
    for (std::size_t i = 0; i < returns.size(); ++i) {
      sum += returns[i];
      if (i >= h) {
        sum -= returns[i - h];
      }
      if (i + 1 >= h) {
        window_returns.push_back(sum);
      }
    }
  }

  VarEstimate estimate;
  estimate.confidence = confidence;
  estimate.horizon = horizon;
  estimate.observations = window_returns.size();
  estimate.var = stats::percentile(window_returns, (1.0 - confidence) * 100.0);
  estimate.expected_shortfall = stats::tailMean(window_returns, estimate.var);
  return estimate;
}

CalcResult<double> PortfolioRiskCalculator::expectedShortfall(
    const std::vector<double>& returns, double confidence) const {
  auto var = historicalVar(returns, confidence, 1);
  if (!var) {
    return var.error();
  }
  return var.value().expected_shortfall;
}

CalcResult<VarEstimate> PortfolioRiskCalculator::parametricVar(
    const std::vector<double>& returns, double confidence) const {
  if (auto err = validateSeries(returns, "returns")) {
    return *err;
  }
  if (auto err = validateConfidence(confidence)) {
    return *err;
  }

  const double alpha = 1.0 - confidence;
  const double mu = stats::mean(returns);
  const double sd = stats::sampleStdDev(returns);
  const double z = stats::inverseNormalCdf(alpha);

  VarEstimate estimate;
  estimate.confidence = confidence;
  estimate.observations = returns.size();
  estimate.var = mu + sd * z;
  estimate.expected_shortfall = mu - sd * stats::normalPdf(z) / alpha;
  return estimate;
}

CalcResult<CornishFisherEstimate> PortfolioRiskCalculator::cornishFisherVar(
    const std::vector<double>& returns, double confidence) const {
  if (auto err = validateSeries(returns, "returns")) {
    return *err;
  }
  if (auto err = validateConfidence(confidence)) {
    return *err;
  }

  const double alpha = 1.0 - confidence;
  const double mu = stats::mean(returns);
  const double sd = stats::sampleStdDev(returns);
  const double s = stats::skewness(returns);
  const double k = stats::excessKurtosis(returns);
  const double z = stats::inverseNormalCdf(alpha);

  const double z_cf = z + (s / 6.0) * (z * z - 1.0) +
                      (k / 24.0) * (z * z * z - 3.0 * z) -
                      (s * s / 36.0) * (2.0 * z * z * z - 5.0 * z);

  CornishFisherEstimate estimate;
  estimate.confidence = confidence;
  estimate.skewness = s;
  estimate.excess_kurtosis = k;
  estimate.adjusted_z = z_cf;
  estimate.var = mu + sd * z_cf;
  estimate.expected_shortfall = mu - sd * stats::normalPdf(z) / alpha;
  return estimate;
}

CalcResult<VarEstimate> PortfolioRiskCalculator::monteCarloVar(
    const std::vector<double>& returns, double confidence, int horizon,
    std::optional<std::size_t> simulations,
    std::optional<std::uint64_t> seed) const {
  if (auto err = validateSeries(returns, "returns")) {
    return *err;
  }
  if (auto err = validateConfidence(confidence)) {
    return *err;
  }
  const std::size_t paths = simulations.value_or(settings_.mc_simulations);
  if (horizon < 1 || paths == 0) {
    return makeError(ComputationErrorCode::InvalidInput,
                     "horizon and simulation count must be positive");
  }

  const double mu = stats::mean(returns);
  const double sd = stats::sampleStdDev(returns);
  if (sd < kDegenerate) {
    return makeError(ComputationErrorCode::DegenerateVariance,
                     "cannot simulate from a zero-variance series");
  }

  std::mt19937_64 rng(seed.value_or(settings_.mc_seed));
  std::normal_distribution<double> draw(mu, sd);

  std::vector<double> outcomes(paths);
  for (std::size_t i = 0; i < paths; ++i) {
    double growth = 1.0;
    for (int d = 0; d < horizon; ++d) {
      growth *= 1.0 + draw(rng);
    }
    outcomes[i] = growth - 1.0;
  }

  VarEstimate estimate;
  estimate.confidence = confidence;
  estimate.horizon = horizon;
  estimate.observations = paths;
  estimate.var = stats::percentile(outcomes, (1.0 - confidence) * 100.0);
  estimate.expected_shortfall = stats::tailMean(outcomes, estimate.var);
  return estimate;
}

// -----------------------------------------------------------------------------
// Benchmark-relative
// -----------------------------------------------------------------------------
CalcResult<double> PortfolioRiskCalculator::beta(
    const std::vector<double>& returns,
    const std::vector<double>& benchmark) const {
  if (auto err = validatePair(returns, benchmark)) {
    return *err;
  }
  // Sample covariance over population variance of the benchmark.
  const double benchmark_var = stats::populationVariance(benchmark);
  if (benchmark_var <= kDegenerate * kDegenerate) {
    return makeError(ComputationErrorCode::DegenerateVariance,
                     "benchmark variance is zero");
  }
  return stats::sampleCovariance(returns, benchmark) / benchmark_var;
}

CalcResult<double> PortfolioRiskCalculator::trackingError(
    const std::vector<double>& returns,
    const std::vector<double>& benchmark) const {
  if (auto err = validatePair(returns, benchmark)) {
    return *err;
  }
  return stats::sampleStdDev(difference(returns, benchmark)) *
         std::sqrt(settings_.trading_days);
}

CalcResult<double> PortfolioRiskCalculator::informationRatio(
    const std::vector<double>& returns,
    const std::vector<double>& benchmark) const {
  if (auto err = validatePair(returns, benchmark)) {
    return *err;
  }
  const std::vector<double> active = difference(returns, benchmark);
  const double te =
      stats::sampleStdDev(active) * std::sqrt(settings_.trading_days);
  if (te <= kDegenerate) {
    return makeError(ComputationErrorCode::DegenerateVariance,
                     "tracking error is zero");
  }
  return stats::mean(active) * settings_.trading_days / te;
}

// -----------------------------------------------------------------------------
// positionRisk
// -----------------------------------------------------------------------------
CalcResult<PositionRisk> PortfolioRiskCalculator::positionRisk(
    domain::Money position_value, const std::vector<double>& returns,
    domain::Money portfolio_value) const {
  if (auto err = validateSeries(returns, "position returns")) {
    return *err;
  }
  if (!portfolio_value.isPositive()) {
    return makeError(ComputationErrorCode::InvalidInput,
                     "portfolio value must be positive");
  }

  PositionRisk risk;
  risk.weight = domain::Money::ratio(position_value, portfolio_value);
  risk.volatility = annualizedVolatility(returns);
  risk.var_95 = stats::percentile(returns, 5.0);
  risk.var_99 = stats::percentile(returns, 1.0);
  risk.risk_contribution = risk.volatility * risk.weight;

  std::vector<double> weighted;
  weighted.reserve(returns.size());
  for (double r : returns) {
    weighted.push_back(r * risk.weight);
  }
  risk.portfolio_impact = annualizedVolatility(weighted);
  return risk;
}

// -----------------------------------------------------------------------------
// Covariance / correlation matrices
// -----------------------------------------------------------------------------
namespace {

// Sample covariance of aligned series (one column per asset).
CalcResult<Eigen::MatrixXd> sampleCovarianceMatrix(
    const std::vector<std::vector<double>>& series,
    std::size_t min_observations) {
  if (series.empty()) {
    return makeError(ComputationErrorCode::InvalidInput, "no series given");
  }
  const std::size_t n = series.front().size();
  for (const auto& s : series) {
    if (s.size() != n) {
      return makeError(ComputationErrorCode::DimensionMismatch,
                       "series lengths differ");
    }
    if (!stats::allFinite(s)) {
      return makeError(ComputationErrorCode::InvalidInput,
                       "series contains non-finite values");
    }
  }
  if (n < min_observations || n < 2) {
    return makeError(ComputationErrorCode::InsufficientSample,
                     "series have " + std::to_string(n) +
                         " observations, need at least " +
                         std::to_string(min_observations));
  }

  const auto rows = static_cast<Eigen::Index>(n);
  const auto cols = static_cast<Eigen::Index>(series.size());
  Eigen::MatrixXd x(rows, cols);
  for (Eigen::Index j = 0; j < cols; ++j) {
    for (Eigen::Index i = 0; i < rows; ++i) {
      x(i, j) = series[static_cast<std::size_t>(j)][static_cast<std::size_t>(i)];
    }
  }

  const Eigen::RowVectorXd means = x.colwise().mean();
  const Eigen::MatrixXd centered = x.rowwise() - means;
  Eigen::MatrixXd cov =
      (centered.transpose() * centered) / static_cast<double>(rows - 1);
  return cov;
}

}  // namespace

CalcResult<Eigen::MatrixXd> PortfolioRiskCalculator::covarianceMatrix(
    const std::vector<std::vector<double>>& series) const {
  auto cov = sampleCovarianceMatrix(series, settings_.min_observations);
  if (!cov) {
    return cov.error();
  }
  Eigen::MatrixXd annualized = cov.value() * settings_.trading_days;
  return annualized;
}

CalcResult<Eigen::MatrixXd> PortfolioRiskCalculator::correlationMatrix(
    const std::vector<std::vector<double>>& series) const {
  auto cov = sampleCovarianceMatrix(series, settings_.min_observations);
  if (!cov) {
    return cov.error();
  }
  const Eigen::MatrixXd& c = cov.value();
  const Eigen::VectorXd sd = c.diagonal().cwiseSqrt();
  if (sd.minCoeff() < kDegenerate) {
    return makeError(ComputationErrorCode::DegenerateVariance,
                     "a series has zero variance");
  }
  const Eigen::VectorXd inv_sd = sd.cwiseInverse();
  Eigen::MatrixXd corr = inv_sd.asDiagonal() * c * inv_sd.asDiagonal();
  return corr;
}

// -----------------------------------------------------------------------------
// portfolioVar: sigma_p, VaR, marginal and component split
// -----------------------------------------------------------------------------
CalcResult<VarDecomposition> PortfolioRiskCalculator::portfolioVar(
    const Eigen::VectorXd& weights, const Eigen::MatrixXd& covariance,
    double confidence) const {
  if (auto err = validateConfidence(confidence)) {
    return *err;
  }
  if (weights.size() == 0) {
    return makeError(ComputationErrorCode::InvalidInput, "no weights given");
  }
  if (covariance.rows() != covariance.cols() ||
      covariance.rows() != weights.size()) {
    return makeError(ComputationErrorCode::DimensionMismatch,
                     "covariance must be square and match the weights");
  }
  if (!weights.allFinite() || !covariance.allFinite()) {
    return makeError(ComputationErrorCode::InvalidInput,
                     "weights or covariance contain non-finite values");
  }

  const double tolerance =
      1e-9 * std::max(1.0, covariance.cwiseAbs().maxCoeff());
  if ((covariance - covariance.transpose()).cwiseAbs().maxCoeff() >
      tolerance) {
    return makeError(ComputationErrorCode::NonPositiveDefinite,
                     "covariance is not symmetric");
  }
  Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(
      covariance, Eigen::EigenvaluesOnly);
  if (solver.info() != Eigen::Success ||
      solver.eigenvalues().minCoeff() < -tolerance) {
    return makeError(ComputationErrorCode::NonPositiveDefinite,
                     "covariance has a negative eigenvalue");
  }

  const Eigen::VectorXd sigma_w = covariance * weights;
  const double variance = weights.dot(sigma_w);
  const double sigma_p = std::sqrt(std::max(variance, 0.0));
  if (sigma_p < kDegenerate) {
    return makeError(ComputationErrorCode::DegenerateVariance,
                     "portfolio variance is zero");
  }

  const double z = std::abs(stats::inverseNormalCdf(1.0 - confidence));

  VarDecomposition result;
  result.confidence = confidence;
  result.portfolio_volatility = sigma_p;
  result.var = z * sigma_p;
  result.marginal = z * sigma_w / sigma_p;
  result.component = result.marginal.cwiseProduct(weights);
  return result;
}

// -----------------------------------------------------------------------------
// stressTest: scale every return by the scenario factor
// -----------------------------------------------------------------------------
CalcResult<std::vector<StressResult>> PortfolioRiskCalculator::stressTest(
    const std::vector<double>& returns,
    const std::vector<StressScenario>& scenarios) const {
  if (auto err = validateSeries(returns, "returns")) {
    return *err;
  }

  std::vector<StressResult> results;
  results.reserve(scenarios.size());
  for (const auto& scenario : scenarios) {
    if (!std::isfinite(scenario.factor)) {
      return makeError(ComputationErrorCode::InvalidInput,
                       "stress factor for " + scenario.name +
                           " is not finite");
    }
    std::vector<double> stressed(returns.size());
    std::transform(returns.begin(), returns.end(), stressed.begin(),
                   [&](double r) { return r * scenario.factor; });

    StressResult r;
    r.name = scenario.name;
    r.factor = scenario.factor;
    r.var_95 = stats::percentile(stressed, 5.0);
    r.var_99 = stats::percentile(stressed, 1.0);
    r.expected_shortfall_95 = stats::tailMean(stressed, r.var_95);
    r.max_drawdown = drawdownOf(stressed);
    r.expected_loss = stats::mean(stressed);
    results.push_back(std::move(r));
  }
  return results;
}

// -----------------------------------------------------------------------------
// checkRiskBudget: per-position weight, largest weight, gross leverage
// -----------------------------------------------------------------------------
CalcResult<RiskBudgetReport> PortfolioRiskCalculator::checkRiskBudget(
    const std::map<std::string, double>& weights,
    const RiskBudgetLimits& limits) const {
  RiskBudgetReport report;
  bool first = true;
  for (const auto& [symbol, weight] : weights) {
    if (!std::isfinite(weight)) {
      return makeError(ComputationErrorCode::InvalidInput,
                       "weight for " + symbol + " is not finite");
    }
    if (weight > limits.max_position_weight) {
      report.position_violations[symbol] = weight;
    }
    report.max_weight = first ? weight : std::max(report.max_weight, weight);
    first = false;
    report.leverage += std::abs(weight);
  }
  report.concentration_violated = report.max_weight > limits.max_concentration;
  report.leverage_violated = report.leverage > limits.max_leverage;
  return report;
}

// -----------------------------------------------------------------------------
// classifyRiskLevel
// -----------------------------------------------------------------------------
domain::RiskLevel PortfolioRiskCalculator::classifyRiskLevel(
    double volatility, double max_drawdown, double var_95) {
  int score = 0;

  if (volatility > 0.40) {
    score += 3;
  } else if (volatility > 0.25) {
    score += 2;
  } else if (volatility > 0.15) {
    score += 1;
  }

  if (max_drawdown > 0.20) {
    score += 3;
  } else if (max_drawdown > 0.15) {
    score += 2;
  } else if (max_drawdown > 0.10) {
    score += 1;
  }

  if (var_95 < -0.05) {
    score += 3;
  } else if (var_95 < -0.03) {
    score += 2;
  } else if (var_95 < -0.02) {
    score += 1;
  }

  if (score >= 7) {
    return domain::RiskLevel::Critical;
  }
  if (score >= 5) {
    return domain::RiskLevel::High;
  }
  if (score >= 3) {
    return domain::RiskLevel::Medium;
  }
  return domain::RiskLevel::Low;
}

}  // namespace riskledger
