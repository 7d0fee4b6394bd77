#pragma once

#include <vector>

namespace riskledger {
namespace stats {

// Free numerical helpers behind PortfolioRiskCalculator. None of them
// validate sample size; callers check that first.

double mean(const std::vector<double>& values);

// Sample standard deviation (n - 1 denominator). 0.0 for fewer than two
// values.
double sampleStdDev(const std::vector<double>& values);

// Sample covariance (n - 1). a and b must have equal length >= 2.
double sampleCovariance(const std::vector<double>& a,
                        const std::vector<double>& b);

// Population variance (n). 0.0 for an empty sample.
double populationVariance(const std::vector<double>& values);

// Population skewness and excess kurtosis (biased estimators).
double skewness(const std::vector<double>& values);
double excessKurtosis(const std::vector<double>& values);

// q-th percentile, q in [0, 100], linear interpolation between closest
// ranks: the value at rank q/100 * (n - 1) of the sorted sample.
double percentile(std::vector<double> values, double q);

// Mean of the values <= threshold; NaN when none qualify.
double tailMean(const std::vector<double>& values, double threshold);

double normalPdf(double x);

// Standard normal quantile for p in (0, 1).
double inverseNormalCdf(double p);

bool allFinite(const std::vector<double>& values);

}  // namespace stats
}  // namespace riskledger
