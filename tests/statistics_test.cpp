// =============================================================================
// statistics_test.cpp
// =============================================================================
// Unit tests for the riskledger::stats helpers behind the risk calculator.
//
// Validates:
//   - Sample (n - 1) moments and population higher moments
//   - Linear-interpolated percentiles and tail means
//   - Inverse normal CDF against published quantiles
// =============================================================================

#include "riskledger/analytics/statistics.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

namespace stats = riskledger::stats;

// -----------------------------------------------------------------------------
// 1. Mean and sample standard deviation.
// -----------------------------------------------------------------------------
TEST(StatisticsTest, MeanAndSampleStdDev) {
  const std::vector<double> v{2, 4, 4, 4, 5, 5, 7, 9};

  EXPECT_DOUBLE_EQ(stats::mean(v), 5.0);
  EXPECT_NEAR(stats::sampleStdDev(v), std::sqrt(32.0 / 7.0), 1e-12);
  EXPECT_NEAR(stats::sampleCovariance(v, v), 32.0 / 7.0, 1e-12);
  EXPECT_NEAR(stats::populationVariance(v), 4.0, 1e-12);

  EXPECT_DOUBLE_EQ(stats::mean({}), 0.0);
  EXPECT_DOUBLE_EQ(stats::sampleStdDev({3.0}), 0.0);
  EXPECT_DOUBLE_EQ(stats::populationVariance({}), 0.0);
}

// -----------------------------------------------------------------------------
// 2. Skewness and excess kurtosis use population moments.
// -----------------------------------------------------------------------------
TEST(StatisticsTest, HigherMoments) {
  const std::vector<double> symmetric{-2, -1, 0, 1, 2};
  EXPECT_NEAR(stats::skewness(symmetric), 0.0, 1e-12);
  // m2 = 2, m4 = 6.8 -> 6.8 / 4 - 3
  EXPECT_NEAR(stats::excessKurtosis(symmetric), -1.3, 1e-12);

  const std::vector<double> flat{0.5, 0.5, 0.5};
  EXPECT_DOUBLE_EQ(stats::skewness(flat), 0.0);
  EXPECT_DOUBLE_EQ(stats::excessKurtosis(flat), 0.0);

  const std::vector<double> right_tail{0, 0, 0, 0, 10};
  EXPECT_GT(stats::skewness(right_tail), 0.0);
}

// -----------------------------------------------------------------------------
// 3. Percentiles interpolate between order statistics.
// -----------------------------------------------------------------------------
TEST(StatisticsTest, PercentileInterpolates) {
  const std::vector<double> v{5, 1, 4, 2, 3};

  EXPECT_DOUBLE_EQ(stats::percentile(v, 0.0), 1.0);
  EXPECT_DOUBLE_EQ(stats::percentile(v, 50.0), 3.0);
  EXPECT_DOUBLE_EQ(stats::percentile(v, 100.0), 5.0);
  EXPECT_NEAR(stats::percentile(v, 10.0), 1.4, 1e-12);
  EXPECT_TRUE(std::isnan(stats::percentile({}, 50.0)));
}

// -----------------------------------------------------------------------------
// 4. Tail mean averages values at or below the threshold.
// -----------------------------------------------------------------------------
TEST(StatisticsTest, TailMean) {
  const std::vector<double> v{-3, -1, 2, 5};

  EXPECT_DOUBLE_EQ(stats::tailMean(v, -1.0), -2.0);
  EXPECT_DOUBLE_EQ(stats::tailMean(v, 10.0), 0.75);
  EXPECT_TRUE(std::isnan(stats::tailMean(v, -5.0)));
}

// -----------------------------------------------------------------------------
// 5. Normal quantiles match reference values.
// -----------------------------------------------------------------------------
TEST(StatisticsTest, InverseNormalCdf) {
  EXPECT_NEAR(stats::inverseNormalCdf(0.5), 0.0, 1e-12);
  EXPECT_NEAR(stats::inverseNormalCdf(0.975), 1.959963984540054, 1e-9);
  EXPECT_NEAR(stats::inverseNormalCdf(0.05), -1.6448536269514722, 1e-9);
  EXPECT_NEAR(stats::inverseNormalCdf(0.01), -2.3263478740408408, 1e-9);
  EXPECT_NEAR(stats::inverseNormalCdf(0.001), -3.090232306167813, 1e-9);

  EXPECT_TRUE(std::isnan(stats::inverseNormalCdf(0.0)));
  EXPECT_TRUE(std::isnan(stats::inverseNormalCdf(1.0)));

  EXPECT_NEAR(stats::normalPdf(0.0), 0.3989422804014327, 1e-15);
}

// -----------------------------------------------------------------------------
// 6. allFinite spots NaN and infinity.
// -----------------------------------------------------------------------------
TEST(StatisticsTest, AllFinite) {
  EXPECT_TRUE(stats::allFinite({0.1, -0.2}));
  EXPECT_TRUE(stats::allFinite({}));
  EXPECT_FALSE(
      stats::allFinite({0.1, std::numeric_limits<double>::quiet_NaN()}));
  EXPECT_FALSE(
      stats::allFinite({std::numeric_limits<double>::infinity()}));
}
