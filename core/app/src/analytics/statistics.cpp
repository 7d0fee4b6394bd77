#include "riskledger/analytics/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace riskledger {
namespace stats {

double mean(const std::vector<double>& values) {
  if (values.empty()) {
    return 0.0;
  }
  double sum = 0.0;
  for (double v : values) {
    sum += v;
  }
  return sum / static_cast<double>(values.size());
}

double sampleStdDev(const std::vector<double>& values) {
  if (values.size() < 2) {
    return 0.0;
  }
  const double m = mean(values);
  double sq = 0.0;
  for (double v : values) {
    sq += (v - m) * (v - m);
  }
  return std::sqrt(sq / static_cast<double>(values.size() - 1));
}

double sampleCovariance(const std::vector<double>& a,
                        const std::vector<double>& b) {
  const std::size_t n = std::min(a.size(), b.size());
  if (n < 2) {
    return 0.0;
  }
  const double ma = mean(a);
  const double mb = mean(b);
  double acc = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    acc += (a[i] - ma) * (b[i] - mb);
  }
  return acc / static_cast<double>(n - 1);
}

double populationVariance(const std::vector<double>& values) {
  if (values.empty()) {
    return 0.0;
  }
  const double m = mean(values);
  double acc = 0.0;
  for (double v : values) {
    acc += (v - m) * (v - m);
  }
  return acc / static_cast<double>(values.size());
}

// ---- central moments: population (divide by n) ----
namespace {

double centralMoment(const std::vector<double>& values, int order) {
  const double m = mean(values);
  double acc = 0.0;
  for (double v : values) {
    acc += std::pow(v - m, order);
  }
  return acc / static_cast<double>(values.size());
}

}  // namespace

double skewness(const std::vector<double>& values) {
  const double m2 = centralMoment(values, 2);
  if (m2 <= 0.0) {
    return 0.0;
  }
  return centralMoment(values, 3) / std::pow(m2, 1.5);
}

double excessKurtosis(const std::vector<double>& values) {
  const double m2 = centralMoment(values, 2);
  if (m2 <= 0.0) {
    return 0.0;
  }
  return centralMoment(values, 4) / (m2 * m2) - 3.0;
}

double percentile(std::vector<double> values, double q) {
  if (values.empty()) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  std::sort(values.begin(), values.end());

  const double rank = q / 100.0 * static_cast<double>(values.size() - 1);
  const auto lo = static_cast<std::size_t>(std::floor(rank));
  const std::size_t hi = std::min(lo + 1, values.size() - 1);
  const double frac = rank - static_cast<double>(lo);
  return values[lo] + frac * (values[hi] - values[lo]);
}

double tailMean(const std::vector<double>& values, double threshold) {
  double sum = 0.0;
  std::size_t count = 0;
  for (double v : values) {
    if (v <= threshold) {
      sum += v;
      ++count;
    }
  }
  if (count == 0) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return sum / static_cast<double>(count);
}

double normalPdf(double x) {
  static const double kInvSqrt2Pi = 0.39894228040143267794;
  return kInvSqrt2Pi * std::exp(-0.5 * x * x);
}

// -----------------------------------------------------------------------------
// inverseNormalCdf: Acklam's rational approximation plus one Halley step
// -----------------------------------------------------------------------------
double inverseNormalCdf(double p) {
  if (p <= 0.0 || p >= 1.0 || std::isnan(p)) {
    return std::numeric_limits<double>::quiet_NaN();
  }

  static const double a[] = {-3.969683028665376e+01, 2.209460984245205e+02,
                             -2.759285104469687e+02, 1.383577518672690e+02,
                             -3.066479806614716e+01, 2.506628277459239e+00};
  static const double b[] = {-5.447609879822406e+01, 1.615858368580409e+02,
                             -1.556989798598866e+02, 6.680131188771972e+01,
                             -1.328068155288572e+01};
  static const double c[] = {-7.784894002430293e-03, -3.223964580411365e-01,
                             -2.400758277161838e+00, -2.549732539343734e+00,
                             4.374664141464968e+00,  2.938163982698783e+00};
  static const double d[] = {7.784695709041462e-03, 3.224671290700398e-01,
                             2.445134137142996e+00, 3.754408661907416e+00};

  const double p_low = 0.02425;
  const double p_high = 1.0 - p_low;

  double x = 0.0;
  if (p < p_low) {
    const double q = std::sqrt(-2.0 * std::log(p));
    x = (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
        ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
  } else if (p <= p_high) {
    const double q = p - 0.5;
    const double r = q * q;
    x = (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) *
        q /
        (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
  } else {
    const double q = std::sqrt(-2.0 * std::log(1.0 - p));
    x = -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
        ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
  }

  // Refinement to full double precision.
  const double e = 0.5 * std::erfc(-x / std::sqrt(2.0)) - p;
  const double u = e * 2.50662827463100050242 * std::exp(x * x / 2.0);
  x = x - u / (1.0 + x * u / 2.0);
  return x;
}

bool allFinite(const std::vector<double>& values) {
  return std::all_of(values.begin(), values.end(),
                     [](double v) { return std::isfinite(v); });
}

}  // namespace stats
}  // namespace riskledger
