#pragma once

#include <string>
#include <utility>
#include <variant>

namespace riskledger {

enum class ComputationErrorCode {
  InsufficientSample,   // Fewer observations than the configured minimum
  DimensionMismatch,    // Series / matrix / weight sizes disagree
  NonPositiveDefinite,  // Covariance not symmetric positive semi-definite
  DegenerateVariance,   // Zero stdev, benchmark variance or portfolio variance
  InvalidInput,         // Non-finite value, bad confidence or horizon
};

inline const char* computationErrorCodeToString(ComputationErrorCode code) {
  switch (code) {
    case ComputationErrorCode::InsufficientSample:  return "insufficient_sample";
    case ComputationErrorCode::DimensionMismatch:   return "dimension_mismatch";
    case ComputationErrorCode::NonPositiveDefinite: return "non_positive_definite";
    case ComputationErrorCode::DegenerateVariance:  return "degenerate_variance";
    case ComputationErrorCode::InvalidInput:        return "invalid_input";
  }
  return "unknown";
}

struct ComputationError {
  ComputationErrorCode code{ComputationErrorCode::InvalidInput};
  std::string message;
};

// -----------------------------------------------------------------------------
// CalcResult<T> — value or typed computation failure
// -----------------------------------------------------------------------------
//
// @brief  Return type of every PortfolioRiskCalculator operation.
//
// @details
// A failed computation is never reported as 0.0: callers must check ok()
// before touching value(). value() on a failure (and error() on a success)
// throws std::bad_variant_access.
//
// Both constructors are implicit so implementations can simply
// `return 0.25;` or `return ComputationError{...};`.
// -----------------------------------------------------------------------------
template <typename T>
class CalcResult {
 public:
  CalcResult(T value) : data_(std::move(value)) {}
  CalcResult(ComputationError error) : data_(std::move(error)) {}

  bool ok() const { return std::holds_alternative<T>(data_); }
  explicit operator bool() const { return ok(); }

  const T& value() const { return std::get<T>(data_); }
  T& value() { return std::get<T>(data_); }

  const ComputationError& error() const {
    return std::get<ComputationError>(data_);
  }

 private:
  std::variant<T, ComputationError> data_;
};

}  // namespace riskledger
