#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace riskledger {
namespace domain {

// -----------------------------------------------------------------------------
// Rounding — explicit rounding rule for every lossy Money operation
// -----------------------------------------------------------------------------
//
// HalfUp rounds half away from zero (1.00005 -> 1.0001, -1.00005 -> -1.0001).
// Down truncates toward zero. Up rounds away from zero whenever a remainder
// exists.
// -----------------------------------------------------------------------------
enum class Rounding {
  HalfUp,
  Down,
  Up,
};

// -----------------------------------------------------------------------------
// Money — fixed-point decimal amount
// -----------------------------------------------------------------------------
//
// @brief  Signed 64-bit count of 1/10000 currency units. Used for cash,
//         prices, trade values, commissions and cost basis.
//
// @details
// Addition, subtraction and multiplication by an integer quantity are exact.
// Every operation that can produce a fraction of the smallest unit (division,
// rate application) takes a Rounding argument, so no precision is lost
// without the caller choosing how.
//
// Overflow is a caller bug (amounts beyond ~9.2e14 currency units); it is
// reported with std::overflow_error rather than wrapping.
//
// Construction from double exists only for configuration and wire ingestion
// (JSON numbers). It rounds to the nearest 1/10000, half away from zero.
// toDouble() exists for ratios and reporting, never for ledger arithmetic.
//
// Thread-safety: value type, no shared state.
// -----------------------------------------------------------------------------
class Money {
 public:
  static constexpr std::int64_t kScale = 10'000;
  static constexpr int kDecimals = 4;

  // Scale used to quantize a rate (commission rate etc.) before applying it.
  static constexpr std::int64_t kRateScale = 100'000'000;

  constexpr Money() = default;

  static constexpr Money fromRaw(std::int64_t raw) { return Money(raw); }

  // Whole currency units, e.g. fromUnits(300) == 300.0000.
  static Money fromUnits(std::int64_t units);

  // Nearest representable amount (half away from zero). Throws
  // std::overflow_error for non-finite or out-of-range values.
  static Money fromDouble(double value);

  // Parses "123", "-0.5", "1000000.2500". At most kDecimals fractional
  // digits are accepted; anything else yields std::nullopt.
  static std::optional<Money> parse(const std::string& text);

  constexpr std::int64_t raw() const { return raw_; }

  double toDouble() const;

  // Fixed kDecimals rendering: "1234.5000", "-0.0100".
  std::string toString() const;

  constexpr bool isZero() const { return raw_ == 0; }
  constexpr bool isPositive() const { return raw_ > 0; }
  constexpr bool isNegative() const { return raw_ < 0; }

  Money abs() const;

  Money operator+(Money other) const;
  Money operator-(Money other) const;
  Money operator-() const;
  Money& operator+=(Money other);
  Money& operator-=(Money other);

  // Price x quantity. Exact; throws std::overflow_error on overflow.
  Money operator*(std::int64_t quantity) const;

  // this * numerator / denominator with an explicit rounding rule. The
  // intermediate product is split so it cannot overflow for any realistic
  // numerator (<= kRateScale).
  Money mulDiv(std::int64_t numerator, std::int64_t denominator,
               Rounding rounding) const;

  // this / divisor with an explicit rounding rule. Throws
  // std::invalid_argument on a zero divisor.
  Money divide(std::int64_t divisor, Rounding rounding) const;

  // Multiplies by a dimensionless rate. The rate is first quantized to
  // 1/kRateScale, then applied with mulDiv.
  Money applyRate(double rate, Rounding rounding = Rounding::HalfUp) const;

  // Dimensionless numerator / denominator. Returns 0.0 when denominator is
  // zero; callers guard the zero case when it matters.
  static double ratio(Money numerator, Money denominator);

  static Money max(Money a, Money b) { return (a.raw_ >= b.raw_) ? a : b; }
  static Money min(Money a, Money b) { return (a.raw_ <= b.raw_) ? a : b; }

  friend constexpr bool operator==(Money a, Money b) { return a.raw_ == b.raw_; }
  friend constexpr bool operator!=(Money a, Money b) { return a.raw_ != b.raw_; }
  friend constexpr bool operator<(Money a, Money b) { return a.raw_ < b.raw_; }
  friend constexpr bool operator<=(Money a, Money b) { return a.raw_ <= b.raw_; }
  friend constexpr bool operator>(Money a, Money b) { return a.raw_ > b.raw_; }
  friend constexpr bool operator>=(Money a, Money b) { return a.raw_ >= b.raw_; }

 private:
  constexpr explicit Money(std::int64_t raw) : raw_(raw) {}

  std::int64_t raw_{0};
};

// Integer division with an explicit rounding rule. denominator must be > 0.
std::int64_t roundedDivide(std::int64_t numerator, std::int64_t denominator,
                           Rounding rounding);

}  // namespace domain
}  // namespace riskledger
