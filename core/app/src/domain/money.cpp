#include "riskledger/domain/money.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace riskledger {
namespace domain {

namespace {

constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();

std::int64_t checkedAdd(std::int64_t a, std::int64_t b) {
  if ((b > 0 && a > kMax - b) || (b < 0 && a < kMin - b)) {
    throw std::overflow_error("Money addition overflow");
  }
  return a + b;
}

std::int64_t checkedMul(std::int64_t a, std::int64_t b) {
  if (a == 0 || b == 0) {
    return 0;
  }
  if (a > 0) {
    if (b > 0 ? a > kMax / b : b < kMin / a) {
      throw std::overflow_error("Money multiplication overflow");
    }
  } else {
    if (b > 0 ? a < kMin / b : b < kMax / a) {
      throw std::overflow_error("Money multiplication overflow");
    }
  }
  return a * b;
}

}  // namespace

// -----------------------------------------------------------------------------
// roundedDivide: truncating division plus an explicit correction step
// -----------------------------------------------------------------------------
std::int64_t roundedDivide(std::int64_t numerator, std::int64_t denominator,
                           Rounding rounding) {
  if (denominator <= 0) {
    throw std::invalid_argument("roundedDivide: denominator must be positive");
  }

  std::int64_t quotient = numerator / denominator;
  std::int64_t remainder = numerator % denominator;
  if (remainder == 0) {
    return quotient;
  }

  // remainder carries the sign of the numerator (C++ truncation).
  std::int64_t direction = (remainder > 0) ? 1 : -1;
  std::int64_t abs_remainder = (remainder > 0) ? remainder : -remainder;

  switch (rounding) {
    case Rounding::Down:
      return quotient;
    case Rounding::Up:
      return quotient + direction;
    case Rounding::HalfUp:
      // abs_remainder < denominator, so 2 * abs_remainder cannot overflow
      // for any denominator below 2^62.
      return (abs_remainder * 2 >= denominator) ? quotient + direction
                                                : quotient;
  }
  return quotient;
}

// -----------------------------------------------------------------------------
// Construction
// -----------------------------------------------------------------------------
Money Money::fromUnits(std::int64_t units) {
  return Money(checkedMul(units, kScale));
}

Money Money::fromDouble(double value) {
  if (!std::isfinite(value)) {
    throw std::overflow_error("Money::fromDouble: non-finite value");
  }
  double scaled = value * static_cast<double>(kScale);
  if (scaled >= 9.2e18 || scaled <= -9.2e18) {
    throw std::overflow_error("Money::fromDouble: value out of range");
  }
  return Money(static_cast<std::int64_t>(std::llround(scaled)));
}

std::optional<Money> Money::parse(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }

  std::size_t pos = 0;
  bool negative = false;
  if (text[pos] == '-' || text[pos] == '+') {
    negative = (text[pos] == '-');
    ++pos;
  }

  std::int64_t units = 0;
  std::size_t int_digits = 0;
  while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
    if (units > (kMax / kScale - 9) / 10) {
      return std::nullopt;
    }
    units = units * 10 + (text[pos] - '0');
    ++pos;
    ++int_digits;
  }

  std::int64_t fraction = 0;
  std::size_t frac_digits = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if (frac_digits == static_cast<std::size_t>(kDecimals)) {
        return std::nullopt;
      }
      fraction = fraction * 10 + (text[pos] - '0');
      ++pos;
      ++frac_digits;
    }
  }

  if (pos != text.size() || (int_digits == 0 && frac_digits == 0)) {
    return std::nullopt;
  }

  for (std::size_t i = frac_digits; i < static_cast<std::size_t>(kDecimals);
       ++i) {
    fraction *= 10;
  }

  std::int64_t raw = units * kScale + fraction;
  return Money(negative ? -raw : raw);
}

// -----------------------------------------------------------------------------
// Rendering
// -----------------------------------------------------------------------------
double Money::toDouble() const {
  return static_cast<double>(raw_) / static_cast<double>(kScale);
}

std::string Money::toString() const {
  // Work in unsigned space so kMin renders correctly.
  bool negative = raw_ < 0;
  std::uint64_t magnitude = negative
                                ? static_cast<std::uint64_t>(-(raw_ + 1)) + 1
                                : static_cast<std::uint64_t>(raw_);
  std::uint64_t units = magnitude / static_cast<std::uint64_t>(kScale);
  std::uint64_t fraction = magnitude % static_cast<std::uint64_t>(kScale);

  std::string frac = std::to_string(fraction);
  frac.insert(0, static_cast<std::size_t>(kDecimals) - frac.size(), '0');

  std::string out = negative ? "-" : "";
  out += std::to_string(units);
  out += '.';
  out += frac;
  return out;
}

// -----------------------------------------------------------------------------
// Arithmetic
// -----------------------------------------------------------------------------
Money Money::abs() const {
  if (raw_ == kMin) {
    throw std::overflow_error("Money::abs overflow");
  }
  return Money(raw_ < 0 ? -raw_ : raw_);
}

Money Money::operator+(Money other) const {
  return Money(checkedAdd(raw_, other.raw_));
}

Money Money::operator-(Money other) const {
  if (other.raw_ == kMin) {
    throw std::overflow_error("Money subtraction overflow");
  }
  return Money(checkedAdd(raw_, -other.raw_));
}

Money Money::operator-() const {
  if (raw_ == kMin) {
    throw std::overflow_error("Money negation overflow");
  }
  return Money(-raw_);
}

Money& Money::operator+=(Money other) {
  *this = *this + other;
  return *this;
}

Money& Money::operator-=(Money other) {
  *this = *this - other;
  return *this;
}

Money Money::operator*(std::int64_t quantity) const {
  return Money(checkedMul(raw_, quantity));
}

Money Money::mulDiv(std::int64_t numerator, std::int64_t denominator,
                    Rounding rounding) const {
  if (denominator <= 0) {
    throw std::invalid_argument("Money::mulDiv: denominator must be positive");
  }

  // raw * n / d == (q * d + r) * n / d == q * n + (r * n) / d
  // Only the second term can be fractional, so rounding applies there.
  std::int64_t q = raw_ / denominator;
  std::int64_t r = raw_ % denominator;

  std::int64_t whole = checkedMul(q, numerator);
  std::int64_t part = roundedDivide(checkedMul(r, numerator), denominator,
                                    rounding);
  return Money(checkedAdd(whole, part));
}

Money Money::divide(std::int64_t divisor, Rounding rounding) const {
  if (divisor == 0) {
    throw std::invalid_argument("Money::divide: division by zero");
  }
  if (divisor < 0) {
    return (-*this).divide(-divisor, rounding);
  }
  return Money(roundedDivide(raw_, divisor, rounding));
}

Money Money::applyRate(double rate, Rounding rounding) const {
  if (!std::isfinite(rate)) {
    throw std::invalid_argument("Money::applyRate: non-finite rate");
  }
  std::int64_t scaled_rate = static_cast<std::int64_t>(
      std::llround(rate * static_cast<double>(kRateScale)));
  return mulDiv(scaled_rate, kRateScale, rounding);
}

double Money::ratio(Money numerator, Money denominator) {
  if (denominator.raw_ == 0) {
    return 0.0;
  }
  return static_cast<double>(numerator.raw_) /
         static_cast<double>(denominator.raw_);
}

}  // namespace domain
}  // namespace riskledger
