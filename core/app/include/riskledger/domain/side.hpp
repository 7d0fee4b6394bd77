#pragma once

#include <optional>
#include <string>

namespace riskledger {
namespace domain {

enum class Side {
  Buy,
  Sell,
};

inline const char* sideToString(Side side) {
  switch (side) {
    case Side::Buy:  return "buy";
    case Side::Sell: return "sell";
  }
  return "unknown";
}

// Accepts "buy"/"sell" in any letter case.
inline std::optional<Side> parseSide(const std::string& text) {
  std::string lower;
  lower.reserve(text.size());
  for (char c : text) {
    lower.push_back(static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a'
                                                             : c));
  }
  if (lower == "buy") {
    return Side::Buy;
  }
  if (lower == "sell") {
    return Side::Sell;
  }
  return std::nullopt;
}

}  // namespace domain
}  // namespace riskledger
