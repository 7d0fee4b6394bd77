#pragma once

#include "riskledger/domain/money.hpp"

#include <cstdint>
#include <string>

namespace riskledger {

// -----------------------------------------------------------------------------
// MarketDataEvent — one decoded market data tick
// -----------------------------------------------------------------------------
//
// Produced by MarketDataGateway from the JSON payload
//   {"timestamp_ms": 1700000000000, "symbol": "0700.HK",
//    "price": 312.4, "volume": 1200}
// and handed to its tick sink (main() feeds it into the PriceCache).
// -----------------------------------------------------------------------------
struct MarketDataEvent {
  std::string symbol;
  domain::Money price;
  double volume{0.0};
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_id{0};  // Gateway-local receive counter
};

// Published whenever the emergency stop changes state.
struct EmergencyStopEvent {
  bool active{false};
  std::string reason;
  std::int64_t timestamp_ms{0};
};

}  // namespace riskledger
